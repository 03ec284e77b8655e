#include "vessel.hpp"

Vessel::Vessel(double length, double x, double y, double speed, double heading)
    : length_(length),
      position_(x, y),
      speed_(speed),
      heading_(heading),
      velocity_(unitFromBearing(heading) * speed)
{
}
