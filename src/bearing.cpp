#include "bearing.hpp"
#include <cmath>

double deg2Rad(double deg) {
    return deg * EIGEN_PI / 180.0;
}

double rad2Deg(double rad) {
    return rad * 180.0 / EIGEN_PI;
}

double bearingFromDxDy(double dx, double dy) {
    // atan2(0, 0) == 0, 零位移返回 0
    return std::fmod(rad2Deg(std::atan2(dx, dy)) + 360.0, 360.0);
}

Eigen::Vector2d unitFromBearing(double bearing_deg) {
    double rad = deg2Rad(bearing_deg);
    return Eigen::Vector2d(std::sin(rad), std::cos(rad));
}
