#include <iostream>
#include <algorithm>
#include <cmath>

#include "cpa.hpp"
#include "vessel.hpp"

const char* toString(CpaStatus status) {
    switch (status) {
        case CpaStatus::Ok: return "Ok";
        case CpaStatus::DegenerateRelativeVelocity: return "DegenerateRelativeVelocity";
    }
    return "Unknown";
}

// ---------------------------------------------------------
// 推导:
//   R(t)^2 = |D + Vr * t|^2 , D = P_t - P_o, Vr = V_t - V_o
//   d(R^2)/dt = 2 * Vr . (D + Vr * t) = 0
//   => tcpa = -(Vr . D) / (Vr . Vr)
// |Vr| > 0 时 R^2 为开口向上的二次函数, tcpa 为唯一极小点.
// ---------------------------------------------------------
CpaResult computeCpa(const Vessel& ownship, const Vessel& target, CpaConfig config) {
    CpaResult result;

    Eigen::Vector2d Vr = target.velocity() - ownship.velocity();
    Eigen::Vector2d D = target.position() - ownship.position();

    result.current_range = D.norm();
    result.current_bearing = bearingFromDxDy(D);

    double speed_scale = std::max(ownship.velocity().norm(), target.velocity().norm());
    if (Vr.norm() <= config.relative_speed_tolerance * speed_scale) {
        // 相对静止: tcpa 取 0, 使用当前位置
        std::cerr << "[Cpa] Degenerate relative velocity, |Vr| = " << Vr.norm()
                  << ", using current positions." << std::endl;
        result.status = CpaStatus::DegenerateRelativeVelocity;
        result.tcpa = 0.0;
        result.target_at_cpa = target.position();
        result.ownship_at_cpa = ownship.position();
        result.range_at_cpa = result.current_range;
        result.bearing_at_cpa = result.current_bearing;
        return result;
    }

    result.tcpa = -Vr.dot(D) / Vr.dot(Vr);
    result.target_at_cpa = target.positionAt(result.tcpa);
    result.ownship_at_cpa = ownship.positionAt(result.tcpa);

    Eigen::Vector2d cpa_vec = result.target_at_cpa - result.ownship_at_cpa;
    result.range_at_cpa = cpa_vec.norm();
    result.bearing_at_cpa = bearingFromDxDy(cpa_vec);

    return result;
}
