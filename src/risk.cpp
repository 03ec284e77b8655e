#include <iostream>
#include <algorithm>

#include "risk.hpp"
#include "vessel.hpp"

const char* toString(RiskLevel level) {
    switch (level) {
        case RiskLevel::None: return "NONE";
        case RiskLevel::Warning: return "WARN";
        case RiskLevel::Critical: return "CRIT";
    }
    return "Unknown";
}

const char* toString(RiskStatus status) {
    switch (status) {
        case RiskStatus::Ok: return "Ok";
        case RiskStatus::InvalidHorizon: return "InvalidHorizon";
    }
    return "Unknown";
}

CollisionRisk assessCollisionRisk(const Vessel& ownship, const Vessel& target, RiskConfig config) {
    CollisionRisk risk;

    if (!(config.horizon >= 0.0)) {
        std::cerr << "[Risk] Invalid horizon: " << config.horizon << std::endl;
        risk.status = RiskStatus::InvalidHorizon;
        return risk;
    }

    risk.cpa = computeCpa(ownship, target, config.cpa);

    // 会遇点已过去或超出时域时, 在区间端点处评估
    double t = std::clamp(risk.cpa.tcpa, 0.0, config.horizon);
    risk.time = t;
    risk.range = (target.positionAt(t) - ownship.positionAt(t)).norm();

    if (t <= config.crit_time && risk.range <= config.crit_range) {
        risk.level = RiskLevel::Critical;
    }
    else if (t <= config.warn_time && risk.range <= config.warn_range) {
        risk.level = RiskLevel::Warning;
    }

    if (risk.level != RiskLevel::None) {
        std::cout << "[Risk] " << toString(risk.level)
                  << ": t = " << risk.time << ", range = " << risk.range << std::endl;
    }
    return risk;
}
