#pragma once
#include "cpa.hpp"

class Vessel;

enum class RiskLevel {
    None,
    Warning,
    Critical
};

const char* toString(RiskLevel level);

enum class RiskStatus {
    Ok,
    InvalidHorizon       // horizon < 0
};

const char* toString(RiskStatus status);

struct RiskConfig {
    double horizon = 30.0;     // 预测时域
    double warn_time = 20.0;
    double crit_time = 10.0;
    double warn_range = 120.0;
    double crit_range = 60.0;
    CpaConfig cpa;
};

struct CollisionRisk {
    RiskStatus status = RiskStatus::Ok;
    RiskLevel level = RiskLevel::None;
    double time = 0.0;     // 限制在 [0, horizon] 内的评估时刻
    double range = 0.0;    // 该时刻两船距离
    CpaResult cpa;
};

// 基于 CPA 的两船碰撞风险评估
CollisionRisk assessCollisionRisk(
    const Vessel& ownship,
    const Vessel& target,
    RiskConfig config = RiskConfig()
);
