#pragma once
#include <Eigen/Dense>

class Vessel;

enum class CpaStatus {
    Ok,
    DegenerateRelativeVelocity   // 相对速度为零, tcpa 无定义
};

const char* toString(CpaStatus status);

struct CpaConfig {
    // 相对速度阈值, 相对于两船中较大的速度
    double relative_speed_tolerance = 1e-9;
};

// 最近会遇点 (Closest Point of Approach) 计算结果
//
// tcpa 为有符号时间, 负值表示会遇点已经过去.
// 相对速度退化时 status 为 DegenerateRelativeVelocity, tcpa = 0,
// 位置/距离/方位取当前时刻的值.
struct CpaResult {
    CpaStatus status = CpaStatus::Ok;

    double tcpa = 0.0;
    Eigen::Vector2d target_at_cpa = Eigen::Vector2d::Zero();
    Eigen::Vector2d ownship_at_cpa = Eigen::Vector2d::Zero();
    double range_at_cpa = 0.0;
    double bearing_at_cpa = 0.0;

    // 当前时刻 (t = 0) 本船到目标的距离与方位
    double current_range = 0.0;
    double current_bearing = 0.0;

    bool degenerate() const { return status == CpaStatus::DegenerateRelativeVelocity; }
};

// 主接口: 计算 ownship 与 target 的最近会遇点
CpaResult computeCpa(const Vessel& ownship, const Vessel& target, CpaConfig config = CpaConfig());
