#pragma once
#include <vector>
#include <Eigen/Dense>

class Vessel;

enum class CollisionCourseStatus {
    Ok,
    CoincidentVessels,   // 两船位置重合, 方位无定义
    InvalidRange         // N <= 0, min_speed <= 0 或 min_speed > max_speed
};

const char* toString(CollisionCourseStatus status);

struct CollisionCourseConfig {
    int num_solutions = 10;      // 解的个数 N
    double min_speed = 2.0;      // 最小速度
    double max_speed = 25.0;     // 最大速度
    double coincident_tolerance = 1e-9;
};

// 单个碰撞航向解
struct CourseSolution {
    double speed;
    double heading;
    double a;                    // 采样参数, 相对位移在 1/a 时间内被抵消
    Eigen::Vector2d velocity;
    double time_to_intercept;    // = 1 / a
};

struct CollisionCourseResult {
    CollisionCourseStatus status = CollisionCourseStatus::Ok;
    std::vector<CourseSolution> solutions;

    bool ok() const { return status == CollisionCourseStatus::Ok; }
};

class CollisionCourseSolver {
public:
    CollisionCourseSolver() = default;

    // 求 target 的 N 组 (速度, 航向), 使其从当前位置出发与 ownship 相撞.
    // target 只使用其位置, 速度由本函数重新求解.
    CollisionCourseResult solve(
        const Vessel& ownship,
        const Vessel& target,
        CollisionCourseConfig config = CollisionCourseConfig()
    ) const;
};
