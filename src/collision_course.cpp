#include <iostream>
#include <cmath>

#include "collision_course.hpp"
#include "vessel.hpp"

const char* toString(CollisionCourseStatus status) {
    switch (status) {
        case CollisionCourseStatus::Ok: return "Ok";
        case CollisionCourseStatus::CoincidentVessels: return "CoincidentVessels";
        case CollisionCourseStatus::InvalidRange: return "InvalidRange";
    }
    return "Unknown";
}

// ---------------------------------------------------------
// 核心求解逻辑
//
// 取 Vt = -D * a + V_o, 则相对速度 Vt - V_o = -D * a,
// 相对位置 D + (Vt - V_o) * t 在 t = 1/a 时为零.
// 在 a 的归一化时间下, 目标正好在一个时间单位后与本船相遇.
// ---------------------------------------------------------
CollisionCourseResult CollisionCourseSolver::solve(
    const Vessel& ownship,
    const Vessel& target,
    CollisionCourseConfig config
) const {
    CollisionCourseResult result;

    if (config.num_solutions <= 0 ||
        config.min_speed <= 0.0 ||
        config.min_speed > config.max_speed) {
        std::cerr << "[CollisionCourse] Invalid range: N = " << config.num_solutions
                  << ", speed = [" << config.min_speed << ", " << config.max_speed << "]" << std::endl;
        result.status = CollisionCourseStatus::InvalidRange;
        return result;
    }

    Eigen::Vector2d D = target.position() - ownship.position();
    double Dnorm = D.norm();

    if (Dnorm <= config.coincident_tolerance) {
        std::cerr << "[CollisionCourse] Vessels coincide, |D| = " << Dnorm << std::endl;
        result.status = CollisionCourseStatus::CoincidentVessels;
        return result;
    }

    // 速度范围换算为 a 的范围, 半开区间 [min_a, max_a)
    int N = config.num_solutions;
    double min_a = config.min_speed / Dnorm;
    double max_a = config.max_speed / Dnorm;
    double step = (max_a - min_a) / N;

    result.solutions.reserve(N);
    for (int i = 0; i < N; ++i) {
        double a = min_a + i * step;

        CourseSolution s;
        s.a = a;
        s.velocity = -D * a + ownship.velocity();
        s.speed = s.velocity.norm();
        s.heading = bearingFromDxDy(s.velocity);
        s.time_to_intercept = 1.0 / a;

        result.solutions.push_back(s);
    }

    return result;
}
