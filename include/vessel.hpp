#pragma once
#include <Eigen/Dense>

#include "bearing.hpp"
#include "cpa.hpp"
#include "collision_course.hpp"

// 平面上以恒定速度、航向运动的船舶 (质点模型)
//
// 航向为度, 0° 指向 +y, 顺时针增加. 速度可以为负, 表示沿航向反向运动.
// velocity 只在构造时由 speed / heading 计算一次, 没有修改接口,
// 因此不存在重新计算的路径.
class Vessel {
public:
    Vessel(double length, double x, double y, double speed, double heading);

    double length() const { return length_; }
    const Eigen::Vector2d& position() const { return position_; }
    double speed() const { return speed_; }
    double heading() const { return heading_; }   // 保存原始值, 不归一化
    const Eigen::Vector2d& velocity() const { return velocity_; }

    // t 时刻的预测位置 (t 可为负)
    Eigen::Vector2d positionAt(double t) const { return position_ + velocity_ * t; }

    CpaResult cpa(const Vessel& target, CpaConfig config = CpaConfig()) const {
        return computeCpa(*this, target, config);
    }

    CollisionCourseResult coursesToCollide(
        const Vessel& target,
        CollisionCourseConfig config = CollisionCourseConfig()
    ) const {
        return CollisionCourseSolver().solve(*this, target, config);
    }

    static double bearingFromDxDy(double dx, double dy) { return ::bearingFromDxDy(dx, dy); }

private:
    double length_;
    Eigen::Vector2d position_;
    double speed_;
    double heading_;
    Eigen::Vector2d velocity_;
};
