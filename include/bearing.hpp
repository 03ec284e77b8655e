#pragma once
#include <Eigen/Dense>

// -----------------------------------------------------------
// 角度 / 方位辅助函数
// 方位约定: 0° 指向 +y (北), 顺时针增加, 90° 指向 +x (东)
// -----------------------------------------------------------

double deg2Rad(double deg);
double rad2Deg(double rad);

// 由位移 (dx, dy) 计算方位, 范围 [0, 360)
// 注意参数顺序为 atan2(dx, dy)
double bearingFromDxDy(double dx, double dy);

inline double bearingFromDxDy(const Eigen::Vector2d& d) {
    return bearingFromDxDy(d.x(), d.y());
}

// 方位 -> 单位方向向量 (sin, cos)
Eigen::Vector2d unitFromBearing(double bearing_deg);
