#include <gtest/gtest.h>
#include <cmath>

#include "vessel.hpp"
#include "risk.hpp"

TEST(RiskTest, CloseCrossingIsCritical) {
    Vessel ownship(10.0, 0.0, 0.0, 10.0, 0.0);
    Vessel target(10.0, 10.0, 100.0, 10.0, 180.0);

    CollisionRisk risk = assessCollisionRisk(ownship, target);

    EXPECT_EQ(risk.level, RiskLevel::Critical);
    EXPECT_NEAR(risk.time, 5.0, 1e-9);
    EXPECT_NEAR(risk.range, 10.0, 1e-9);
    EXPECT_EQ(risk.cpa.status, CpaStatus::Ok);
}

TEST(RiskTest, LaterCpaIsWarning) {
    Vessel ownship(10.0, 0.0, 0.0, 10.0, 0.0);
    Vessel target(10.0, 80.0, 300.0, 10.0, 180.0);

    CollisionRisk risk = assessCollisionRisk(ownship, target);

    EXPECT_EQ(risk.level, RiskLevel::Warning);
    EXPECT_NEAR(risk.time, 15.0, 1e-9);
    EXPECT_NEAR(risk.range, 80.0, 1e-9);
}

TEST(RiskTest, CpaBeyondHorizonIsClamped) {
    Vessel ownship(10.0, 0.0, 0.0, 10.0, 0.0);
    Vessel target(10.0, 10.0, 1000.0, 10.0, 180.0);

    CollisionRisk risk = assessCollisionRisk(ownship, target);

    EXPECT_NEAR(risk.cpa.tcpa, 50.0, 1e-9);
    EXPECT_NEAR(risk.time, 30.0, 1e-12);
    EXPECT_NEAR(risk.range, (Eigen::Vector2d(10.0, 700.0) - Eigen::Vector2d(0.0, 300.0)).norm(), 1e-9);
    EXPECT_EQ(risk.level, RiskLevel::None);
}

TEST(RiskTest, DivergingUsesCurrentRange) {
    Vessel ownship(10.0, 0.0, 0.0, 10.0, 180.0);
    Vessel target(10.0, 0.0, 200.0, 10.0, 0.0);

    CollisionRisk risk = assessCollisionRisk(ownship, target);

    EXPECT_LT(risk.cpa.tcpa, 0.0);
    EXPECT_DOUBLE_EQ(risk.time, 0.0);
    EXPECT_NEAR(risk.range, 200.0, 1e-9);
    EXPECT_EQ(risk.level, RiskLevel::None);
}

TEST(RiskTest, DegenerateCloseFollowerIsCritical) {
    Vessel ownship(10.0, 0.0, 0.0, 10.0, 0.0);
    Vessel follower(10.0, 0.0, -50.0, 10.0, 0.0);

    CollisionRisk risk = assessCollisionRisk(ownship, follower);

    EXPECT_TRUE(risk.cpa.degenerate());
    EXPECT_DOUBLE_EQ(risk.time, 0.0);
    EXPECT_NEAR(risk.range, 50.0, 1e-12);
    EXPECT_EQ(risk.level, RiskLevel::Critical);
}

TEST(RiskTest, CustomThresholds) {
    Vessel ownship(10.0, 0.0, 0.0, 10.0, 0.0);
    Vessel target(10.0, 10.0, 100.0, 10.0, 180.0);

    RiskConfig config;
    config.crit_range = 5.0;
    config.warn_range = 15.0;

    CollisionRisk risk = assessCollisionRisk(ownship, target, config);
    EXPECT_EQ(risk.level, RiskLevel::Warning);
}

TEST(RiskTest, NegativeHorizonIsRejected) {
    Vessel ownship(10.0, 0.0, 0.0, 10.0, 0.0);
    Vessel target(10.0, 10.0, 100.0, 10.0, 180.0);

    RiskConfig config;
    config.horizon = -1.0;

    CollisionRisk risk = assessCollisionRisk(ownship, target, config);

    EXPECT_EQ(risk.status, RiskStatus::InvalidHorizon);
    EXPECT_EQ(risk.level, RiskLevel::None);
    EXPECT_DOUBLE_EQ(risk.time, 0.0);
    EXPECT_DOUBLE_EQ(risk.range, 0.0);
}

TEST(RiskTest, ZeroHorizonEvaluatesNow) {
    Vessel ownship(10.0, 0.0, 0.0, 10.0, 0.0);
    Vessel target(10.0, 10.0, 100.0, 10.0, 180.0);

    RiskConfig config;
    config.horizon = 0.0;

    CollisionRisk risk = assessCollisionRisk(ownship, target, config);

    EXPECT_EQ(risk.status, RiskStatus::Ok);
    EXPECT_DOUBLE_EQ(risk.time, 0.0);
    EXPECT_NEAR(risk.range, std::hypot(10.0, 100.0), 1e-9);
    EXPECT_EQ(risk.level, RiskLevel::Warning);
}

// 相对速度 0.001, 放宽容差后应判为退化
TEST(RiskTest, CpaToleranceIsPassedThrough) {
    Vessel ownship(10.0, 0.0, 0.0, 10.0, 0.0);
    Vessel target(10.0, 0.0, 100.0, 10.001, 0.0);

    CollisionRisk strict = assessCollisionRisk(ownship, target);
    EXPECT_FALSE(strict.cpa.degenerate());

    RiskConfig config;
    config.cpa.relative_speed_tolerance = 1e-3;
    CollisionRisk loose = assessCollisionRisk(ownship, target, config);

    EXPECT_EQ(loose.status, RiskStatus::Ok);
    EXPECT_TRUE(loose.cpa.degenerate());
    EXPECT_DOUBLE_EQ(loose.cpa.tcpa, 0.0);
    EXPECT_NEAR(loose.range, 100.0, 1e-9);
}

TEST(RiskTest, StatusToString) {
    EXPECT_STREQ(toString(RiskStatus::Ok), "Ok");
    EXPECT_STREQ(toString(RiskStatus::InvalidHorizon), "InvalidHorizon");
}
