// Copyright 2025 Soheil E.nia

#include <gtest/gtest.h>

#include "rrt_planning/utils/geometric_obstacle_checker.hpp"

class GeometricObstacleCheckerTest : public ::testing::Test {
 protected:
    GeometricObstacleCheckerTest() : checker_(Eigen::Vector2d(0, 0), Eigen::Vector2d(100, 100)) {
        checker_.addBox(Eigen::Vector2d(40, 0), Eigen::Vector2d(60, 80));  // wall from the bottom
        checker_.addBall(Eigen::Vector2d(20, 70), 5.0);
    }

    GeometricObstacleChecker checker_;
};

TEST_F(GeometricObstacleCheckerTest, PointQueries) {
    EXPECT_TRUE(checker_.isObstacleFree(Eigen::Vector2d(10, 10)));
    EXPECT_FALSE(checker_.isObstacleFree(Eigen::Vector2d(50, 50)));   // inside the wall
    EXPECT_FALSE(checker_.isObstacleFree(Eigen::Vector2d(40, 50)));   // on the wall face
    EXPECT_FALSE(checker_.isObstacleFree(Eigen::Vector2d(22, 71)));   // inside the ball
    EXPECT_FALSE(checker_.isObstacleFree(Eigen::Vector2d(-1, 10)));   // out of bounds
    EXPECT_TRUE(checker_.isObstacleFree(Eigen::Vector2d(100, 100)));  // bounds are closed
}

TEST_F(GeometricObstacleCheckerTest, SegmentQueries) {
    EXPECT_TRUE(checker_.isObstacleFree(Eigen::Vector2d(10, 10), Eigen::Vector2d(30, 10)));
    // Both ends free but the segment crosses the wall
    EXPECT_FALSE(checker_.isObstacleFree(Eigen::Vector2d(30, 10), Eigen::Vector2d(70, 10)));
    // Passes above the wall
    EXPECT_TRUE(checker_.isObstacleFree(Eigen::Vector2d(30, 90), Eigen::Vector2d(70, 90)));
    // Grazes the ball
    EXPECT_FALSE(checker_.isObstacleFree(Eigen::Vector2d(10, 75), Eigen::Vector2d(30, 75)));
    EXPECT_TRUE(checker_.isObstacleFree(Eigen::Vector2d(10, 76), Eigen::Vector2d(30, 76)));
    // Leaves the workspace
    EXPECT_FALSE(checker_.isObstacleFree(Eigen::Vector2d(10, 10), Eigen::Vector2d(-5, 10)));
}

TEST_F(GeometricObstacleCheckerTest, PathQueries) {
    std::vector<Eigen::VectorXd> around{Eigen::Vector2d(30, 10), Eigen::Vector2d(30, 90), Eigen::Vector2d(70, 90),
                                        Eigen::Vector2d(70, 10)};
    EXPECT_TRUE(checker_.isObstacleFree(around));

    std::vector<Eigen::VectorXd> through{Eigen::Vector2d(30, 10), Eigen::Vector2d(70, 10)};
    EXPECT_FALSE(checker_.isObstacleFree(through));
}

TEST(GeometricObstacleChecker, InflationGrowsObstacles) {
    GeometricObstacleChecker checker(Eigen::Vector2d(0, 0), Eigen::Vector2d(10, 10));
    checker.addBox(Eigen::Vector2d(4, 4), Eigen::Vector2d(6, 6), 0.5);
    EXPECT_FALSE(checker.isObstacleFree(Eigen::Vector2d(3.6, 5)));
    EXPECT_TRUE(checker.isObstacleFree(Eigen::Vector2d(3.4, 5)));
}

TEST(GeometricObstacleChecker, WorksInThreeDimensions) {
    GeometricObstacleChecker checker(Eigen::Vector3d(0, 0, 0), Eigen::Vector3d(10, 10, 10));
    checker.addBall(Eigen::Vector3d(5, 5, 5), 1.0);
    EXPECT_FALSE(checker.isObstacleFree(Eigen::Vector3d(0, 0, 0), Eigen::Vector3d(10, 10, 10)));
    EXPECT_TRUE(checker.isObstacleFree(Eigen::Vector3d(0, 0, 9), Eigen::Vector3d(10, 10, 9)));
}

TEST(GeometricObstacleChecker, RejectsMalformedObstacles) {
    GeometricObstacleChecker checker(Eigen::Vector2d(0, 0), Eigen::Vector2d(10, 10));
    EXPECT_THROW(checker.addBall(Eigen::Vector3d(1, 1, 1), 1.0), ConfigurationError);
    EXPECT_THROW(checker.addBall(Eigen::Vector2d(1, 1), -1.0), ConfigurationError);
    EXPECT_THROW(checker.addBox(Eigen::Vector2d(5, 5), Eigen::Vector2d(4, 6)), ConfigurationError);
    EXPECT_THROW(GeometricObstacleChecker(Eigen::Vector2d(1, 1), Eigen::Vector2d(0, 0)), ConfigurationError);
}
