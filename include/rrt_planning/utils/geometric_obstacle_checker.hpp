// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/utils/obstacle_checker.hpp"
#include "rrt_planning/utils/errors.hpp"

struct Obstacle {
    enum Type { BALL, BOX };
    Type type = BALL;

    // BALL: center and radius
    Eigen::VectorXd position;
    double radius = 0.0;

    // BOX: closed axis aligned box [lower, upper]
    Eigen::VectorXd lower;
    Eigen::VectorXd upper;

    double inflation = 0.0;
};

/*
    Analytic checker over an axis aligned workspace box with ball and box obstacles, in any dimension.
    Obstacles are closed sets, so touching a wall counts as a collision. Segments are tested exactly (slab test for
    boxes, closest point for balls), there is no discretisation resolution to tune.
*/
class GeometricObstacleChecker : public ObstacleChecker {
public:
    GeometricObstacleChecker(const Eigen::VectorXd& lower_bounds, const Eigen::VectorXd& upper_bounds);

    void addBall(const Eigen::VectorXd& center, double radius, double inflation = 0.0);
    void addBox(const Eigen::VectorXd& lower, const Eigen::VectorXd& upper, double inflation = 0.0);
    void clearObstacles();

    bool isObstacleFree(const Eigen::VectorXd& start, const Eigen::VectorXd& end) const override;
    bool isObstacleFree(const Eigen::VectorXd& point) const override;
    using ObstacleChecker::isObstacleFree;

    const std::vector<Obstacle>& getObstacles() const { return obstacles_; }
    int getDimension() const { return static_cast<int>(lower_bounds_.size()); }

private:
    bool isWithinBounds(const Eigen::VectorXd& point) const;
    static bool pointInObstacle(const Obstacle& obstacle, const Eigen::VectorXd& point);
    static bool segmentHitsObstacle(const Obstacle& obstacle, const Eigen::VectorXd& start, const Eigen::VectorXd& end);

    Eigen::VectorXd lower_bounds_;
    Eigen::VectorXd upper_bounds_;
    std::vector<Obstacle> obstacles_;
};
