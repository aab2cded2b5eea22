// Copyright 2025 Soheil E.nia

#include "rrt_planning/utils/geometric_obstacle_checker.hpp"

GeometricObstacleChecker::GeometricObstacleChecker(const Eigen::VectorXd& lower_bounds,
                                                   const Eigen::VectorXd& upper_bounds)
    : lower_bounds_(lower_bounds), upper_bounds_(upper_bounds) {
    if (lower_bounds_.size() == 0 || lower_bounds_.size() != upper_bounds_.size()) {
        throw ConfigurationError("Workspace bounds must be non empty and of equal dimension");
    }
    if ((lower_bounds_.array() > upper_bounds_.array()).any()) {
        throw ConfigurationError("Workspace lower bound exceeds upper bound");
    }
}

void GeometricObstacleChecker::addBall(const Eigen::VectorXd& center, double radius, double inflation) {
    if (center.size() != lower_bounds_.size()) {
        throw ConfigurationError("Ball obstacle has the wrong dimension");
    }
    if (radius < 0.0 || inflation < 0.0) {
        throw ConfigurationError("Ball obstacle radius and inflation must be non negative");
    }
    Obstacle obstacle;
    obstacle.type = Obstacle::BALL;
    obstacle.position = center;
    obstacle.radius = radius;
    obstacle.inflation = inflation;
    obstacles_.push_back(obstacle);
}

void GeometricObstacleChecker::addBox(const Eigen::VectorXd& lower, const Eigen::VectorXd& upper, double inflation) {
    if (lower.size() != lower_bounds_.size() || upper.size() != lower_bounds_.size()) {
        throw ConfigurationError("Box obstacle has the wrong dimension");
    }
    if ((lower.array() > upper.array()).any() || inflation < 0.0) {
        throw ConfigurationError("Box obstacle needs lower <= upper and a non negative inflation");
    }
    Obstacle obstacle;
    obstacle.type = Obstacle::BOX;
    obstacle.lower = lower;
    obstacle.upper = upper;
    obstacle.inflation = inflation;
    obstacles_.push_back(obstacle);
}

void GeometricObstacleChecker::clearObstacles() {
    obstacles_.clear();
}

bool GeometricObstacleChecker::isWithinBounds(const Eigen::VectorXd& point) const {
    return point.size() == lower_bounds_.size() &&
           (point.array() >= lower_bounds_.array()).all() &&
           (point.array() <= upper_bounds_.array()).all();
}

bool GeometricObstacleChecker::pointInObstacle(const Obstacle& obstacle, const Eigen::VectorXd& point) {
    if (obstacle.type == Obstacle::BALL) {
        return (point - obstacle.position).norm() <= obstacle.radius + obstacle.inflation;
    }
    return ((point.array() >= obstacle.lower.array() - obstacle.inflation).all() &&
            (point.array() <= obstacle.upper.array() + obstacle.inflation).all());
}

bool GeometricObstacleChecker::segmentHitsObstacle(const Obstacle& obstacle, const Eigen::VectorXd& start,
                                                   const Eigen::VectorXd& end) {
    Eigen::VectorXd dir = end - start;

    if (obstacle.type == Obstacle::BALL) {
        // Closest point of the segment to the center
        double len_sq = dir.squaredNorm();
        double t = 0.0;
        if (len_sq > 0.0) {
            t = std::clamp((obstacle.position - start).dot(dir) / len_sq, 0.0, 1.0);
        }
        Eigen::VectorXd closest = start + t * dir;
        return (closest - obstacle.position).norm() <= obstacle.radius + obstacle.inflation;
    }

    // Slab test: intersect the parameter interval [0,1] with every axis slab
    double t_min = 0.0;
    double t_max = 1.0;
    for (Eigen::Index i = 0; i < dir.size(); ++i) {
        double lo = obstacle.lower[i] - obstacle.inflation;
        double hi = obstacle.upper[i] + obstacle.inflation;
        if (std::abs(dir[i]) < 1e-15) {
            if (start[i] < lo || start[i] > hi) {
                return false;  // parallel to this slab and outside it
            }
            continue;
        }
        double t1 = (lo - start[i]) / dir[i];
        double t2 = (hi - start[i]) / dir[i];
        if (t1 > t2) {
            std::swap(t1, t2);
        }
        t_min = std::max(t_min, t1);
        t_max = std::min(t_max, t2);
        if (t_min > t_max) {
            return false;
        }
    }
    return true;
}

bool GeometricObstacleChecker::isObstacleFree(const Eigen::VectorXd& point) const {
    if (!isWithinBounds(point)) {
        return false;
    }
    for (const auto& obstacle : obstacles_) {
        if (pointInObstacle(obstacle, point)) {
            return false;
        }
    }
    return true;
}

bool GeometricObstacleChecker::isObstacleFree(const Eigen::VectorXd& start, const Eigen::VectorXd& end) const {
    // The workspace is a box, so two inside endpoints keep the whole segment inside
    if (!isWithinBounds(start) || !isWithinBounds(end)) {
        return false;
    }
    for (const auto& obstacle : obstacles_) {
        if (segmentHitsObstacle(obstacle, start, end)) {
            return false;
        }
    }
    return true;
}
