// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/pch.hpp"

/*
    Validity oracle consumed by the planners. Implementations must be deterministic and free of side effects as
    far as the planner can tell: the same query always gets the same answer, and asking doesn't change anything.
*/
class ObstacleChecker {
public:
    virtual ~ObstacleChecker() = default;

    // Is the motion start -> end collision free. Direction matters, end -> start may get a different answer.
    virtual bool isObstacleFree(const Eigen::VectorXd& start, const Eigen::VectorXd& end) const = 0;
    // Is a single configuration collision free
    virtual bool isObstacleFree(const Eigen::VectorXd& point) const = 0;

    // Whole path, segment by segment
    virtual bool isObstacleFree(const std::vector<Eigen::VectorXd>& path) const {
        if (path.empty()) {
            return true;
        }
        if (path.size() == 1) {
            return isObstacleFree(path.front());
        }
        for (size_t i = 1; i < path.size(); ++i) {
            if (!isObstacleFree(path[i - 1], path[i])) {
                return false;
            }
        }
        return true;
    }
};
