// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/ds/tree.hpp"
#include "rrt_planning/state_space/statespace.hpp"

class PathExtractor {
 public:
    // Root first, goal_index last
    static std::vector<Eigen::VectorXd> extract(const Tree& tree, int goal_index);
    static std::vector<int> extractIndices(const Tree& tree, int goal_index);

    // Sum of the metric along consecutive waypoints
    static double pathLength(const std::vector<Eigen::VectorXd>& path, const StateSpace& statespace);
};
