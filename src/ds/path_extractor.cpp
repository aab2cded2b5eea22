// Copyright 2025 Soheil E.nia

#include "rrt_planning/ds/path_extractor.hpp"

std::vector<int> PathExtractor::extractIndices(const Tree& tree, int goal_index) {
    if (goal_index < 0 || goal_index >= static_cast<int>(tree.size())) {
        throw InvariantViolation("Cannot extract a path to node " + std::to_string(goal_index) +
                                 ", it is not in the tree");
    }

    std::vector<int> path;
    int idx = goal_index;
    while (idx != -1) {
        if (path.size() >= tree.size()) {
            throw InvariantViolation("Node " + std::to_string(goal_index) + " does not reach the root");
        }
        path.push_back(idx);
        idx = tree.getParentIndex(idx);
    }
    if (path.back() != tree.getRootIndex()) {
        throw InvariantViolation("Parent chain of node " + std::to_string(goal_index) + " ends at " +
                                 std::to_string(path.back()) + " instead of the root");
    }
    std::reverse(path.begin(), path.end());
    return path;
}

std::vector<Eigen::VectorXd> PathExtractor::extract(const Tree& tree, int goal_index) {
    std::vector<Eigen::VectorXd> path;
    for (int idx : extractIndices(tree, goal_index)) {
        path.push_back(tree.getStateValue(idx));
    }
    return path;
}

double PathExtractor::pathLength(const std::vector<Eigen::VectorXd>& path, const StateSpace& statespace) {
    double length = 0.0;
    for (size_t i = 1; i < path.size(); ++i) {
        length += statespace.distance(path[i - 1], path[i]);
    }
    return length;
}
