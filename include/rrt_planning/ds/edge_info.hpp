// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/pch.hpp"

// This struct holds the result of the steering function.
// It's the primary way the StateSpace communicates the extension to the Planner (and to the collision checker).
struct Trajectory {
    bool is_valid = false;
    double cost = std::numeric_limits<double>::infinity(); // Same metric as StateSpace::distance, so tree cost and nn distance agree
    Eigen::VectorXd end_state;  // Where the steer actually stopped. Equal to the target if it was within the step
};


// Cached information about one directed connection between a freshly added node and one of its neighbors,
// so a candidate is never sent to the oracle twice in the same direction.
struct EdgeInfo {
    double distance = std::numeric_limits<double>::infinity();
    bool is_free = false;
    bool is_checked = false;  // is_free means nothing until the oracle was asked
};
