// Copyright 2025 Soheil E.nia
/**
 * The configuration space seen by the planners: metric, interpolation, steering and uniform sampling.
 * Configurations are plain Eigen vectors of a fixed dimension, the state space never stores them.
 */
#pragma once

#include "rrt_planning/pch.hpp"
#include "rrt_planning/ds/edge_info.hpp"
#include "rrt_planning/utils/errors.hpp"


class StateSpace {
 public:
    explicit StateSpace(int dimension) : dimension_(dimension) {
        if (dimension_ <= 0) {
            throw ConfigurationError("StateSpace dimension must be positive, got " + std::to_string(dimension_));
        }
    }

    virtual ~StateSpace() = default;

    virtual double distance(const Eigen::VectorXd& from, const Eigen::VectorXd& to) const = 0;
    virtual Eigen::VectorXd interpolate(const Eigen::VectorXd& from, const Eigen::VectorXd& to, double t) const = 0;

    // Move from "from" toward "to" but never further than max_step. If "to" is already within max_step the
    // returned end_state is "to" itself and the cost is the exact distance. Deterministic: no randomness here.
    virtual Trajectory steer(const Eigen::VectorXd& from, const Eigen::VectorXd& to, double max_step) const = 0;

    virtual Eigen::VectorXd sampleUniform(const Eigen::VectorXd& min_bounds, const Eigen::VectorXd& max_bounds,
                                          std::mt19937& rng) const = 0;

    int getDimension() const { return dimension_; }

    // Throws instead of asserting because a wrong sized vector usually comes from user input (start, goal, a custom sampler)
    void checkDimension(const Eigen::VectorXd& value, const std::string& what) const {
        if (value.size() != dimension_) {
            throw ConfigurationError(what + " has dimension " + std::to_string(value.size()) +
                                     " but the state space has dimension " + std::to_string(dimension_));
        }
    }

 protected:
    int dimension_;
};
