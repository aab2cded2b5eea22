// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/state_space/statespace.hpp"


// R^d with the L2 metric. Steering is a straight line, so the edge cost is the euclidean length
// which is exactly what the NanoFlann index measures.
class EuclideanStateSpace : public StateSpace {
 public:
    explicit EuclideanStateSpace(int dimension);

    double distance(const Eigen::VectorXd& from, const Eigen::VectorXd& to) const override;
    Eigen::VectorXd interpolate(const Eigen::VectorXd& from, const Eigen::VectorXd& to, double t) const override;
    Trajectory steer(const Eigen::VectorXd& from, const Eigen::VectorXd& to, double max_step) const override;
    Eigen::VectorXd sampleUniform(const Eigen::VectorXd& min_bounds, const Eigen::VectorXd& max_bounds,
                                  std::mt19937& rng) const override;
};
