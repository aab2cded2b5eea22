// Copyright 2025 Soheil E.nia

#include "rrt_planning/state_space/euclidean_statespace.hpp"

EuclideanStateSpace::EuclideanStateSpace(int dimension) : StateSpace(dimension) {
}

double EuclideanStateSpace::distance(const Eigen::VectorXd& from, const Eigen::VectorXd& to) const {
    return (from - to).norm(); // Euclidean distance
}

Eigen::VectorXd EuclideanStateSpace::interpolate(const Eigen::VectorXd& from, const Eigen::VectorXd& to, double t) const { // t in [0, 1]
    return from + t * (to - from);
}

Trajectory EuclideanStateSpace::steer(const Eigen::VectorXd& from, const Eigen::VectorXd& to, double max_step) const {
    checkDimension(from, "Steer origin");
    checkDimension(to, "Steer target");
    if (!(max_step > 0.0) || !std::isfinite(max_step)) {
        throw ConfigurationError("Steer step bound must be positive and finite");
    }

    Trajectory traj;
    double d = distance(from, to);
    if (d <= max_step) {
        traj.end_state = to;
        traj.cost = d;
    } else {
        // Saturate the step
        traj.end_state = interpolate(from, to, max_step / d);
        traj.cost = distance(from, traj.end_state);
    }
    traj.is_valid = true;
    return traj;
}

Eigen::VectorXd EuclideanStateSpace::sampleUniform(const Eigen::VectorXd& min_bounds, const Eigen::VectorXd& max_bounds,
                                                   std::mt19937& rng) const {
    // Check if the bounds vectors have the correct number of dimensions.
    checkDimension(min_bounds, "Lower bound");
    checkDimension(max_bounds, "Upper bound");

    Eigen::VectorXd values(dimension_);
    for (int i = 0; i < dimension_; ++i) {
        std::uniform_real_distribution<double> dist(min_bounds[i], max_bounds[i]);
        values[i] = dist(rng);
    }
    return values;
}
