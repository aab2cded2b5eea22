// Copyright 2025 Soheil E.nia

#include "rrt_planning/utils/problem_definition.hpp"

void ProblemDefinition::validate() const {
    if (dimension_ <= 0) {
        throw ConfigurationError("Problem dimension must be positive");
    }
    if (start_.size() != dimension_) {
        throw ConfigurationError("Start has dimension " + std::to_string(start_.size()) + ", expected " +
                                 std::to_string(dimension_));
    }
    if (lower_bounds_.size() != dimension_ || upper_bounds_.size() != dimension_) {
        throw ConfigurationError("Bounds must have dimension " + std::to_string(dimension_));
    }
    if (!start_.allFinite() || !lower_bounds_.allFinite() || !upper_bounds_.allFinite()) {
        throw ConfigurationError("Start and bounds must be finite");
    }
    for (int i = 0; i < dimension_; ++i) {
        if (!(lower_bounds_[i] < upper_bounds_[i])) {
            throw ConfigurationError("Lower bound must be below upper bound in dimension " + std::to_string(i));
        }
    }
    if (!goal_) {
        throw ConfigurationError("No goal region set");
    }
    if (goal_->getDimension() != dimension_) {
        throw ConfigurationError("Goal region has dimension " + std::to_string(goal_->getDimension()) +
                                 ", expected " + std::to_string(dimension_));
    }
    if (!isWithinBounds(start_)) {
        throw ConfigurationError("Start lies outside the bounds");
    }
}
