// Copyright 2025 Soheil E.nia

#include "rrt_planning/utils/sampler.hpp"

UniformSampler::UniformSampler(std::shared_ptr<StateSpace> statespace, std::shared_ptr<ProblemDefinition> problem)
    : statespace_(std::move(statespace)), problem_(std::move(problem)) {
    if (!statespace_ || !problem_) {
        throw ConfigurationError("UniformSampler needs a state space and a problem definition");
    }
    if (statespace_->getDimension() != problem_->getDimension()) {
        throw ConfigurationError("UniformSampler: state space and problem dimensions differ");
    }
}

Eigen::VectorXd UniformSampler::sample(std::mt19937& rng) {
    return statespace_->sampleUniform(problem_->getLowerBound(), problem_->getUpperBound(), rng);
}


GoalBiasedSampler::GoalBiasedSampler(std::shared_ptr<StateSpace> statespace,
                                     std::shared_ptr<ProblemDefinition> problem, double goal_bias)
    : UniformSampler(std::move(statespace), std::move(problem)), goal_bias_(goal_bias) {
    if (!(goal_bias_ >= 0.0 && goal_bias_ <= 1.0)) {
        throw ConfigurationError("goal_bias must be in [0, 1], got " + std::to_string(goal_bias_));
    }
}

Eigen::VectorXd GoalBiasedSampler::sample(std::mt19937& rng) {
    // Always draw the coin so the random stream does not depend on the bias being zero or not
    const bool toward_goal = coin_(rng) < goal_bias_;
    const auto& goal = problem_->getGoalRegion();
    if (toward_goal && goal) {
        return goal->sample(rng);
    }
    return UniformSampler::sample(rng);
}
