// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/pch.hpp"
#include "rrt_planning/state_space/statespace.hpp"
#include "rrt_planning/utils/problem_definition.hpp"

// Source of the configurations the planners grow toward. The rng belongs to the planner so a fixed seed
// reproduces the whole run.
class Sampler {
 public:
    virtual ~Sampler() = default;
    virtual Eigen::VectorXd sample(std::mt19937& rng) = 0;
};


// Uniform over the bounding box of the problem
class UniformSampler : public Sampler {
 public:
    UniformSampler(std::shared_ptr<StateSpace> statespace, std::shared_ptr<ProblemDefinition> problem);

    Eigen::VectorXd sample(std::mt19937& rng) override;

 protected:
    std::shared_ptr<StateSpace> statespace_;
    std::shared_ptr<ProblemDefinition> problem_;
};


// With probability goal_bias draw from the goal region instead of the whole box
class GoalBiasedSampler : public UniformSampler {
 public:
    GoalBiasedSampler(std::shared_ptr<StateSpace> statespace, std::shared_ptr<ProblemDefinition> problem,
                      double goal_bias);

    Eigen::VectorXd sample(std::mt19937& rng) override;

    double getGoalBias() const { return goal_bias_; }

 private:
    double goal_bias_;
    std::uniform_real_distribution<double> coin_{0.0, 1.0};
};
