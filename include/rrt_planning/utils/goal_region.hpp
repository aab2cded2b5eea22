// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/pch.hpp"
#include "rrt_planning/utils/errors.hpp"

// Where the query ends. The planner only needs a membership test and a way to draw a goal sample
// for the goal bias.
class GoalRegion {
 public:
    virtual ~GoalRegion() = default;

    virtual bool contains(const Eigen::VectorXd& state) const = 0;
    virtual Eigen::VectorXd sample(std::mt19937& rng) const = 0;
    virtual int getDimension() const = 0;
    virtual std::string toString() const = 0;
};


// Closed ball around a point. A single goal configuration with a tolerance is just a ball.
class BallGoal : public GoalRegion {
 public:
    BallGoal(const Eigen::VectorXd& center, double radius);

    bool contains(const Eigen::VectorXd& state) const override;
    Eigen::VectorXd sample(std::mt19937& rng) const override;
    int getDimension() const override { return static_cast<int>(center_.size()); }
    std::string toString() const override;

    const Eigen::VectorXd& getCenter() const { return center_; }
    double getRadius() const { return radius_; }

 private:
    Eigen::VectorXd center_;
    double radius_;
};


// Closed axis aligned box [lower, upper]
class BoxGoal : public GoalRegion {
 public:
    BoxGoal(const Eigen::VectorXd& lower, const Eigen::VectorXd& upper);

    bool contains(const Eigen::VectorXd& state) const override;
    Eigen::VectorXd sample(std::mt19937& rng) const override;
    int getDimension() const override { return static_cast<int>(lower_.size()); }
    std::string toString() const override;

 private:
    Eigen::VectorXd lower_;
    Eigen::VectorXd upper_;
};


// Union of several regions, any of them ends the query. Goal samples pick a member uniformly first.
class MultiGoal : public GoalRegion {
 public:
    explicit MultiGoal(std::vector<std::shared_ptr<GoalRegion>> goals);

    bool contains(const Eigen::VectorXd& state) const override;
    Eigen::VectorXd sample(std::mt19937& rng) const override;
    int getDimension() const override { return goals_.front()->getDimension(); }
    std::string toString() const override;

    const std::vector<std::shared_ptr<GoalRegion>>& getGoals() const { return goals_; }

 private:
    std::vector<std::shared_ptr<GoalRegion>> goals_;
};
