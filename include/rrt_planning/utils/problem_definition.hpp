// Copyright 2025 Soheil E.nia
#pragma once
#include "rrt_planning/pch.hpp"
#include "rrt_planning/utils/goal_region.hpp"

class ProblemDefinition {
 public:

    explicit ProblemDefinition(int dim)
        : dimension_(dim),
          start_(Eigen::VectorXd::Zero(dim)),
          lower_bounds_(Eigen::VectorXd::Zero(dim)),
          upper_bounds_(Eigen::VectorXd::Zero(dim)) {}


    void setStart(const Eigen::VectorXd& start) { start_ = start; }

    // Point goal reached once we are within tolerance of it
    void setGoal(const Eigen::VectorXd& goal, double tolerance) { goal_ = std::make_shared<BallGoal>(goal, tolerance); }

    void setGoalRegion(std::shared_ptr<GoalRegion> goal) { goal_ = std::move(goal); }

    // Several goals at once, reaching any of them solves the query
    void setGoalRegions(std::vector<std::shared_ptr<GoalRegion>> goals) {
        goal_ = std::make_shared<MultiGoal>(std::move(goals));
    }

    const Eigen::VectorXd& getStart() const { return start_; }

    const std::shared_ptr<GoalRegion>& getGoalRegion() const { return goal_; }

    void setBounds(const Eigen::VectorXd& lower, const Eigen::VectorXd& upper) {
        lower_bounds_ = lower;
        upper_bounds_ = upper;
    }

    void setBounds(double lower, double upper) {
        lower_bounds_ = Eigen::VectorXd::Constant(dimension_, lower);
        upper_bounds_ = Eigen::VectorXd::Constant(dimension_, upper);
    }

    const Eigen::VectorXd& getLowerBound() const { return lower_bounds_; }

    const Eigen::VectorXd& getUpperBound() const { return upper_bounds_; }

    int getDimension() const { return dimension_; }

    // Lebesgue measure of the sampling box. Upper bound on mu(X_free) for the RRT* radius.
    double getBoundsMeasure() const { return (upper_bounds_ - lower_bounds_).prod(); }

    bool isWithinBounds(const Eigen::VectorXd& state) const {
        return state.size() == dimension_ &&
               (state.array() >= lower_bounds_.array()).all() &&
               (state.array() <= upper_bounds_.array()).all();
    }

    // Throws ConfigurationError if the query is malformed
    void validate() const;


    bool hasSolution() const { return solution_cost_ < std::numeric_limits<double>::max(); }

    void setSolution(double cost) { solution_cost_ = cost; }

    void clearSolution() { solution_cost_ = std::numeric_limits<double>::max(); }

 private:
    int dimension_;
    Eigen::VectorXd start_;
    std::shared_ptr<GoalRegion> goal_;

    Eigen::VectorXd lower_bounds_;
    Eigen::VectorXd upper_bounds_;

    double solution_cost_ = std::numeric_limits<double>::max();
};
