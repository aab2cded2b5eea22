// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/pch.hpp"
#include "rrt_planning/planners/planner.hpp"
#include "rrt_planning/utils/sampler.hpp"

/*
    Single query RRT. Grows a tree from the start with one extension attempt per iteration:

        sample -> nearest -> steer (at most max_step) -> oracle -> add node -> goal check

    and stops at the first node that lands in the goal region. RRTStar reuses the loop and only overrides
    extend() and stopOnFirstSolution().
*/
class RRT : public Planner {
 public:
    RRT(std::shared_ptr<StateSpace> statespace,
        std::shared_ptr<ProblemDefinition> problem_def,
        std::shared_ptr<ObstacleChecker> obs_checker);

    void setup(const Params& params) override;
    PlannerResult plan() override;

    // A single iteration of the loop, ignoring the budgets. Returns the new node index or -1 when the sample
    // was dropped. Meant for callers that drive the growth themselves, e.g. to draw the tree as it grows.
    int step();
    const Tree& getTree() const override;
    PlannerType getType() const override { return PlannerType::RRT; }

    // Replaces the goal biased sampler built in setup(). Kept across later setup() calls.
    void setSampler(std::shared_ptr<Sampler> sampler);

    // Goal node with the smallest cost so far, -1 if none
    int getBestGoalIndex() const;
    std::vector<Eigen::VectorXd> getPath() const;

    double getMaxStep() const { return max_step_; }
    size_t getMaxIterations() const { return max_iterations_; }
    double getGoalBias() const { return goal_bias_; }

 protected:
    // One extension toward sample. Returns the index of the new node, -1 if the attempt was dropped.
    virtual int extend(const Eigen::VectorXd& sample);
    virtual bool stopOnFirstSolution() const { return true; }
    virtual std::string getName() const { return "RRT"; }
    // Extra parameters of derived planners, read after the common ones
    virtual void setupExtra(const Params& /* params */) {}

    // Steer from the nearest node toward sample and check the result. On success fills the out parameters.
    bool steerFromNearest(const Eigen::VectorXd& sample, int& nearest_index, Eigen::VectorXd& new_state,
                          double& edge_cost) const;
    int iterate();
    bool isMotionValid(const Eigen::VectorXd& from, const Eigen::VectorXd& to) const;
    void checkGoal(int index);
    void fillResult(PlannerStatus status);

    std::shared_ptr<StateSpace> statespace_;
    std::shared_ptr<ProblemDefinition> problem_;
    std::shared_ptr<ObstacleChecker> obs_checker_;
    std::shared_ptr<Sampler> sampler_;
    bool custom_sampler_ = false;
    std::unique_ptr<Tree> tree_;

    std::mt19937 rng_;

    double max_step_ = 1.0;
    double goal_bias_ = 0.05;
    size_t max_iterations_ = 5000;
    double time_limit_ = 0.0;
    unsigned int seed_ = 42;
    std::string kdtree_type_ = "NanoFlann";
    bool check_invariants_ = false;
    bool verbose_ = false;

    // Extensions shorter than this would duplicate their parent
    double duplicate_tolerance_ = 0.0;

    size_t iteration_ = 0;
    size_t rejected_samples_ = 0;
    int first_solution_iteration_ = -1;
};
