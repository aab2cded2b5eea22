// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/planners/geometric/rrt.hpp"
#include "rrt_planning/utils/rewire_radius.hpp"

/*
    RRT* on top of the RRT loop. After the usual steer and check, the new node picks the cheapest valid parent
    in the rewire ball, then offers itself as parent to every other node in the ball. Keeps running after the
    first solution until the budget is spent, the best goal cost can only go down.
*/
class RRTStar : public RRT {
 public:
    RRTStar(std::shared_ptr<StateSpace> statespace,
            std::shared_ptr<ProblemDefinition> problem_def,
            std::shared_ptr<ObstacleChecker> obs_checker);

    PlannerType getType() const override { return PlannerType::RRTStar; }

    // Replaces the shrinking ball schedule. Kept across later setup() calls.
    void setRewireRadius(RewireRadius radius);
    double getCurrentRadius() const;

    size_t getRewireCount() const { return rewire_count_; }

 protected:
    int extend(const Eigen::VectorXd& sample) override;
    bool stopOnFirstSolution() const override { return false; }
    std::string getName() const override { return "RRTStar"; }
    void setupExtra(const Params& params) override;

 private:
    using EdgeMap = boost::container::flat_map<int, EdgeInfo>;

    bool isEdgeFree(EdgeInfo& edge, const Eigen::VectorXd& a, const Eigen::VectorXd& b) const;

    RewireRadius rewire_radius_;
    bool custom_radius_ = false;
    double rewire_factor_ = 1.1;
    double rewire_radius_cap_ = 3.0;
    size_t rewire_count_ = 0;

    // Rewire only on an improvement larger than this, keeps float noise from reparenting back and forth
    double epsilon_ = 1e-9;
};
