// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/pch.hpp"
#include "rrt_planning/ds/tree.hpp"
#include "rrt_planning/state_space/statespace.hpp"
#include "rrt_planning/utils/problem_definition.hpp"
#include "rrt_planning/utils/obstacle_checker.hpp"
#include "rrt_planning/utils/params.hpp"

enum class PlannerType {
    RRT,
    RRTStar,
};

enum class PlannerStatus {
    Initialized,
    Running,
    Succeeded,
    Exhausted,
    Cancelled,
    Failed,
};

std::string toString(PlannerStatus status);
std::string toString(PlannerType type);

struct PlannerResult {
    PlannerStatus status = PlannerStatus::Initialized;
    std::vector<Eigen::VectorXd> path;  // start first, empty unless a goal node exists
    double cost = std::numeric_limits<double>::infinity();
    size_t iterations = 0;              // extension attempts
    size_t tree_size = 0;
    size_t rejected_samples = 0;        // attempts dropped by the oracle or as duplicates

    bool hasSolution() const { return !path.empty(); }
};


class Planner {
 public:
    Planner() = default;
    virtual ~Planner() = default;

    // Validates the problem and the parameters, builds a fresh tree rooted at the start.
    // Throws ConfigurationError.
    virtual void setup(const Params& params) = 0;

    // Runs until a terminal status. Fatal errors set Failed and are rethrown.
    virtual PlannerResult plan() = 0;

    virtual const Tree& getTree() const = 0;
    virtual PlannerType getType() const = 0;

    // Safe from any thread. Seen at the start of the next iteration, never in the middle of one.
    void cancel() noexcept { cancel_requested_.store(true); }
    bool isCancelRequested() const noexcept { return cancel_requested_.load(); }

    PlannerStatus getStatus() const noexcept { return status_.load(); }
    const PlannerResult& getResult() const { return result_; }

 protected:
    std::atomic<bool> cancel_requested_{false};
    std::atomic<PlannerStatus> status_{PlannerStatus::Initialized};
    PlannerResult result_;
};
