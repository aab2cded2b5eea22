// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/planners/planner.hpp"
#include "rrt_planning/planners/geometric/rrt.hpp"
#include "rrt_planning/planners/geometric/rrt_star.hpp"

class PlannerFactory {
 public:
    using Creator = std::function<std::unique_ptr<Planner>(std::unique_ptr<StateSpace>,
                                                           std::shared_ptr<ProblemDefinition>,
                                                           std::shared_ptr<ObstacleChecker>)>;

    std::unique_ptr<Planner> createPlanner(PlannerType type,
                                           std::unique_ptr<StateSpace> statespace,
                                           std::shared_ptr<ProblemDefinition> problem,
                                           std::shared_ptr<ObstacleChecker> obs_checker);

    // RRTStar when "optimal" is true, RRT otherwise. Does not call setup().
    std::unique_ptr<Planner> createPlanner(const Params& params,
                                           std::unique_ptr<StateSpace> statespace,
                                           std::shared_ptr<ProblemDefinition> problem,
                                           std::shared_ptr<ObstacleChecker> obs_checker);

    void registerPlanner(PlannerType type, Creator creator);
    bool isRegistered(PlannerType type) const;
    static PlannerFactory& getInstance();

 private:
    PlannerFactory() = default;
    std::unordered_map<PlannerType, Creator> planners_;
};

template<typename pType>
class AutoRegisterPlanners {
 public:
    explicit AutoRegisterPlanners(const PlannerType& type) {
        PlannerFactory::getInstance().registerPlanner(type, [](std::unique_ptr<StateSpace> statespace,
                                                               std::shared_ptr<ProblemDefinition> problem,
                                                               std::shared_ptr<ObstacleChecker> obs_checker) {
            return std::make_unique<pType>(std::move(statespace), problem, obs_checker);
        });
    }
};

static AutoRegisterPlanners<RRT> autoRegisterRRT(PlannerType::RRT);
static AutoRegisterPlanners<RRTStar> autoRegisterRRTStar(PlannerType::RRTStar);
