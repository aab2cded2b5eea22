// Copyright 2025 Soheil E.nia

#include "rrt_planning/planners/planner_factory.hpp"

PlannerFactory& PlannerFactory::getInstance() {
    static PlannerFactory planner_factory_;
    return planner_factory_;
}

void PlannerFactory::registerPlanner(PlannerType type, Creator creator) {
    planners_.insert(std::make_pair(type, std::move(creator)));
}

bool PlannerFactory::isRegistered(PlannerType type) const {
    return planners_.find(type) != planners_.end();
}

std::unique_ptr<Planner> PlannerFactory::createPlanner(PlannerType type,
                                                       std::unique_ptr<StateSpace> statespace,
                                                       std::shared_ptr<ProblemDefinition> problem,
                                                       std::shared_ptr<ObstacleChecker> obs_checker) {
    auto object = planners_.find(type);
    if (object != planners_.end()) {
        return object->second(std::move(statespace), std::move(problem), std::move(obs_checker));
    }
    throw ConfigurationError("Unknown planner type: " + toString(type));
}

std::unique_ptr<Planner> PlannerFactory::createPlanner(const Params& params,
                                                       std::unique_ptr<StateSpace> statespace,
                                                       std::shared_ptr<ProblemDefinition> problem,
                                                       std::shared_ptr<ObstacleChecker> obs_checker) {
    PlannerType type = params.getParam<bool>("optimal", false) ? PlannerType::RRTStar : PlannerType::RRT;
    return createPlanner(type, std::move(statespace), std::move(problem), std::move(obs_checker));
}
