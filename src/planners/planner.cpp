// Copyright 2025 Soheil E.nia

#include "rrt_planning/planners/planner.hpp"

std::string toString(PlannerStatus status) {
    switch (status) {
        case PlannerStatus::Initialized: return "Initialized";
        case PlannerStatus::Running: return "Running";
        case PlannerStatus::Succeeded: return "Succeeded";
        case PlannerStatus::Exhausted: return "Exhausted";
        case PlannerStatus::Cancelled: return "Cancelled";
        case PlannerStatus::Failed: return "Failed";
    }
    return "Unknown";
}

std::string toString(PlannerType type) {
    switch (type) {
        case PlannerType::RRT: return "RRT";
        case PlannerType::RRTStar: return "RRTStar";
    }
    return "Unknown";
}
