// Copyright 2025 Soheil E.nia

#include "rrt_planning/planners/geometric/rrt_star.hpp"

RRTStar::RRTStar(std::shared_ptr<StateSpace> statespace,
                 std::shared_ptr<ProblemDefinition> problem_def,
                 std::shared_ptr<ObstacleChecker> obs_checker)
    : RRT(std::move(statespace), std::move(problem_def), std::move(obs_checker)) {
}

void RRTStar::setRewireRadius(RewireRadius radius) {
    if (!radius) {
        throw ConfigurationError("Rewire radius schedule must not be empty");
    }
    rewire_radius_ = std::move(radius);
    custom_radius_ = true;
}

void RRTStar::setupExtra(const Params& params) {
    rewire_factor_ = params.getParam<double>("rewire_factor", 1.1);
    rewire_radius_cap_ = params.getParam<double>("rewire_radius_cap", 3.0 * max_step_);
    rewire_count_ = 0;

    if (rewire_factor_ <= 1.0) {
        std::cerr << "RRTStar: rewire_factor " << rewire_factor_
                  << " is not above 1, asymptotic optimality is not guaranteed\n";
    }
    if (!custom_radius_) {
        rewire_radius_ = makeShrinkingBallRadius(statespace_->getDimension(), problem_->getBoundsMeasure(),
                                                 rewire_factor_, rewire_radius_cap_);
    }
}

double RRTStar::getCurrentRadius() const {
    if (!rewire_radius_ || !tree_) {
        return 0.0;
    }
    return rewire_radius_(tree_->size());
}

bool RRTStar::isEdgeFree(EdgeInfo& edge, const Eigen::VectorXd& a, const Eigen::VectorXd& b) const {
    if (!edge.is_checked) {
        edge.is_free = obs_checker_->isObstacleFree(a, b);
        edge.is_checked = true;
    }
    return edge.is_free;
}

int RRTStar::extend(const Eigen::VectorXd& sample) {
    int nearest_index = -1;
    Eigen::VectorXd new_state;
    double nearest_edge = 0.0;
    if (!steerFromNearest(sample, nearest_index, new_state, nearest_edge)) {
        return -1;
    }

    const double radius = getCurrentRadius();
    if (!(radius >= 0.0) || !std::isfinite(radius)) {
        throw ConfigurationError("Rewire radius schedule returned " + std::to_string(radius));
    }
    std::vector<int> neighbors = tree_->near(new_state, radius);

    // Motions are checked per direction, the oracle is not assumed to be symmetric.
    // incoming: neighbor -> new (parent candidates), outgoing: new -> neighbor (rewire candidates)
    EdgeMap incoming;
    EdgeMap outgoing;
    incoming.reserve(neighbors.size() + 1);
    outgoing.reserve(neighbors.size());

    EdgeInfo& nearest_info = incoming[nearest_index];
    nearest_info.distance = nearest_edge;
    nearest_info.is_free = true;  // steerFromNearest already checked nearest -> new
    nearest_info.is_checked = true;

    // Choose parent. Only ask the oracle for candidates that would actually beat the current best.
    int best_parent = nearest_index;
    double best_edge = nearest_edge;
    double best_cost = tree_->getCost(nearest_index) + nearest_edge;
    for (int n : neighbors) {
        if (n == nearest_index) {
            continue;
        }
        const Eigen::VectorXd& n_state = tree_->getStateValue(n);
        EdgeInfo& info = incoming[n];
        info.distance = statespace_->distance(n_state, new_state);
        if (info.distance <= duplicate_tolerance_) {
            info.is_checked = true;  // zero length edge, never usable
            continue;
        }
        double candidate = tree_->getCost(n) + info.distance;
        if (candidate < best_cost && isEdgeFree(info, n_state, new_state)) {
            best_parent = n;
            best_edge = info.distance;
            best_cost = candidate;
        }
    }

    int new_index = tree_->addNode(best_parent, new_state, best_edge);

    // Rewire the neighborhood through the new node
    const double new_cost = tree_->getCost(new_index);
    for (int n : neighbors) {
        if (n == best_parent || n == tree_->getRootIndex()) {
            continue;
        }
        const Eigen::VectorXd& n_state = tree_->getStateValue(n);
        EdgeInfo& info = outgoing[n];
        info.distance = statespace_->distance(new_state, n_state);
        if (info.distance <= duplicate_tolerance_) {
            continue;
        }
        if (new_cost + info.distance + epsilon_ < tree_->getCost(n) &&
            isEdgeFree(info, new_state, n_state)) {
            tree_->rewire(n, new_index, info.distance);
            ++rewire_count_;
        }
    }

    if (verbose_) {
        std::cout << "RRTStar: node " << new_index << " parent " << best_parent
                  << " cost " << new_cost << " radius " << radius
                  << " neighbors " << neighbors.size() << "\n";
    }
    return new_index;
}
