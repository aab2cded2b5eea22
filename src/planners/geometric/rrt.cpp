// Copyright 2025 Soheil E.nia

#include "rrt_planning/planners/geometric/rrt.hpp"
#include "rrt_planning/ds/path_extractor.hpp"
#include "rrt_planning/utils/nano_flann.hpp"
#include "rrt_planning/utils/linear_scan.hpp"

RRT::RRT(std::shared_ptr<StateSpace> statespace,
         std::shared_ptr<ProblemDefinition> problem_def,
         std::shared_ptr<ObstacleChecker> obs_checker)
    : statespace_(std::move(statespace)), problem_(std::move(problem_def)), obs_checker_(std::move(obs_checker)) {
    if (!statespace_ || !problem_ || !obs_checker_) {
        throw ConfigurationError("Planner needs a state space, a problem definition and an obstacle checker");
    }
}

void RRT::setSampler(std::shared_ptr<Sampler> sampler) {
    if (!sampler) {
        throw ConfigurationError("Sampler must not be null");
    }
    sampler_ = std::move(sampler);
    custom_sampler_ = true;
}

void RRT::setup(const Params& params) {
    auto start = std::chrono::steady_clock::now();

    max_step_ = params.getParam<double>("max_step", 1.0);
    goal_bias_ = params.getParam<double>("goal_bias", 0.05);
    int max_iterations = params.getParam<int>("max_iterations", 5000);
    time_limit_ = params.getParam<double>("time_limit", 0.0);
    seed_ = params.getParam<unsigned int>("seed", 42u);
    kdtree_type_ = params.getParam<std::string>("kdtree_type", "NanoFlann");
    check_invariants_ = params.getParam<bool>("check_invariants", false);
    verbose_ = params.getParam<bool>("verbose", false);

    if (!(max_step_ > 0.0) || !std::isfinite(max_step_)) {
        throw ConfigurationError("max_step must be positive and finite");
    }
    if (!(goal_bias_ >= 0.0 && goal_bias_ <= 1.0)) {
        throw ConfigurationError("goal_bias must be in [0, 1]");
    }
    if (max_iterations <= 0) {
        throw ConfigurationError("max_iterations must be positive");
    }
    if (!(time_limit_ >= 0.0) || !std::isfinite(time_limit_)) {
        throw ConfigurationError("time_limit must be finite and non negative (0 disables it)");
    }
    max_iterations_ = static_cast<size_t>(max_iterations);

    problem_->validate();
    if (problem_->getDimension() != statespace_->getDimension()) {
        throw ConfigurationError("Problem and state space dimensions differ");
    }
    const Eigen::VectorXd& start_state = problem_->getStart();
    if (!obs_checker_->isObstacleFree(start_state)) {
        throw ConfigurationError("Start configuration is in collision");
    }

    std::unique_ptr<SpatialIndex> index;
    if (kdtree_type_ == "NanoFlann") {
        index = std::make_unique<NanoFlann>(statespace_->getDimension());
    } else if (kdtree_type_ == "LinearScan") {
        auto space = statespace_;
        index = std::make_unique<LinearScan>(statespace_->getDimension(),
            [space](const Eigen::VectorXd& a, const Eigen::VectorXd& b) { return space->distance(a, b); });
    } else {
        throw ConfigurationError("Unknown KD-Tree type: " + kdtree_type_);
    }
    tree_ = std::make_unique<Tree>(start_state, std::move(index));

    if (!custom_sampler_) {
        sampler_ = std::make_shared<GoalBiasedSampler>(statespace_, problem_, goal_bias_);
    }
    rng_.seed(seed_);

    const Eigen::VectorXd extent = problem_->getUpperBound() - problem_->getLowerBound();
    duplicate_tolerance_ = extent.minCoeff() * 1e-6;

    setupExtra(params);

    iteration_ = 0;
    rejected_samples_ = 0;
    first_solution_iteration_ = -1;
    cancel_requested_.store(false);
    problem_->clearSolution();
    checkGoal(tree_->getRootIndex());

    result_ = PlannerResult();
    result_.tree_size = tree_->size();
    status_.store(PlannerStatus::Initialized);

    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    std::cout << getName() << " setup complete: dim=" << statespace_->getDimension()
              << ", max_step=" << max_step_
              << ", goal_bias=" << goal_bias_
              << ", max_iterations=" << max_iterations_
              << ", seed=" << seed_
              << ", kdtree=" << kdtree_type_
              << ", goal=" << problem_->getGoalRegion()->toString()
              << " (" << duration.count() << " us)\n";
}

const Tree& RRT::getTree() const {
    if (!tree_) {
        throw std::logic_error(getName() + ": no tree before setup()");
    }
    return *tree_;
}

bool RRT::isMotionValid(const Eigen::VectorXd& from, const Eigen::VectorXd& to) const {
    return problem_->isWithinBounds(to) &&
           obs_checker_->isObstacleFree(to) &&
           obs_checker_->isObstacleFree(from, to);
}

bool RRT::steerFromNearest(const Eigen::VectorXd& sample, int& nearest_index, Eigen::VectorXd& new_state,
                           double& edge_cost) const {
    nearest_index = tree_->nearest(sample);
    const Eigen::VectorXd& from = tree_->getStateValue(nearest_index);

    Trajectory traj = statespace_->steer(from, sample, max_step_);
    if (!traj.is_valid || traj.cost <= duplicate_tolerance_) {
        return false;
    }
    if (!isMotionValid(from, traj.end_state)) {
        return false;
    }
    new_state = traj.end_state;
    edge_cost = traj.cost;
    return true;
}

int RRT::extend(const Eigen::VectorXd& sample) {
    int nearest_index = -1;
    Eigen::VectorXd new_state;
    double edge_cost = 0.0;
    if (!steerFromNearest(sample, nearest_index, new_state, edge_cost)) {
        return -1;
    }
    return tree_->addNode(nearest_index, new_state, edge_cost);
}

void RRT::checkGoal(int index) {
    if (!problem_->getGoalRegion()->contains(tree_->getStateValue(index))) {
        return;
    }
    tree_->markGoal(index);
    if (first_solution_iteration_ < 0) {
        first_solution_iteration_ = static_cast<int>(iteration_);
        std::cout << getName() << ": first solution at iteration " << iteration_
                  << " with cost " << tree_->getCost(index)
                  << " (tree size " << tree_->size() << ")\n";
    }
}

int RRT::getBestGoalIndex() const {
    if (!tree_) {
        return -1;
    }
    // Costs move under rewiring, so look it up every time
    int best = -1;
    double best_cost = std::numeric_limits<double>::infinity();
    for (int index : tree_->getGoalIndices()) {
        double cost = tree_->getCost(index);
        if (cost < best_cost || (cost == best_cost && index < best)) {
            best = index;
            best_cost = cost;
        }
    }
    return best;
}

std::vector<Eigen::VectorXd> RRT::getPath() const {
    int best = getBestGoalIndex();
    if (best < 0) {
        return {};
    }
    return PathExtractor::extract(*tree_, best);
}

void RRT::fillResult(PlannerStatus status) {
    result_ = PlannerResult();
    result_.status = status;
    result_.iterations = iteration_;
    result_.rejected_samples = rejected_samples_;
    result_.tree_size = tree_->size();
    if (status != PlannerStatus::Failed) {
        int best = getBestGoalIndex();
        if (best >= 0) {
            result_.path = PathExtractor::extract(*tree_, best);
            result_.cost = tree_->getCost(best);
            problem_->setSolution(result_.cost);
        }
    }
    status_.store(status);
}

int RRT::iterate() {
    Eigen::VectorXd sample = sampler_->sample(rng_);
    statespace_->checkDimension(sample, "Sample");
    if (!sample.allFinite()) {
        throw ConfigurationError("Sampler returned a non finite configuration");
    }
    ++iteration_;

    int new_index = extend(sample);
    if (new_index < 0) {
        ++rejected_samples_;
    } else {
        checkGoal(new_index);
    }

    if (check_invariants_) {
        tree_->validate();
    }
    return new_index;
}

int RRT::step() {
    if (!tree_) {
        throw std::logic_error(getName() + ": step() called before setup()");
    }
    status_.store(PlannerStatus::Running);
    try {
        return iterate();
    } catch (const std::exception& e) {
        std::cerr << getName() << ": step failed at iteration " << iteration_ << ": " << e.what() << "\n";
        fillResult(PlannerStatus::Failed);
        throw;
    }
}

PlannerResult RRT::plan() {
    if (!tree_) {
        throw std::logic_error(getName() + ": plan() called before setup()");
    }
    status_.store(PlannerStatus::Running);
    auto start = std::chrono::steady_clock::now();

    try {
        PlannerStatus final_status = PlannerStatus::Exhausted;

        // Start already inside the goal region
        if (tree_->getNode(tree_->getRootIndex()).isGoal()) {
            fillResult(PlannerStatus::Succeeded);
            std::cout << getName() << ": start lies in the goal region, nothing to plan\n";
            return result_;
        }

        while (true) {
            if (cancel_requested_.load()) {
                final_status = PlannerStatus::Cancelled;
                break;
            }
            if (iteration_ >= max_iterations_) {
                break;
            }
            if (stopOnFirstSolution() && first_solution_iteration_ >= 0) {
                break;
            }
            if (time_limit_ > 0.0) {
                std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
                if (elapsed.count() >= time_limit_) {
                    break;
                }
            }

            iterate();
            if (verbose_ && iteration_ % 1000 == 0) {
                int best = getBestGoalIndex();
                std::cout << getName() << ": iteration " << iteration_ << ", tree size " << tree_->size()
                          << ", best cost " << (best >= 0 ? tree_->getCost(best) : std::numeric_limits<double>::infinity())
                          << "\n";
            }
        }

        if (final_status == PlannerStatus::Exhausted && getBestGoalIndex() >= 0) {
            final_status = PlannerStatus::Succeeded;
        }
        fillResult(final_status);
    } catch (const std::exception& e) {
        std::cerr << getName() << ": planning failed at iteration " << iteration_ << ": " << e.what() << "\n";
        fillResult(PlannerStatus::Failed);
        throw;
    }

    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    std::cout << getName() << " finished: " << toString(result_.status)
              << " after " << result_.iterations << " iterations"
              << ", tree size " << result_.tree_size
              << ", rejected " << result_.rejected_samples
              << ", cost " << result_.cost
              << " (" << duration.count() << " ms)\n";
    return result_;
}
