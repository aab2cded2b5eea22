// Copyright 2025 Soheil E.nia

#include <gtest/gtest.h>

#include "rrt_planning/planners/planner_factory.hpp"
#include "rrt_planning/ds/path_extractor.hpp"
#include "rrt_planning/state_space/euclidean_statespace.hpp"
#include "rrt_planning/utils/geometric_obstacle_checker.hpp"

namespace {

class RRTStarTest : public ::testing::Test {
 protected:
    void SetUp() override {
        statespace_ = std::make_shared<EuclideanStateSpace>(2);
        problem_ = std::make_shared<ProblemDefinition>(2);
        problem_->setBounds(0.0, 100.0);
        problem_->setStart(Eigen::Vector2d(0.0, 0.0));
        problem_->setGoal(Eigen::Vector2d(100.0, 100.0), 5.0);
        checker_ = std::make_shared<GeometricObstacleChecker>(problem_->getLowerBound(), problem_->getUpperBound());

        params_.setParam("max_step", 5.0);
        params_.setParam("goal_bias", 0.1);
        params_.setParam("max_iterations", 3000);
        params_.setParam("seed", 42);
        params_.setParam("optimal", true);
    }

    std::shared_ptr<StateSpace> statespace_;
    std::shared_ptr<ProblemDefinition> problem_;
    std::shared_ptr<GeometricObstacleChecker> checker_;
    Params params_;
};

// Records the best solution cost every time the planner asks for a sample, i.e. once per iteration
class CostRecordingSampler : public GoalBiasedSampler {
 public:
    CostRecordingSampler(std::shared_ptr<StateSpace> statespace, std::shared_ptr<ProblemDefinition> problem)
        : GoalBiasedSampler(std::move(statespace), std::move(problem), 0.1) {}

    Eigen::VectorXd sample(std::mt19937& rng) override {
        if (planner_) {
            int best = planner_->getBestGoalIndex();
            if (best >= 0) {
                costs_.push_back(planner_->getTree().getCost(best));
            }
        }
        return GoalBiasedSampler::sample(rng);
    }

    const RRT* planner_ = nullptr;
    std::vector<double> costs_;
};

// Snapshots every node cost at the start of each iteration and counts nodes whose cost went up
class NodeCostSampler : public GoalBiasedSampler {
 public:
    NodeCostSampler(std::shared_ptr<StateSpace> statespace, std::shared_ptr<ProblemDefinition> problem)
        : GoalBiasedSampler(std::move(statespace), std::move(problem), 0.1) {}

    Eigen::VectorXd sample(std::mt19937& rng) override {
        if (planner_) {
            const Tree& tree = planner_->getTree();
            for (size_t i = 0; i < tree.size(); ++i) {
                double cost = tree.getCost(static_cast<int>(i));
                if (i < previous_.size()) {
                    if (cost > previous_[i] + 1e-9) ++increases_;
                    previous_[i] = cost;
                } else {
                    previous_.push_back(cost);
                }
            }
            ++snapshots_;
        }
        return GoalBiasedSampler::sample(rng);
    }

    const RRT* planner_ = nullptr;
    std::vector<double> previous_;
    int increases_ = 0;
    int snapshots_ = 0;
};

// Replays a fixed list of configurations
class ScriptedSampler : public Sampler {
 public:
    explicit ScriptedSampler(std::vector<Eigen::VectorXd> samples) : samples_(std::move(samples)) {}

    Eigen::VectorXd sample(std::mt19937& /* rng */) override {
        return samples_[next_++ % samples_.size()];
    }

 private:
    std::vector<Eigen::VectorXd> samples_;
    size_t next_ = 0;
};

// Direction dependent oracle: no motion toward +x when both ends have y >= 9, and no straight jump from the
// origin to (10,10). The reverse motions are allowed.
class OneWayChecker : public ObstacleChecker {
 public:
    bool isObstacleFree(const Eigen::VectorXd& point) const override {
        return (point.array() >= 0.0).all() && (point.array() <= 20.0).all();
    }

    bool isObstacleFree(const Eigen::VectorXd& start, const Eigen::VectorXd& end) const override {
        if (!isObstacleFree(start) || !isObstacleFree(end)) {
            return false;
        }
        if (end[0] > start[0] && start[1] >= 9.0 && end[1] >= 9.0) {
            return false;
        }
        if (start.isZero() && end.isApprox(Eigen::Vector2d(10.0, 10.0))) {
            return false;
        }
        return true;
    }
    using ObstacleChecker::isObstacleFree;
};

}  // namespace

TEST_F(RRTStarTest, OpenSquareApproachesTheStraightLine) {
    RRTStar planner(statespace_, problem_, checker_);
    params_.setParam("max_iterations", 5000);
    planner.setup(params_);
    PlannerResult result = planner.plan();

    ASSERT_EQ(result.status, PlannerStatus::Succeeded);
    EXPECT_EQ(result.iterations, 5000u);  // keeps refining after the first solution
    double length = PathExtractor::pathLength(result.path, *statespace_);
    EXPECT_NEAR(length, result.cost, 1e-6);
    EXPECT_GE(length, std::sqrt(2.0) * 100.0 - 5.0 - 1e-9);
    EXPECT_LT(length, 1.25 * std::sqrt(2.0) * 100.0);
    EXPECT_GT(planner.getRewireCount(), 0u);
}

TEST_F(RRTStarTest, BestCostNeverIncreases) {
    RRTStar planner(statespace_, problem_, checker_);
    auto sampler = std::make_shared<CostRecordingSampler>(statespace_, problem_);
    sampler->planner_ = &planner;
    planner.setSampler(sampler);
    params_.setParam("check_invariants", true);
    planner.setup(params_);
    PlannerResult result = planner.plan();

    ASSERT_EQ(result.status, PlannerStatus::Succeeded);
    ASSERT_GT(sampler->costs_.size(), 1u);
    for (size_t i = 1; i < sampler->costs_.size(); ++i) {
        EXPECT_LE(sampler->costs_[i], sampler->costs_[i - 1] + 1e-9);
    }
    EXPECT_LE(result.cost, sampler->costs_.front());
}

TEST_F(RRTStarTest, NodeCostsNeverIncrease) {
    checker_->addBox(Eigen::Vector2d(40.0, 0.0), Eigen::Vector2d(60.0, 85.0));
    RRTStar planner(statespace_, problem_, checker_);
    auto sampler = std::make_shared<NodeCostSampler>(statespace_, problem_);
    sampler->planner_ = &planner;
    planner.setSampler(sampler);
    params_.setParam("max_iterations", 2000);
    planner.setup(params_);
    planner.plan();

    EXPECT_EQ(sampler->snapshots_, 2000);
    EXPECT_EQ(sampler->increases_, 0);
    EXPECT_GT(planner.getRewireCount(), 0u);
}

TEST(RRTStar, RewireAsksTheOracleInTheRewireDirection) {
    auto statespace = std::make_shared<EuclideanStateSpace>(2);
    auto problem = std::make_shared<ProblemDefinition>(2);
    problem->setBounds(0.0, 20.0);
    problem->setStart(Eigen::Vector2d(0.0, 0.0));
    problem->setGoal(Eigen::Vector2d(10.0, 10.0), 0.1);
    auto oracle = std::make_shared<OneWayChecker>();

    RRTStar planner(statespace, problem, oracle);
    planner.setSampler(std::make_shared<ScriptedSampler>(std::vector<Eigen::VectorXd>{
        Eigen::Vector2d(10.0, 0.0), Eigen::Vector2d(10.0, 10.0), Eigen::Vector2d(5.0, 10.0)}));
    planner.setRewireRadius(makeConstantRadius(100.0));

    Params params;
    params.setParam("max_step", 100.0);
    params.setParam("max_iterations", 3);
    params.setParam("check_invariants", true);
    planner.setup(params);
    PlannerResult result = planner.plan();

    // (5,10) -> (10,10) would be cheaper but the oracle only allows (10,10) -> (5,10)
    ASSERT_EQ(result.status, PlannerStatus::Succeeded);
    EXPECT_TRUE(oracle->isObstacleFree(result.path));
    ASSERT_EQ(result.path.size(), 3u);
    EXPECT_TRUE(result.path[1].isApprox(Eigen::Vector2d(10.0, 0.0)));
    EXPECT_DOUBLE_EQ(result.cost, 20.0);
    EXPECT_EQ(planner.getRewireCount(), 0u);
}

TEST_F(RRTStarTest, PathAvoidsObstacles) {
    checker_->addBox(Eigen::Vector2d(40.0, 0.0), Eigen::Vector2d(60.0, 85.0));
    checker_->addBall(Eigen::Vector2d(80.0, 50.0), 8.0);
    params_.setParam("max_iterations", 6000);
    params_.setParam("kdtree_type", "LinearScan");

    RRTStar planner(statespace_, problem_, checker_);
    planner.setup(params_);
    PlannerResult result = planner.plan();

    ASSERT_EQ(result.status, PlannerStatus::Succeeded);
    EXPECT_TRUE(checker_->isObstacleFree(result.path));
    EXPECT_NO_THROW(planner.getTree().validate(1e-6));
}

TEST_F(RRTStarTest, CustomRadiusIsUsed) {
    RRTStar planner(statespace_, problem_, checker_);
    planner.setRewireRadius(makeConstantRadius(0.0));
    planner.setup(params_);
    planner.plan();
    // A zero ball leaves only the nearest node as candidate, so nothing is ever rewired
    EXPECT_EQ(planner.getRewireCount(), 0u);
    EXPECT_DOUBLE_EQ(planner.getCurrentRadius(), 0.0);
}

TEST_F(RRTStarTest, FixedSeedIsDeterministic) {
    params_.setParam("max_iterations", 1500);
    RRTStar a(statespace_, problem_, checker_);
    a.setup(params_);
    PlannerResult ra = a.plan();

    RRTStar b(statespace_, problem_, checker_);
    b.setup(params_);
    PlannerResult rb = b.plan();

    EXPECT_EQ(ra.cost, rb.cost);
    ASSERT_EQ(a.getTree().size(), b.getTree().size());
    for (size_t i = 0; i < a.getTree().size(); ++i) {
        EXPECT_EQ(a.getTree().getParentIndex(static_cast<int>(i)), b.getTree().getParentIndex(static_cast<int>(i)));
    }
}

TEST_F(RRTStarTest, FactorySelectsByOptimalFlag) {
    auto& factory = PlannerFactory::getInstance();
    EXPECT_TRUE(factory.isRegistered(PlannerType::RRT));
    EXPECT_TRUE(factory.isRegistered(PlannerType::RRTStar));

    auto star = factory.createPlanner(params_, std::make_unique<EuclideanStateSpace>(2), problem_, checker_);
    EXPECT_EQ(star->getType(), PlannerType::RRTStar);

    params_.setParam("optimal", false);
    auto plain = factory.createPlanner(params_, std::make_unique<EuclideanStateSpace>(2), problem_, checker_);
    EXPECT_EQ(plain->getType(), PlannerType::RRT);

    plain->setup(params_);
    EXPECT_EQ(plain->plan().status, PlannerStatus::Succeeded);
}

TEST(RewireRadius, ShrinkingBallSchedule) {
    RewireRadius radius = makeShrinkingBallRadius(2, 100.0 * 100.0, 1.1, 15.0);
    EXPECT_DOUBLE_EQ(radius(1), 15.0);
    double previous = radius(10);
    for (size_t n : {100u, 1000u, 10000u, 100000u}) {
        double r = radius(n);
        EXPECT_LE(r, previous);
        EXPECT_GT(r, 0.0);
        previous = r;
    }
    // gamma for d = 2: 2 * sqrt(1.5) * sqrt(measure / pi)
    double gamma = 2.0 * std::sqrt(1.5) * std::sqrt(10000.0 / M_PI);
    EXPECT_NEAR(radius(100000), 1.1 * gamma * std::sqrt(std::log(100000.0) / 100000.0), 1e-9);
    EXPECT_NEAR(unitBallVolume(3), 4.0 / 3.0 * M_PI, 1e-12);
    EXPECT_THROW(makeShrinkingBallRadius(2, 0.0, 1.1, 1.0), ConfigurationError);
}
