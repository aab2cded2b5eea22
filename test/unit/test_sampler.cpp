// Copyright 2025 Soheil E.nia

#include <gtest/gtest.h>

#include "rrt_planning/utils/sampler.hpp"
#include "rrt_planning/state_space/euclidean_statespace.hpp"

namespace {

std::shared_ptr<ProblemDefinition> makeProblem() {
    auto problem = std::make_shared<ProblemDefinition>(2);
    problem->setBounds(0.0, 100.0);
    problem->setStart(Eigen::Vector2d(0.0, 0.0));
    problem->setGoal(Eigen::Vector2d(90.0, 90.0), 5.0);
    return problem;
}

}  // namespace

TEST(GoalRegion, BallMembershipAndSampling) {
    BallGoal goal(Eigen::Vector2d(1.0, 1.0), 2.0);
    EXPECT_TRUE(goal.contains(Eigen::Vector2d(1.0, 3.0)));   // closed
    EXPECT_FALSE(goal.contains(Eigen::Vector2d(3.0, 3.0)));
    EXPECT_FALSE(goal.contains(Eigen::Vector3d(1.0, 1.0, 1.0)));

    std::mt19937 rng(3);
    for (int i = 0; i < 500; ++i) {
        EXPECT_TRUE(goal.contains(goal.sample(rng)));
    }
    BallGoal point(Eigen::Vector2d(4.0, 4.0), 0.0);
    EXPECT_EQ(point.sample(rng), Eigen::VectorXd(Eigen::Vector2d(4.0, 4.0)));
    EXPECT_THROW(BallGoal(Eigen::Vector2d(0, 0), -1.0), ConfigurationError);
}

TEST(GoalRegion, BoxMembershipAndSampling) {
    BoxGoal goal(Eigen::Vector2d(80.0, 90.0), Eigen::Vector2d(100.0, 100.0));
    EXPECT_TRUE(goal.contains(Eigen::Vector2d(80.0, 100.0)));
    EXPECT_FALSE(goal.contains(Eigen::Vector2d(79.9, 95.0)));

    std::mt19937 rng(9);
    for (int i = 0; i < 500; ++i) {
        EXPECT_TRUE(goal.contains(goal.sample(rng)));
    }
    EXPECT_THROW(BoxGoal(Eigen::Vector2d(1, 1), Eigen::Vector2d(0, 2)), ConfigurationError);
}

TEST(GoalRegion, MultiGoalIsAUnion) {
    MultiGoal goal({std::make_shared<BallGoal>(Eigen::Vector2d(0.0, 0.0), 1.0),
                    std::make_shared<BoxGoal>(Eigen::Vector2d(10.0, 10.0), Eigen::Vector2d(12.0, 12.0))});
    EXPECT_TRUE(goal.contains(Eigen::Vector2d(0.5, 0.0)));
    EXPECT_TRUE(goal.contains(Eigen::Vector2d(11.0, 11.0)));
    EXPECT_FALSE(goal.contains(Eigen::Vector2d(5.0, 5.0)));
    EXPECT_EQ(goal.getDimension(), 2);

    std::mt19937 rng(4);
    int near_origin = 0;
    for (int i = 0; i < 2000; ++i) {
        Eigen::VectorXd s = goal.sample(rng);
        ASSERT_TRUE(goal.contains(s));
        if (s.norm() <= 1.0) ++near_origin;
    }
    // Both members get picked
    EXPECT_GT(near_origin, 800);
    EXPECT_LT(near_origin, 1200);

    std::vector<std::shared_ptr<GoalRegion>> none;
    EXPECT_THROW({ MultiGoal empty(none); }, ConfigurationError);
    std::vector<std::shared_ptr<GoalRegion>> mixed{std::make_shared<BallGoal>(Eigen::Vector2d(0.0, 0.0), 1.0),
                                                   std::make_shared<BallGoal>(Eigen::Vector3d(0.0, 0.0, 0.0), 1.0)};
    EXPECT_THROW({ MultiGoal bad(mixed); }, ConfigurationError);
    std::vector<std::shared_ptr<GoalRegion>> with_null{std::make_shared<BallGoal>(Eigen::Vector2d(0.0, 0.0), 1.0), nullptr};
    EXPECT_THROW({ MultiGoal bad(with_null); }, ConfigurationError);
}

TEST(ProblemDefinition, Validation) {
    auto problem = makeProblem();
    EXPECT_NO_THROW(problem->validate());
    EXPECT_DOUBLE_EQ(problem->getBoundsMeasure(), 10000.0);

    problem->setBounds(Eigen::Vector2d(0.0, 0.0), Eigen::Vector2d(100.0, 0.0));
    EXPECT_THROW(problem->validate(), ConfigurationError);

    ProblemDefinition no_goal(2);
    no_goal.setBounds(0.0, 1.0);
    EXPECT_THROW(no_goal.validate(), ConfigurationError);
}

TEST(Sampler, UniformStaysInBounds) {
    auto space = std::make_shared<EuclideanStateSpace>(2);
    UniformSampler sampler(space, makeProblem());
    std::mt19937 rng(1);
    for (int i = 0; i < 1000; ++i) {
        Eigen::VectorXd s = sampler.sample(rng);
        EXPECT_TRUE((s.array() >= 0.0).all() && (s.array() <= 100.0).all());
    }
}

TEST(Sampler, GoalBiasFraction) {
    auto space = std::make_shared<EuclideanStateSpace>(2);
    auto problem = makeProblem();
    GoalBiasedSampler sampler(space, problem, 0.3);
    std::mt19937 rng(17);

    int in_goal = 0;
    const int n = 20000;
    for (int i = 0; i < n; ++i) {
        if (problem->getGoalRegion()->contains(sampler.sample(rng))) ++in_goal;
    }
    // 0.3 from the bias plus pi*25/10000 of the uniform part
    double expected = 0.3 + 0.7 * (M_PI * 25.0 / 10000.0);
    EXPECT_NEAR(static_cast<double>(in_goal) / n, expected, 0.02);
}

TEST(Sampler, BiasEdgeCases) {
    auto space = std::make_shared<EuclideanStateSpace>(2);
    auto problem = makeProblem();
    GoalBiasedSampler always(space, problem, 1.0);
    std::mt19937 rng(2);
    for (int i = 0; i < 100; ++i) {
        EXPECT_TRUE(problem->getGoalRegion()->contains(always.sample(rng)));
    }
    EXPECT_THROW(GoalBiasedSampler(space, problem, -0.1), ConfigurationError);
    EXPECT_THROW(GoalBiasedSampler(space, problem, 1.1), ConfigurationError);
}
