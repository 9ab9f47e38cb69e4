// tests/optimization/pool_optimizer_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <set>
#include "common/exceptions.hpp"
#include "optimization/pool_optimizer.hpp"

using optimization::PoolOptimizer;
using ::testing::ElementsAre;
using ::testing::ElementsAreArray;

class PoolOptimizerTest : public ::testing::Test {
protected:
    std::mt19937 rng{42};

    // Smooth 2-D response with a single maximum at (0.3, -0.2)
    static PoolOptimizer::Pool makePool(const int size, const unsigned int seed) {
        std::mt19937 pool_rng(seed);
        std::uniform_real_distribution<double> dist(-1.0, 1.0);
        Eigen::MatrixXd features(size, 2);
        Eigen::VectorXd responses(size);
        for (int i = 0; i < size; ++i) {
            features(i, 0) = dist(pool_rng);
            features(i, 1) = dist(pool_rng);
            responses(i) = -std::pow(features(i, 0) - 0.3, 2) - std::pow(features(i, 1) + 0.2, 2);
        }
        return {features, responses};
    }

    static void expectValidRun(const PoolOptimizer::Result &result, const PoolOptimizer::Pool &pool,
                               const size_t expected_size) {
        ASSERT_EQ(result.evaluated.size(), expected_size);
        const std::set<Eigen::Index> unique(result.evaluated.begin(), result.evaluated.end());
        EXPECT_EQ(unique.size(), expected_size);
        for (const auto index: result.evaluated) {
            EXPECT_GE(index, 0);
            EXPECT_LT(index, pool.size());
        }
        ASSERT_EQ(result.best_so_far.size(), expected_size);
        EXPECT_TRUE(std::is_sorted(result.best_so_far.begin(), result.best_so_far.end()));
    }
};

TEST_F(PoolOptimizerTest, RunsInitialSampleAndBudget) {
    const auto pool = makePool(20, 1);
    const PoolOptimizer optimizer(PoolOptimizer::Config(5, 5, 2.0));
    const auto result = optimizer.run(pool, rng);

    expectValidRun(result, pool, 10);
    ASSERT_EQ(result.iterations.size(), 5u);
    for (size_t i = 0; i < result.iterations.size(); ++i) {
        EXPECT_EQ(result.iterations[i].iteration, static_cast<int>(i));
        EXPECT_EQ(result.iterations[i].selected, result.evaluated[5 + i]);
    }
}

TEST_F(PoolOptimizerTest, BestSoFarIsRunningMaximumOfResponses) {
    const auto pool = makePool(20, 2);
    const PoolOptimizer optimizer(PoolOptimizer::Config(4, 3, 2.0));
    const auto result = optimizer.run(pool, rng);

    double best = -std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < result.evaluated.size(); ++i) {
        best = std::max(best, pool.responses()(result.evaluated[i]));
        EXPECT_DOUBLE_EQ(result.best_so_far[i], best);
    }
}

TEST_F(PoolOptimizerTest, IterationRecordsMaskEvaluatedCandidates) {
    const auto pool = makePool(15, 3);
    const PoolOptimizer optimizer(PoolOptimizer::Config(4, 4, 2.0));
    const auto result = optimizer.run(pool, rng);

    for (const auto &record: result.iterations) {
        ASSERT_EQ(record.scores.size(), pool.size());
        ASSERT_EQ(record.posterior.size(), pool.size());
        EXPECT_GE(record.posterior.std_dev.minCoeff(), 0.0);
        EXPECT_TRUE(std::isfinite(record.objective_value));

        const auto evaluated_before = static_cast<size_t>(4 + record.iteration);
        double lowest_unmasked = std::numeric_limits<double>::infinity();
        for (Eigen::Index i = 0; i < pool.size(); ++i) {
            const bool masked = std::find(result.evaluated.begin(), result.evaluated.begin() + evaluated_before,
                                          i) != result.evaluated.begin() + evaluated_before;
            if (masked) {
                EXPECT_EQ(record.scores(i), -std::numeric_limits<double>::infinity());
            } else {
                lowest_unmasked = std::min(lowest_unmasked, record.scores(i));
                EXPECT_LE(record.scores(i), record.scores(record.selected));
            }
        }
        EXPECT_GT(lowest_unmasked, -std::numeric_limits<double>::infinity());
    }
}

TEST_F(PoolOptimizerTest, ConstantResponsesScoreOnlyThroughUncertainty) {
    const auto variable = makePool(12, 4);
    const PoolOptimizer::Pool pool(variable.features(), Eigen::VectorXd::Constant(12, 1.5));
    const PoolOptimizer optimizer(PoolOptimizer::Config(3, 4, 2.0));
    const auto result = optimizer.run(pool, rng);

    expectValidRun(result, pool, 7);
    for (const auto &record: result.iterations) {
        EXPECT_NEAR(record.hyperparameters.mean_constant, 0.0, 1e-9);
        for (Eigen::Index i = 0; i < pool.size(); ++i) {
            EXPECT_NEAR(record.posterior.mean(i), record.hyperparameters.mean_constant, 1e-9);
            if (std::isfinite(record.scores(i))) {
                EXPECT_NEAR(record.scores(i), record.posterior.mean(i) + 2.0 * record.posterior.std_dev(i), 1e-12);
            }
        }
    }
    EXPECT_THAT(result.best_so_far, ::testing::Each(1.5));
}

TEST_F(PoolOptimizerTest, ExhaustsPoolExactly) {
    const auto pool = makePool(8, 5);
    const PoolOptimizer optimizer(PoolOptimizer::Config(5, 3, 2.0));
    const auto result = optimizer.run(pool, rng);

    expectValidRun(result, pool, 8);
    std::vector<Eigen::Index> sorted = result.evaluated;
    std::sort(sorted.begin(), sorted.end());
    std::vector<Eigen::Index> expected(8);
    std::iota(expected.begin(), expected.end(), Eigen::Index{0});
    EXPECT_THAT(sorted, ElementsAreArray(expected));
    EXPECT_DOUBLE_EQ(result.best_so_far.back(), pool.responses().maxCoeff());
}

TEST_F(PoolOptimizerTest, SinglePointPoolWithoutBudget) {
    const PoolOptimizer::Pool pool(Eigen::MatrixXd::Constant(1, 2, 0.5), Eigen::VectorXd::Constant(1, -3.0));
    const PoolOptimizer optimizer(PoolOptimizer::Config(0, 1, 2.0));
    const auto result = optimizer.run(pool, rng);

    EXPECT_THAT(result.evaluated, ElementsAre(0));
    EXPECT_THAT(result.best_so_far, ElementsAre(-3.0));
    EXPECT_TRUE(result.iterations.empty());
}

TEST_F(PoolOptimizerTest, SameSeedGivesSameSequence) {
    const auto pool = makePool(20, 6);
    const PoolOptimizer optimizer(PoolOptimizer::Config(4, 4, 2.0));

    std::mt19937 first_rng{123};
    std::mt19937 second_rng{123};
    const auto first = optimizer.run(pool, first_rng);
    const auto second = optimizer.run(pool, second_rng);
    EXPECT_EQ(first.evaluated, second.evaluated);
    EXPECT_EQ(first.best_so_far, second.best_so_far);
}

TEST_F(PoolOptimizerTest, SupportsOtherStrategiesAndScalers) {
    const auto pool = makePool(16, 7);
    PoolOptimizer::Config config(4, 4, 2.0);
    config.strategy = optimization::Acquisition<>::Strategy::EI;
    config.input_scaling = scaling::ScalerType::MinMax;
    const auto result = PoolOptimizer(config).run(pool, rng);
    expectValidRun(result, pool, 8);
}

TEST_F(PoolOptimizerTest, ExceptionOnInvalidConfiguration) {
    EXPECT_THROW((void) PoolOptimizer(PoolOptimizer::Config(-1, 2, 2.0)), common::ConfigurationError);
    EXPECT_THROW((void) PoolOptimizer(PoolOptimizer::Config(2, 0, 2.0)), common::ConfigurationError);
    EXPECT_THROW((void) PoolOptimizer(PoolOptimizer::Config(2, 2, std::numeric_limits<double>::infinity())),
                 common::ConfigurationError);
    EXPECT_THROW((void) PoolOptimizer(PoolOptimizer::Config(2, 2, std::numeric_limits<double>::quiet_NaN())),
                 common::ConfigurationError);

    const auto pool = makePool(6, 8);
    EXPECT_THROW((void) PoolOptimizer(PoolOptimizer::Config(0, 7, 2.0)).run(pool, rng), common::ConfigurationError);
    EXPECT_THROW((void) PoolOptimizer(PoolOptimizer::Config(3, 4, 2.0)).run(pool, rng), common::ConfigurationError);
    EXPECT_THROW((void) PoolOptimizer(PoolOptimizer::Config(std::numeric_limits<int>::max(), 2, 2.0)).run(pool, rng),
                 common::ConfigurationError);
}

TEST(PoolOptimizerHelpersTest, MaskEvaluatedSetsNegativeInfinity) {
    Eigen::VectorXd scores(4);
    scores << 1.0, 2.0, 3.0, 4.0;
    const std::vector<bool> evaluated = {false, true, false, true};
    PoolOptimizer::maskEvaluated(scores, evaluated);

    EXPECT_DOUBLE_EQ(scores(0), 1.0);
    EXPECT_EQ(scores(1), -std::numeric_limits<double>::infinity());
    EXPECT_DOUBLE_EQ(scores(2), 3.0);
    EXPECT_EQ(scores(3), -std::numeric_limits<double>::infinity());
}

TEST(PoolOptimizerHelpersTest, SelectNextSkipsEvaluatedAndBreaksTiesLow) {
    Eigen::VectorXd scores(5);
    scores << 5.0, 2.0, 7.0, 7.0, 1.0;
    EXPECT_EQ(PoolOptimizer::selectNext(scores, {false, false, false, false, false}), 2);
    EXPECT_EQ(PoolOptimizer::selectNext(scores, {false, false, true, false, false}), 3);
    EXPECT_EQ(PoolOptimizer::selectNext(scores, {false, false, true, true, false}), 0);
}

TEST(PoolOptimizerHelpersTest, SelectNextIgnoresScoresOfEvaluatedCandidates) {
    // The mask decides, not the score value
    Eigen::VectorXd scores(3);
    scores << std::numeric_limits<double>::infinity(), -std::numeric_limits<double>::infinity(), 0.0;
    EXPECT_EQ(PoolOptimizer::selectNext(scores, {true, false, false}), 2);
    EXPECT_EQ(PoolOptimizer::selectNext(scores, {true, false, true}), 1);
}

TEST(PoolOptimizerHelpersTest, SelectNextPrefersNumbersOverNaN) {
    Eigen::VectorXd scores(3);
    scores << std::numeric_limits<double>::quiet_NaN(), -1.0, -2.0;
    EXPECT_EQ(PoolOptimizer::selectNext(scores, {false, false, false}), 1);
}

TEST(PoolOptimizerHelpersTest, SelectNextOnExhaustedPool) {
    const Eigen::VectorXd scores = Eigen::VectorXd::Ones(2);
    EXPECT_FALSE(PoolOptimizer::selectNext(scores, {true, true}).has_value());
    EXPECT_THROW((void) PoolOptimizer::selectNext(scores, {true}), std::invalid_argument);
}

TEST(PoolOptimizerHelpersTest, BestSoFarTrace) {
    Eigen::VectorXd responses(4);
    responses << 0.5, -1.0, 2.0, 1.0;
    const PoolOptimizer::Pool pool(Eigen::MatrixXd::Zero(4, 1), responses);

    EXPECT_THAT(PoolOptimizer::bestSoFarTrace(pool, {1, 0, 3, 2}), ElementsAre(-1.0, 0.5, 1.0, 2.0));
    EXPECT_THROW((void) PoolOptimizer::bestSoFarTrace(pool, {4}), std::out_of_range);
}

TEST(CandidatePoolTest, ExceptionOnInvalidPool) {
    using Pool = PoolOptimizer::Pool;
    EXPECT_THROW((void) Pool(Eigen::MatrixXd(0, 2), Eigen::VectorXd(0)), common::ConfigurationError);
    EXPECT_THROW((void) Pool(Eigen::MatrixXd::Zero(3, 2), Eigen::VectorXd::Zero(2)), common::ConfigurationError);

    Eigen::MatrixXd features = Eigen::MatrixXd::Zero(2, 2);
    features(1, 1) = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW((void) Pool(features, Eigen::VectorXd::Zero(2)), common::ConfigurationError);
}
