// tests/optimization/optimizer/lbfgs_test.cpp

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "optimization/optimizer/lbfgs.hpp"

using optimization::LBFGSOptimizer;

class LBFGSOptimizerTest : public ::testing::Test {
protected:
    using VectorT = LBFGSOptimizer<>::VectorT;

    LBFGSOptimizer<> optimizer;

    static VectorT unbounded(const Eigen::Index size, const double sign) {
        return VectorT::Constant(size, sign * std::numeric_limits<double>::infinity());
    }

    // f(x, y) = (1 - x)^2 + 100 (y - x^2)^2
    static double rosenbrock(const VectorT &x, VectorT &grad) {
        const double a = 1.0 - x(0);
        const double b = x(1) - x(0) * x(0);
        grad.resize(2);
        grad(0) = -2.0 * a - 400.0 * x(0) * b;
        grad(1) = 200.0 * b;
        return a * a + 100.0 * b * b;
    }
};

TEST_F(LBFGSOptimizerTest, MinimizesQuadratic) {
    VectorT target(3);
    target << 1.0, -2.0, 0.5;
    const auto objective = [&target](const VectorT &x, VectorT &grad) {
        grad = 2.0 * (x - target);
        return (x - target).squaredNorm();
    };

    const auto result = optimizer.optimize(VectorT::Zero(3), objective, unbounded(3, -1), unbounded(3, 1));
    EXPECT_TRUE(result.converged);
    EXPECT_LT((result.x - target).norm(), 1e-4);
    EXPECT_NEAR(result.value, 0.0, 1e-8);
}

TEST_F(LBFGSOptimizerTest, MinimizesRosenbrock) {
    LBFGSOptimizer<>::Options options;
    options.max_iterations = 500;
    options.gradient_tolerance = 1e-8;
    const LBFGSOptimizer<> precise(options);

    VectorT start(2);
    start << -1.2, 1.0;
    const auto result = precise.optimize(start, rosenbrock, unbounded(2, -1), unbounded(2, 1));
    EXPECT_NEAR(result.x(0), 1.0, 1e-3);
    EXPECT_NEAR(result.x(1), 1.0, 1e-3);
}

TEST_F(LBFGSOptimizerTest, RespectsBounds) {
    // Unconstrained minimum at (3, -3), box [0, 1] x [-1, 0]
    const auto objective = [](const VectorT &x, VectorT &grad) {
        grad.resize(2);
        grad(0) = 2.0 * (x(0) - 3.0);
        grad(1) = 2.0 * (x(1) + 3.0);
        return std::pow(x(0) - 3.0, 2) + std::pow(x(1) + 3.0, 2);
    };
    VectorT lower(2), upper(2);
    lower << 0.0, -1.0;
    upper << 1.0, 0.0;

    const auto result = optimizer.optimize(VectorT::Constant(2, 0.5), objective, lower, upper);
    EXPECT_TRUE(result.converged);
    EXPECT_NEAR(result.x(0), 1.0, 1e-10);
    EXPECT_NEAR(result.x(1), -1.0, 1e-10);
}

TEST_F(LBFGSOptimizerTest, StartingPointIsProjectedIntoBounds) {
    const auto objective = [](const VectorT &x, VectorT &grad) {
        grad = 2.0 * x;
        return x.squaredNorm();
    };
    const auto result = optimizer.optimize(VectorT::Constant(1, 10.0), objective, VectorT::Constant(1, 2.0),
                                           VectorT::Constant(1, 5.0));
    EXPECT_NEAR(result.x(0), 2.0, 1e-12);
    EXPECT_NEAR(result.value, 4.0, 1e-12);
}

TEST_F(LBFGSOptimizerTest, IterationBudgetKeepsBestPoint) {
    LBFGSOptimizer<>::Options options;
    options.max_iterations = 2;
    const LBFGSOptimizer<> short_run(options);

    VectorT start(2);
    start << -1.2, 1.0;
    VectorT grad;
    const double initial = rosenbrock(start, grad);
    const auto result = short_run.optimize(start, rosenbrock, unbounded(2, -1), unbounded(2, 1));
    EXPECT_FALSE(result.converged);
    EXPECT_LE(result.iterations, 2);
    EXPECT_LT(result.value, initial);
}

TEST_F(LBFGSOptimizerTest, NonFiniteStartIsReported) {
    const auto objective = [](const VectorT &x, VectorT &grad) {
        grad = VectorT::Zero(x.size());
        return std::numeric_limits<double>::infinity();
    };
    const auto result = optimizer.optimize(VectorT::Zero(2), objective, unbounded(2, -1), unbounded(2, 1));
    EXPECT_FALSE(result.converged);
    EXPECT_TRUE(std::isinf(result.value));
}

TEST_F(LBFGSOptimizerTest, ExceptionOnMismatchedBounds) {
    const auto objective = [](const VectorT &x, VectorT &grad) {
        grad = x;
        return 0.5 * x.squaredNorm();
    };
    EXPECT_THROW((void) optimizer.optimize(VectorT::Zero(2), objective, VectorT::Zero(3), VectorT::Ones(2)),
                 std::invalid_argument);
    EXPECT_THROW((void) optimizer.optimize(VectorT::Zero(1), objective, VectorT::Ones(1), VectorT::Zero(1)),
                 std::invalid_argument);
}

TEST(LBFGSOptionsTest, ExceptionOnInvalidOptions) {
    LBFGSOptimizer<>::Options options;
    options.memory_size = 0;
    EXPECT_THROW(LBFGSOptimizer<>{options}, std::invalid_argument);
}
