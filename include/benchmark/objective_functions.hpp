// File: benchmark/objective_functions.hpp

#ifndef BENCHMARK_OBJECTIVE_FUNCTIONS_HPP
#define BENCHMARK_OBJECTIVE_FUNCTIONS_HPP

#include <Eigen/Dense>
#include <cmath>
#include <functional>
#include <numbers>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/exceptions.hpp"
#include "common/logging/logger.hpp"

namespace benchmark {

    // Test functions negated so that the optimum is a maximum

    // Branin on [-5, 10] x [0, 15]; maximum -0.397887 at (-pi, 12.275), (pi, 2.275) and (9.42478, 2.475)
    [[nodiscard]] inline double negatedBranin(const Eigen::VectorXd &x) {
        if (x.size() != 2) {
            LOG_ERROR("Branin is two-dimensional, received a point of dimension {}", x.size());
            throw std::invalid_argument("Branin requires a two-dimensional point.");
        }
        constexpr double pi = std::numbers::pi;
        constexpr double b = 5.1 / (4.0 * pi * pi);
        constexpr double c = 5.0 / pi;
        constexpr double t = 1.0 / (8.0 * pi);
        const double term = x(1) - b * x(0) * x(0) + c * x(0) - 6.0;
        return -(term * term + 10.0 * (1.0 - t) * std::cos(x(0)) + 10.0);
    }

    // Sphere, maximum 0 at the origin
    [[nodiscard]] inline double negatedSphere(const Eigen::VectorXd &x) { return -x.squaredNorm(); }

    struct BenchmarkFunction {
        std::string name;
        std::function<double(const Eigen::VectorXd &)> function;
        std::vector<double> lower_bounds;
        std::vector<double> upper_bounds;

        // One response per row of points
        [[nodiscard]] Eigen::VectorXd evaluate(const Eigen::MatrixXd &points) const {
            Eigen::VectorXd responses(points.rows());
            for (Eigen::Index i = 0; i < points.rows(); ++i) {
                responses(i) = function(points.row(i).transpose());
            }
            return responses;
        }
    };

    // "branin" (dimensions must be 2) or "sphere" on [-5.12, 5.12]^dimensions
    [[nodiscard]] inline BenchmarkFunction makeBenchmark(const std::string &name, const int dimensions) {
        if (name == "branin") {
            if (dimensions != 2) {
                LOG_ERROR("Branin is two-dimensional, requested {} dimensions", dimensions);
                throw common::ConfigurationError("Branin benchmark requires exactly two dimensions.");
            }
            return {name, negatedBranin, {-5.0, 0.0}, {10.0, 15.0}};
        }
        if (name == "sphere") {
            if (dimensions < 1) {
                LOG_ERROR("Sphere benchmark requires at least one dimension, requested {}", dimensions);
                throw common::ConfigurationError("Sphere benchmark requires at least one dimension.");
            }
            return {name, negatedSphere, std::vector<double>(static_cast<size_t>(dimensions), -5.12),
                    std::vector<double>(static_cast<size_t>(dimensions), 5.12)};
        }
        LOG_ERROR("Unknown benchmark function '{}', expected 'branin' or 'sphere'", name);
        throw common::ConfigurationError("Unknown benchmark function: " + name);
    }

} // namespace benchmark

#endif // BENCHMARK_OBJECTIVE_FUNCTIONS_HPP
