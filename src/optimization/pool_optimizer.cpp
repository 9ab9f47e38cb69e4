// File: optimization/pool_optimizer.cpp

#include "optimization/pool_optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>

#include "common/exceptions.hpp"
#include "common/logging/logger.hpp"
#include "scaling/standard_scaler.hpp"

namespace optimization {

    PoolOptimizer::Config::Config(const int op_budget, const int n_initial, const double epsilon) :
        op_budget(op_budget), n_initial(n_initial), epsilon(epsilon) {}

    PoolOptimizer::PoolOptimizer(Config config) : config_(std::move(config)) {
        if (config_.op_budget < 0) {
            LOG_ERROR("Optimization budget must be non-negative, received {}", config_.op_budget);
            throw common::ConfigurationError("Optimization budget must be non-negative.");
        }
        if (config_.n_initial < 1) {
            LOG_ERROR("At least one initial sample is required, received {}", config_.n_initial);
            throw common::ConfigurationError("Number of initial samples must be positive.");
        }
        if (!std::isfinite(config_.epsilon)) {
            LOG_ERROR("Exploration weight must be finite, received {}", config_.epsilon);
            throw common::ConfigurationError("Exploration weight must be finite.");
        }
    }

    PoolOptimizer::Result PoolOptimizer::run(const Pool &pool, std::mt19937 &rng) const {
        validate(pool);

        LOG_INFO("Starting pool optimization: {} candidates, {} dimensions, {} initial samples, budget {}",
                 pool.size(), pool.dimensions(), config_.n_initial, config_.op_budget);

        // Input statistics come from the whole pool and stay fixed for the run
        auto input_scaler = scaling::makeScaler<double>(config_.input_scaling);
        const Eigen::MatrixXd features = input_scaler->fitTransform(pool.features());

        const Acquisition<double> acquisition(config_.strategy, config_.epsilon);

        Result result;
        result.evaluated = initialSample(pool.size(), rng);
        std::vector<bool> evaluated(static_cast<size_t>(pool.size()), false);
        for (const auto index: result.evaluated) {
            evaluated[static_cast<size_t>(index)] = true;
        }
        LOG_DEBUG("Initial sample: [{}]", fmt::join(result.evaluated, ", "));

        for (int iteration = 0; iteration < config_.op_budget; ++iteration) {
            const auto rows = static_cast<Eigen::Index>(result.evaluated.size());
            Eigen::MatrixXd X(rows, pool.dimensions());
            Eigen::VectorXd y(rows);
            for (Eigen::Index i = 0; i < rows; ++i) {
                const auto index = result.evaluated[static_cast<size_t>(i)];
                X.row(i) = features.row(index);
                y(i) = pool.responses()(index);
            }

            scaling::StandardScaler<double> output_scaler;
            const Eigen::VectorXd y_scaled = output_scaler.fitTransform(y);

            Surrogate surrogate(X, y_scaled, config_.likelihood, config_.surrogate, rng);
            surrogate.fit();

            Posterior<double> posterior = surrogate.predict(features);
            Eigen::VectorXd scores = acquisition.score(posterior, y_scaled.maxCoeff());

            const auto next = selectNext(scores, evaluated);
            maskEvaluated(scores, evaluated);
            if (!next) {
                LOG_WARN("No unevaluated candidates left after {} iterations, stopping early", iteration);
                break;
            }

            evaluated[static_cast<size_t>(*next)] = true;
            result.evaluated.push_back(*next);
            LOG_INFO("Iteration {}/{}: selected candidate {} with score {} and response {}", iteration + 1,
                     config_.op_budget, *next, scores(*next), pool.responses()(*next));

            result.iterations.push_back({iteration, *next, std::move(posterior), std::move(scores),
                                         surrogate.hyperparameters(), surrogate.objectiveValue()});
        }

        result.best_so_far = bestSoFarTrace(pool, result.evaluated);
        LOG_INFO("Pool optimization finished with {} evaluations, best response {}", result.evaluated.size(),
                 result.best_so_far.back());
        return result;
    }

    void PoolOptimizer::maskEvaluated(Eigen::VectorXd &scores, const std::vector<bool> &evaluated) {
        if (static_cast<size_t>(scores.size()) != evaluated.size()) {
            LOG_ERROR("Score vector ({}) and evaluation mask ({}) sizes differ", scores.size(), evaluated.size());
            throw std::invalid_argument("Scores and evaluation mask must have the same size.");
        }
        for (Eigen::Index i = 0; i < scores.size(); ++i) {
            if (evaluated[static_cast<size_t>(i)]) {
                scores(i) = -std::numeric_limits<double>::infinity();
            }
        }
    }

    std::optional<Eigen::Index> PoolOptimizer::selectNext(const Eigen::VectorXd &scores,
                                                          const std::vector<bool> &evaluated) {
        if (static_cast<size_t>(scores.size()) != evaluated.size()) {
            LOG_ERROR("Score vector ({}) and evaluation mask ({}) sizes differ", scores.size(), evaluated.size());
            throw std::invalid_argument("Scores and evaluation mask must have the same size.");
        }

        std::optional<Eigen::Index> best;
        for (Eigen::Index i = 0; i < scores.size(); ++i) {
            if (evaluated[static_cast<size_t>(i)]) {
                continue;
            }
            if (!best || scores(i) > scores(*best) || (std::isnan(scores(*best)) && !std::isnan(scores(i)))) {
                best = i;
            }
        }
        return best;
    }

    std::vector<double> PoolOptimizer::bestSoFarTrace(const Pool &pool, const std::vector<Eigen::Index> &evaluated) {
        std::vector<double> trace;
        trace.reserve(evaluated.size());
        double best = -std::numeric_limits<double>::infinity();
        for (const auto index: evaluated) {
            if (index < 0 || index >= pool.size()) {
                LOG_ERROR("Evaluated index {} is outside the pool of size {}", index, pool.size());
                throw std::out_of_range("Evaluated index outside the candidate pool.");
            }
            best = std::max(best, pool.responses()(index));
            trace.push_back(best);
        }
        return trace;
    }

    void PoolOptimizer::validate(const Pool &pool) const {
        if (config_.n_initial > pool.size()) {
            LOG_ERROR("Initial sample size {} exceeds the pool size {}", config_.n_initial, pool.size());
            throw common::ConfigurationError("Initial sample size exceeds the candidate pool.");
        }
        if (static_cast<Eigen::Index>(config_.n_initial) + config_.op_budget > pool.size()) {
            LOG_ERROR("Initial samples ({}) plus budget ({}) exceed the pool size {}", config_.n_initial,
                      config_.op_budget, pool.size());
            throw common::ConfigurationError("Initial samples plus budget exceed the candidate pool.");
        }
    }

    std::vector<Eigen::Index> PoolOptimizer::initialSample(const Eigen::Index pool_size, std::mt19937 &rng) const {
        std::vector<Eigen::Index> indices(static_cast<size_t>(pool_size));
        std::iota(indices.begin(), indices.end(), Eigen::Index{0});
        std::shuffle(indices.begin(), indices.end(), rng);
        indices.resize(static_cast<size_t>(config_.n_initial));
        return indices;
    }

} // namespace optimization
