// File: executor.cpp

#include "executor.hpp"

#include <utility>

#include "benchmark/objective_functions.hpp"
#include "common/logging/logger.hpp"
#include "sampling/sampler/lhs.hpp"

optimization::PoolOptimizer::Result Executor::execute(const config::RunSettings &settings) {
    LOG_INFO("Starting pool optimization run with seed {}", settings.seed);
    std::mt19937 rng(settings.seed);

    const auto pool = buildPool(settings.pool, rng);
    const optimization::PoolOptimizer optimizer(settings.optimizer);
    auto result = optimizer.run(pool, rng);

    const auto &last = result.evaluated.back();
    LOG_INFO("Evaluated candidates: [{}]", fmt::join(result.evaluated, ", "));
    LOG_INFO("Best so far: [{}]", fmt::join(result.best_so_far, ", "));
    LOG_INFO("Best response {} (pool maximum {}), last evaluated candidate {} at {}", result.best_so_far.back(),
             pool.responses().maxCoeff(), last, Eigen::VectorXd(pool.features().row(last).transpose()));
    return result;
}

types::CandidatePool<> Executor::buildPool(const config::PoolSettings &settings, std::mt19937 &rng) {
    const auto function = benchmark::makeBenchmark(settings.function, settings.dimensions);
    const sampling::LHSSampler<> sampler(function.lower_bounds, function.upper_bounds);

    Eigen::MatrixXd features = sampler.generate(static_cast<size_t>(settings.size), rng);
    Eigen::VectorXd responses = function.evaluate(features);
    LOG_INFO("Built a pool of {} '{}' candidates in {} dimensions", settings.size, function.name, settings.dimensions);
    return {std::move(features), std::move(responses)};
}
