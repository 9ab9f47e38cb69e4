// File: executor.hpp

#ifndef EXECUTOR_HPP
#define EXECUTOR_HPP

#include <random>

#include "config/run_settings.hpp"
#include "optimization/pool_optimizer.hpp"
#include "types/candidate_pool.hpp"

// Runs one benchmark optimization: samples a candidate pool, evaluates the benchmark on it and optimizes over it.
class Executor {
public:
    static optimization::PoolOptimizer::Result execute(const config::RunSettings &settings);

    // Latin hypercube pool inside the benchmark bounds, responses from the benchmark function
    static types::CandidatePool<> buildPool(const config::PoolSettings &settings, std::mt19937 &rng);

    Executor(const Executor &) = delete;
    Executor &operator=(const Executor &) = delete;
    Executor(Executor &&) = delete;
    Executor &operator=(Executor &&) = delete;
    ~Executor() = default;

    Executor() = delete;
};

#endif // EXECUTOR_HPP
