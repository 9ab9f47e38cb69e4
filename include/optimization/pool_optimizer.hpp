// File: optimization/pool_optimizer.hpp

#ifndef POOL_OPTIMIZER_HPP
#define POOL_OPTIMIZER_HPP

#include <Eigen/Dense>
#include <optional>
#include <random>
#include <vector>

#include "optimization/acquisition.hpp"
#include "optimization/gaussian/gp.hpp"
#include "optimization/gaussian/likelihood.hpp"
#include "optimization/gaussian/posterior.hpp"
#include "scaling/scaler_factory.hpp"
#include "types/candidate_pool.hpp"

namespace optimization {

    /*
     * Sequential Bayesian optimization over a fixed candidate pool. Starting from a random subset, every iteration
     * fits a fresh GP to the evaluated candidates, scores the whole pool with the acquisition function and evaluates
     * the best-scoring candidate that has not been evaluated yet. Responses are maximized.
     */
    class PoolOptimizer {
    public:
        using Pool = types::CandidatePool<double>;
        using Surrogate = GaussianProcess<double>;

        struct Config {
            Config(int op_budget, int n_initial, double epsilon);

            int op_budget; // iterations after the initial sample
            int n_initial;
            double epsilon; // UCB exploration weight

            scaling::ScalerType input_scaling = scaling::ScalerType::Standard;
            Acquisition<double>::Strategy strategy = Acquisition<double>::Strategy::UCB;
            GaussianLikelihood<double> likelihood{};
            Surrogate::Options surrogate{};
        };

        struct IterationRecord {
            int iteration;
            Eigen::Index selected;
            Posterior<double> posterior;
            Eigen::VectorXd scores; // after masking
            Surrogate::Hyperparameters hyperparameters;
            double objective_value;
        };

        struct Result {
            std::vector<Eigen::Index> evaluated;
            std::vector<double> best_so_far;
            std::vector<IterationRecord> iterations;
        };

        explicit PoolOptimizer(Config config);

        // Throws common::ConfigurationError when the budget does not fit the pool and common::NumericalError when a
        // surrogate cannot be fitted.
        [[nodiscard]] Result run(const Pool &pool, std::mt19937 &rng) const;

        [[nodiscard]] const Config &config() const noexcept { return config_; }

        // Sets the score of every evaluated candidate to -infinity
        static void maskEvaluated(Eigen::VectorXd &scores, const std::vector<bool> &evaluated);

        // Highest-scoring unevaluated candidate, lowest index on ties. NaN scores lose to any number.
        [[nodiscard]] static std::optional<Eigen::Index> selectNext(const Eigen::VectorXd &scores,
                                                                    const std::vector<bool> &evaluated);

        // Running maximum of the responses in evaluation order
        [[nodiscard]] static std::vector<double> bestSoFarTrace(const Pool &pool,
                                                                const std::vector<Eigen::Index> &evaluated);

    private:
        Config config_;

        void validate(const Pool &pool) const;

        [[nodiscard]] std::vector<Eigen::Index> initialSample(Eigen::Index pool_size, std::mt19937 &rng) const;
    };

} // namespace optimization

#endif // POOL_OPTIMIZER_HPP
