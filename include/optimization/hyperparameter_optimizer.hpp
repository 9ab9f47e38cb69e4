// File: optimization/hyperparameter_optimizer.hpp

#ifndef HYPERPARAMETER_OPTIMIZER_HPP
#define HYPERPARAMETER_OPTIMIZER_HPP

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <random>
#include <stdexcept>

#include "common/logging/logger.hpp"
#include "optimization/gaussian/likelihood.hpp"
#include "optimization/gaussian/regularized_cholesky.hpp"
#include "optimization/kernel/matern_52.hpp"
#include "optimization/optimizer/lbfgs.hpp"
#include "types/concepts.hpp"

namespace optimization {

    /*
     * Fits the hyperparameters of a constant-mean GP by minimizing the negative log marginal likelihood minus the
     * log noise prior, divided by the number of observations. Parameters are packed as
     *   [c, log(theta_1), ..., log(theta_P), log(v)]
     * where c is the constant mean, theta the kernel parameters and v the noise variance. The last kernel parameter
     * is taken to be the output scale and gets its own bounds.
     */
    template<FloatingPoint T = double, IsKernel<T> KernelType = kernel::Matern52<T>>
    class HyperparameterOptimizer {
    public:
        using VectorType = Eigen::Matrix<T, Eigen::Dynamic, 1>;
        using MatrixType = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;

        struct Options {
            int restarts = 2;
            T jitter = 1e-8;
            T max_jitter = 1e-4;
            T min_length_scale = 1e-3;
            T max_length_scale = 1e3;
            T min_output_scale = 1e-4;
            T max_output_scale = 1e2;
            typename LBFGSOptimizer<T>::Options lbfgs{};
        };

        struct Result {
            VectorType parameters;
            T value;
            bool converged;
        };

        HyperparameterOptimizer(const MatrixType &X, const VectorType &y, const KernelType &kernel,
                                const GaussianLikelihood<T> &likelihood, const Options &options = Options{}) :
            X_(X), y_(y), kernel_(kernel), likelihood_(likelihood), options_(options) {
            if (X_.rows() == 0 || X_.rows() != y_.size()) {
                LOG_ERROR("Invalid training data: X has {} rows, y has {} entries", X_.rows(), y_.size());
                throw std::invalid_argument("Training inputs and targets must be non-empty and of equal length.");
            }
            if (options_.restarts < 0 || !(options_.jitter > 0) || options_.max_jitter < options_.jitter) {
                LOG_ERROR("Invalid hyperparameter optimizer options: restarts={}, jitter={}, max_jitter={}",
                          options_.restarts, options_.jitter, options_.max_jitter);
                throw std::invalid_argument("Invalid hyperparameter optimizer options.");
            }
        }

        [[nodiscard]] int parameterCount() const { return kernel_.getParameterCount() + 2; }

        // Mean of the targets, the current kernel parameters and the likelihood's initial noise
        [[nodiscard]] VectorType initialParameters() const {
            VectorType packed(parameterCount());
            packed(0) = y_.mean();
            packed.segment(1, kernel_.getParameterCount()) = kernel_.getParameters().array().log().matrix();
            packed(packed.size() - 1) = std::log(likelihood_.initialNoise());
            return project(packed);
        }

        [[nodiscard]] VectorType lowerBounds() const {
            VectorType lower(parameterCount());
            lower(0) = -std::numeric_limits<T>::infinity();
            lower.segment(1, kernel_.getParameterCount()).setConstant(std::log(options_.min_length_scale));
            lower(kernelParameterEnd() - 1) = std::log(options_.min_output_scale);
            lower(lower.size() - 1) = std::log(likelihood_.minNoise());
            return lower;
        }

        [[nodiscard]] VectorType upperBounds() const {
            VectorType upper(parameterCount());
            upper(0) = std::numeric_limits<T>::infinity();
            upper.segment(1, kernel_.getParameterCount()).setConstant(std::log(options_.max_length_scale));
            upper(kernelParameterEnd() - 1) = std::log(options_.max_output_scale);
            upper(upper.size() - 1) = std::log(likelihood_.maxNoise());
            return upper;
        }

        // Objective value at packed parameters; fills the gradient when one is given.
        // Returns +inf when the covariance cannot be factorized.
        [[nodiscard]] T evaluate(const VectorType &packed, VectorType *gradient = nullptr) const {
            if (packed.size() != parameterCount()) {
                LOG_ERROR("Expected {} packed hyperparameters, received {}", parameterCount(), packed.size());
                throw std::invalid_argument("Packed hyperparameter vector has the wrong size.");
            }
            if (!packed.allFinite()) {
                return std::numeric_limits<T>::infinity();
            }

            const auto n = static_cast<T>(X_.rows());
            const int kernel_parameters = kernel_.getParameterCount();
            const T mean_constant = packed(0);
            const T noise = std::exp(packed(packed.size() - 1));

            const VectorType theta = packed.segment(1, kernel_parameters).array().exp().matrix();
            if (!theta.allFinite() || !(theta.array() > T(0)).all() || !std::isfinite(noise)) {
                return std::numeric_limits<T>::infinity();
            }

            KernelType kernel = kernel_;
            kernel.setParameters(theta);

            MatrixType K = kernel.computeGramMatrix(X_);
            K.diagonal().array() += noise;

            const auto factor = regularizedCholesky<T>(K, options_.jitter, options_.max_jitter);
            if (!factor) {
                return std::numeric_limits<T>::infinity();
            }

            const VectorType residual = (y_.array() - mean_constant).matrix();
            const VectorType alpha = factor->llt.solve(residual);
            const T log_det = T(2) * factor->llt.matrixLLT().diagonal().array().log().sum();
            const T nlml = T(0.5) * residual.dot(alpha) + T(0.5) * log_det +
                           T(0.5) * n * std::log(T(2) * std::numbers::pi_v<T>);
            const T value = (nlml - likelihood_.logPrior(noise)) / n;

            if (!std::isfinite(value)) {
                return std::numeric_limits<T>::infinity();
            }

            if (gradient != nullptr) {
                // dNLML/dtheta = 0.5 * tr(W dK/dtheta) with W = K^-1 - alpha alpha^T
                const MatrixType W =
                        factor->llt.solve(MatrixType::Identity(X_.rows(), X_.rows())) - alpha * alpha.transpose();

                gradient->resize(parameterCount());
                (*gradient)(0) = -alpha.sum();
                for (int i = 0; i < kernel_parameters; ++i) {
                    (*gradient)(1 + i) = T(0.5) * W.cwiseProduct(kernel.computeLogGradientMatrix(X_, i)).sum();
                }
                (*gradient)(parameterCount() - 1) =
                        T(0.5) * noise * W.trace() - likelihood_.logPriorLogGradient(noise);
                *gradient /= n;
            }

            return value;
        }

        // Runs L-BFGS from the initial parameters and from `restarts` random starting points drawn from rng,
        // keeping the lowest objective.
        [[nodiscard]] Result optimize(std::mt19937 &rng) const {
            const LBFGSOptimizer<T> lbfgs(options_.lbfgs);
            const VectorType lower = lowerBounds();
            const VectorType upper = upperBounds();

            const auto objective = [this](const VectorType &x, VectorType &grad) { return evaluate(x, &grad); };

            Result best{initialParameters(), std::numeric_limits<T>::infinity(), false};
            for (int restart = 0; restart <= options_.restarts; ++restart) {
                const VectorType start = restart == 0 ? initialParameters() : randomParameters(rng);
                const auto result = lbfgs.optimize(start, objective, lower, upper);
                LOG_DEBUG("Hyperparameter restart {}/{}: objective = {}, converged = {}", restart + 1,
                          options_.restarts + 1, result.value, result.converged);

                if (result.value < best.value) {
                    best = {result.x, result.value, result.converged};
                }
            }

            if (!std::isfinite(best.value)) {
                LOG_WARN("Hyperparameter optimization found no point with a finite objective");
            } else if (!best.converged) {
                LOG_DEBUG("Best hyperparameters did not meet the convergence tolerance, objective = {}", best.value);
            }
            return best;
        }

        [[nodiscard]] const Options &options() const noexcept { return options_; }

    private:
        MatrixType X_;
        VectorType y_;
        KernelType kernel_;
        GaussianLikelihood<T> likelihood_;
        Options options_;

        // Index one past the last kernel parameter, the output scale sits right before it
        [[nodiscard]] int kernelParameterEnd() const { return 1 + kernel_.getParameterCount(); }

        [[nodiscard]] VectorType project(const VectorType &packed) const {
            return packed.cwiseMax(lowerBounds()).cwiseMin(upperBounds());
        }

        // Log-uniform draws over a moderate range, the constant mean always starts at the target mean
        [[nodiscard]] VectorType randomParameters(std::mt19937 &rng) const {
            std::uniform_real_distribution<T> kernel_dist(std::log(T(0.1)), std::log(T(10)));
            std::uniform_real_distribution<T> noise_dist(std::log(T(1e-4)), std::log(T(1e-1)));

            VectorType packed(parameterCount());
            packed(0) = y_.mean();
            for (int i = 1; i < kernelParameterEnd(); ++i) {
                packed(i) = kernel_dist(rng);
            }
            packed(packed.size() - 1) = noise_dist(rng);
            return project(packed);
        }
    };

} // namespace optimization

#endif // HYPERPARAMETER_OPTIMIZER_HPP
