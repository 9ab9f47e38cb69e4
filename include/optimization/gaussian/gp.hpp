// File: optimization/gaussian/gp.hpp

#ifndef OPTIMIZATION_GAUSSIAN_PROCESS_HPP
#define OPTIMIZATION_GAUSSIAN_PROCESS_HPP

#include <Eigen/Dense>
#include <cmath>
#include <concepts>
#include <numbers>
#include <random>
#include <stdexcept>

#include "common/exceptions.hpp"
#include "common/logging/logger.hpp"
#include "optimization/gaussian/likelihood.hpp"
#include "optimization/gaussian/posterior.hpp"
#include "optimization/gaussian/regularized_cholesky.hpp"
#include "optimization/hyperparameter_optimizer.hpp"
#include "optimization/kernel/matern_52.hpp"
#include "types/concepts.hpp"

namespace optimization {

    /*
     * Exact Gaussian process regression with a constant mean, a stationary kernel and Gaussian noise.
     * A model is built for one training set, fitted once and then only queried; new observations mean a new model.
     */
    template<FloatingPoint T = double, IsKernel<T> KernelType = kernel::Matern52<T>>
    class GaussianProcess {
    public:
        using VectorType = Eigen::Matrix<T, Eigen::Dynamic, 1>;
        using MatrixType = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;
        using Options = typename HyperparameterOptimizer<T, KernelType>::Options;

        // Minimum posterior variance, keeps the standard deviation strictly positive
        static constexpr T min_variance = 1e-10;

        struct Hyperparameters {
            T mean_constant;
            VectorType kernel_parameters;
            T noise_variance;
        };

        GaussianProcess(const MatrixType &X, const VectorType &y, const KernelType &kernel,
                        const GaussianLikelihood<T> &likelihood, const Options &options, std::mt19937 &rng) :
            X_(X), y_(y), kernel_(kernel), likelihood_(likelihood), options_(options), rng_(rng) {
            if (X_.rows() == 0 || X_.cols() == 0) {
                LOG_ERROR("Gaussian process requires training data, received {}x{} inputs", X_.rows(), X_.cols());
                throw std::invalid_argument("Training inputs must be non-empty.");
            }
            if (X_.rows() != y_.size()) {
                LOG_ERROR("Mismatch between number of input points ({}) and target values ({})", X_.rows(),
                          y_.size());
                throw std::invalid_argument("Number of input points must match number of target values.");
            }
            if (!X_.allFinite() || !y_.allFinite()) {
                LOG_ERROR("Gaussian process training data contains non-finite values");
                throw std::invalid_argument("Training data must be finite.");
            }
        }

        // Default Matern 5/2 kernel with every length scale and the output scale starting at ln 2
        GaussianProcess(const MatrixType &X, const VectorType &y, const GaussianLikelihood<T> &likelihood,
                        const Options &options, std::mt19937 &rng)
            requires std::constructible_from<KernelType, int, T, T>
            : GaussianProcess(X, y, KernelType(static_cast<int>(X.cols()), std::numbers::ln2_v<T>,
                                               std::numbers::ln2_v<T>),
                              likelihood, options, rng) {}

        // Fits the hyperparameters and factorizes the training covariance. Throws common::NumericalError when the
        // covariance stays indefinite at the maximum jitter.
        void fit() {
            if (fitted_) {
                LOG_ERROR("Gaussian process is already fitted");
                throw std::logic_error("Gaussian process is already fitted; build a new model for new data.");
            }

            const HyperparameterOptimizer<T, KernelType> optimizer(X_, y_, kernel_, likelihood_, options_);
            const auto result = optimizer.optimize(rng_);
            const VectorType &packed = result.parameters;

            mean_constant_ = packed(0);
            kernel_.setParameters(packed.segment(1, kernel_.getParameterCount()).array().exp().matrix());
            noise_variance_ = std::exp(packed(packed.size() - 1));

            MatrixType K = kernel_.computeGramMatrix(X_);
            K.diagonal().array() += noise_variance_;
            auto factor = regularizedCholesky<T>(K, options_.jitter, options_.max_jitter);
            if (!factor) {
                LOG_ERROR("Training covariance is not positive definite with jitter up to {}", options_.max_jitter);
                throw common::NumericalError("Cholesky factorization of the training covariance failed.");
            }

            llt_ = std::move(factor->llt);
            alpha_ = llt_.solve((y_.array() - mean_constant_).matrix());
            objective_value_ = std::isfinite(result.value) ? result.value : optimizer.evaluate(packed);
            fitted_ = true;

            LOG_DEBUG("Fitted GP on {} points: mean = {}, kernel parameters = {}, noise = {}, objective = {}",
                      X_.rows(), mean_constant_, kernel_.getParameters(), noise_variance_, objective_value_);
        }

        // Posterior of the latent function at the rows of X_query
        [[nodiscard]] Posterior<T> predict(const MatrixType &X_query) const {
            if (!fitted_) {
                LOG_ERROR("Attempted prediction with an unfitted Gaussian process");
                throw std::runtime_error("Gaussian process must be fitted before prediction.");
            }
            if (X_query.cols() != X_.cols()) {
                LOG_ERROR("Query points have {} columns, training data has {}", X_query.cols(), X_.cols());
                throw std::invalid_argument("Query dimensionality does not match the training data.");
            }

            const MatrixType K_star = kernel_.computeGramMatrix(X_, X_query);
            const MatrixType V = llt_.matrixL().solve(K_star);

            Posterior<T> posterior;
            posterior.mean = (K_star.transpose() * alpha_).array() + mean_constant_;
            const VectorType variance =
                    (kernel_.getDiagonal() - V.colwise().squaredNorm().transpose().array()).max(min_variance).matrix();
            posterior.std_dev = variance.cwiseSqrt();
            return posterior;
        }

        [[nodiscard]] bool isFitted() const noexcept { return fitted_; }

        [[nodiscard]] Hyperparameters hyperparameters() const {
            requireFitted();
            return {mean_constant_, kernel_.getParameters(), noise_variance_};
        }

        [[nodiscard]] const KernelType &kernel() const {
            requireFitted();
            return kernel_;
        }

        // Normalized negative log posterior at the fitted hyperparameters
        [[nodiscard]] T objectiveValue() const {
            requireFitted();
            return objective_value_;
        }

        [[nodiscard]] Eigen::Index trainingSize() const noexcept { return X_.rows(); }

    private:
        MatrixType X_;
        VectorType y_;
        KernelType kernel_;
        GaussianLikelihood<T> likelihood_;
        Options options_;
        std::mt19937 &rng_;

        bool fitted_ = false;
        T mean_constant_ = 0;
        T noise_variance_ = 0;
        T objective_value_ = 0;
        Eigen::LLT<MatrixType> llt_;
        VectorType alpha_;

        void requireFitted() const {
            if (!fitted_) {
                LOG_ERROR("Gaussian process hyperparameters requested before fitting");
                throw std::runtime_error("Gaussian process is not fitted.");
            }
        }
    };

} // namespace optimization

#endif // OPTIMIZATION_GAUSSIAN_PROCESS_HPP
