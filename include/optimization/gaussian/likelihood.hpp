// File: optimization/gaussian/likelihood.hpp

#ifndef OPTIMIZATION_GAUSSIAN_LIKELIHOOD_HPP
#define OPTIMIZATION_GAUSSIAN_LIKELIHOOD_HPP

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

#include "common/logging/logger.hpp"
#include "types/concepts.hpp"

namespace optimization {

    /*
     * Homoscedastic Gaussian observation noise y = f(x) + e, e ~ N(0, v), with a half-normal prior on the noise
     * variance v that keeps the inferred noise small when only a handful of observations exist:
     *   log p(v) = log(sqrt(2) / (s * sqrt(pi))) - v^2 / (2 s^2),  v >= 0
     */
    template<FloatingPoint T = double>
    class GaussianLikelihood {
    public:
        explicit GaussianLikelihood(T prior_scale = 0.01, T min_noise = 1e-6, T max_noise = 10.0) :
            prior_scale_(prior_scale), min_noise_(min_noise), max_noise_(max_noise) {
            if (!(prior_scale_ > 0) || !std::isfinite(prior_scale_)) {
                LOG_ERROR("Noise prior scale must be positive and finite, received {}", prior_scale_);
                throw std::invalid_argument("Noise prior scale must be positive and finite.");
            }
            if (!(min_noise_ > 0) || !(max_noise_ > min_noise_)) {
                LOG_ERROR("Invalid noise bounds [{}, {}]", min_noise_, max_noise_);
                throw std::invalid_argument("Noise bounds must satisfy 0 < min < max.");
            }
        }

        [[nodiscard]] T logPrior(const T noise_variance) const {
            return std::log(std::numbers::sqrt2_v<T> / (prior_scale_ * std::sqrt(std::numbers::pi_v<T>))) -
                   noise_variance * noise_variance / (T(2) * prior_scale_ * prior_scale_);
        }

        // d log p(v) / d log(v)
        [[nodiscard]] T logPriorLogGradient(const T noise_variance) const {
            return -noise_variance * noise_variance / (prior_scale_ * prior_scale_);
        }

        // Starting value for the hyperparameter search: the prior scale, kept within bounds
        [[nodiscard]] T initialNoise() const { return std::clamp(prior_scale_, min_noise_, max_noise_); }

        [[nodiscard]] T priorScale() const noexcept { return prior_scale_; }
        [[nodiscard]] T minNoise() const noexcept { return min_noise_; }
        [[nodiscard]] T maxNoise() const noexcept { return max_noise_; }

    private:
        T prior_scale_;
        T min_noise_;
        T max_noise_;
    };

} // namespace optimization

#endif // OPTIMIZATION_GAUSSIAN_LIKELIHOOD_HPP
