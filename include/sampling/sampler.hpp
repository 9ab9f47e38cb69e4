// File: sampling/sampler.hpp

#ifndef SAMPLING_SAMPLER_HPP
#define SAMPLING_SAMPLER_HPP

#include <Eigen/Dense>
#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>

#include "common/logging/logger.hpp"
#include "types/concepts.hpp"

namespace sampling {

    // Draws points inside an axis-aligned box. Samples are returned one per row.
    template<FloatingPoint T = double>
    class Sampler {
    public:
        using MatrixType = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;
        using VectorType = Eigen::Matrix<T, Eigen::Dynamic, 1>;

        Sampler(const std::vector<T> &lower_bounds, const std::vector<T> &upper_bounds) :
            lower_bounds_(lower_bounds), upper_bounds_(upper_bounds), dimensions_(lower_bounds.size()) {
            if (lower_bounds_.empty() || lower_bounds_.size() != upper_bounds_.size()) {
                LOG_ERROR("Invalid bounds: {} lower and {} upper bounds", lower_bounds_.size(), upper_bounds_.size());
                throw std::invalid_argument("Lower and upper bounds must be non-empty and of the same size.");
            }
            for (size_t i = 0; i < dimensions_; ++i) {
                if (!std::isfinite(lower_bounds_[i]) || !std::isfinite(upper_bounds_[i]) ||
                    lower_bounds_[i] >= upper_bounds_[i]) {
                    LOG_ERROR("Invalid bounds at index {}: [{}, {}]", i, lower_bounds_[i], upper_bounds_[i]);
                    throw std::invalid_argument("Each lower bound must be finite and below its upper bound.");
                }
            }
        }

        virtual ~Sampler() = default;

        [[nodiscard]] virtual MatrixType generate(size_t num_samples, std::mt19937 &rng) const = 0;

        [[nodiscard]] size_t dimensions() const noexcept { return dimensions_; }

    protected:
        std::vector<T> lower_bounds_;
        std::vector<T> upper_bounds_;
        size_t dimensions_;

        // Maps a point of the unit hypercube into the bounds
        [[nodiscard]] VectorType mapToBounds(const VectorType &point) const {
            VectorType mapped_point(dimensions_);
            for (size_t i = 0; i < dimensions_; ++i) {
                mapped_point(i) = lower_bounds_[i] + point(i) * (upper_bounds_[i] - lower_bounds_[i]);
            }
            return mapped_point;
        }
    };

} // namespace sampling

#endif // SAMPLING_SAMPLER_HPP
