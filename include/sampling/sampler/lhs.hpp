// File: sampling/sampler/lhs.hpp

#ifndef SAMPLING_LHS_SAMPLER_HPP
#define SAMPLING_LHS_SAMPLER_HPP

#include <Eigen/Dense>
#include <algorithm>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>

#include "common/logging/logger.hpp"
#include "sampling/sampler.hpp"

namespace sampling {

    // Latin hypercube: along every dimension each of the num_samples equal-width strata holds exactly one sample.
    template<FloatingPoint T = double>
    class LHSSampler final : public Sampler<T> {
    public:
        using typename Sampler<T>::MatrixType;
        using typename Sampler<T>::VectorType;

        using Sampler<T>::Sampler;

        [[nodiscard]] MatrixType generate(const size_t num_samples, std::mt19937 &rng) const override {
            if (num_samples == 0) {
                LOG_ERROR("Invalid number of samples: Number of samples must be greater than zero.");
                throw std::invalid_argument("Number of samples must be greater than zero.");
            }

            MatrixType unit(num_samples, this->dimensions_);
            std::uniform_real_distribution<T> dist(0.0, 1.0);

            for (size_t i = 0; i < this->dimensions_; ++i) {
                std::vector<size_t> strata(num_samples);
                std::iota(strata.begin(), strata.end(), 0);
                std::ranges::shuffle(strata, rng);

                for (size_t j = 0; j < num_samples; ++j) {
                    const T interval_start = static_cast<T>(strata[j]) / static_cast<T>(num_samples);
                    const T interval_end = static_cast<T>(strata[j] + 1) / static_cast<T>(num_samples);
                    unit(j, i) = dist(rng) * (interval_end - interval_start) + interval_start;
                }
            }

            MatrixType samples(num_samples, this->dimensions_);
            for (size_t j = 0; j < num_samples; ++j) {
                samples.row(j) = this->mapToBounds(unit.row(j).transpose()).transpose();
            }
            LOG_DEBUG("Generated {} Latin hypercube samples in {} dimensions", num_samples, this->dimensions_);
            return samples;
        }
    };

} // namespace sampling

#endif // SAMPLING_LHS_SAMPLER_HPP
