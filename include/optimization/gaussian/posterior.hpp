// File: optimization/gaussian/posterior.hpp

#ifndef OPTIMIZATION_POSTERIOR_HPP
#define OPTIMIZATION_POSTERIOR_HPP

#include <Eigen/Core>

#include "types/concepts.hpp"

namespace optimization {

    // Marginal Gaussian posterior of the latent function at a set of query points
    template<FloatingPoint T = double>
    struct Posterior {
        Eigen::Matrix<T, Eigen::Dynamic, 1> mean;
        Eigen::Matrix<T, Eigen::Dynamic, 1> std_dev;

        [[nodiscard]] Eigen::Index size() const noexcept { return mean.size(); }
    };

} // namespace optimization

#endif // OPTIMIZATION_POSTERIOR_HPP
