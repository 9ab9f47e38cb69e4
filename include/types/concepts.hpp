// File: types/concepts.hpp

#ifndef CONCEPTS_HPP
#define CONCEPTS_HPP

#include <Eigen/Core>
#include <concepts>
#include <string>
#include <type_traits>
#include <vector>

/*
 * Numeric Concepts
 */

template<typename T>
concept FloatingPoint = std::is_floating_point_v<T>;

/*
 * Model Concepts
 */

// A covariance function usable by optimization::GaussianProcess. Gradients are taken with respect to the
// logarithm of each parameter, which is how the hyperparameter optimizer moves through parameter space.
template<typename K, typename T>
concept IsKernel = FloatingPoint<T> && requires(K kernel, const K const_kernel,
                                                const Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic> &X,
                                                const Eigen::Matrix<T, Eigen::Dynamic, 1> &params, int index) {
    { const_kernel.computeGramMatrix(X, X) } -> std::convertible_to<Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>>;
    { const_kernel.computeGramMatrix(X) } -> std::convertible_to<Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>>;
    { const_kernel.computeLogGradientMatrix(X, index) }
        -> std::convertible_to<Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>>;
    { const_kernel.getParameters() } -> std::convertible_to<Eigen::Matrix<T, Eigen::Dynamic, 1>>;
    { const_kernel.getParameterCount() } -> std::convertible_to<int>;
    { const_kernel.getDiagonal() } -> std::convertible_to<T>;
    kernel.setParameters(params);
};

#endif // CONCEPTS_HPP
