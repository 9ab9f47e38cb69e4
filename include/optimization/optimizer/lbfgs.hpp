// File: optimization/optimizer/lbfgs.hpp

#ifndef LBFGS_OPTIMIZER_HPP
#define LBFGS_OPTIMIZER_HPP

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <stdexcept>
#include <vector>

#include "common/logging/logger.hpp"
#include "types/concepts.hpp"

namespace optimization {

    /*
     * Limited-memory BFGS minimizer with box constraints handled by projection. The objective returns its value
     * and writes the gradient in a single call, since both come out of the same Cholesky factorization for the
     * marginal likelihood. Steps are accepted only on sufficient decrease, so the returned point is always the
     * best one visited; running out of iterations is reported through Result::converged, not an exception.
     */
    template<FloatingPoint T = double>
    class LBFGSOptimizer {
    public:
        using VectorT = Eigen::Matrix<T, Eigen::Dynamic, 1>;
        using ObjectiveFunction = std::function<T(const VectorT &, VectorT &)>;

        struct Options {
            int max_iterations = 200;
            T gradient_tolerance = 1e-5;
            T function_tolerance = 1e-10;
            int memory_size = 10;
            T wolfe_c1 = 1e-4;
            T backtrack_factor = 0.5;
            int max_line_search_iterations = 40;
        };

        struct Result {
            VectorT x;
            T value;
            int iterations;
            bool converged;
        };

        explicit LBFGSOptimizer(const Options &options = Options{}) : options_(options) {
            if (options_.max_iterations < 0 || options_.memory_size < 1 || options_.max_line_search_iterations < 1) {
                LOG_ERROR("Invalid L-BFGS options: max_iterations={}, memory_size={}, max_line_search_iterations={}",
                          options_.max_iterations, options_.memory_size, options_.max_line_search_iterations);
                throw std::invalid_argument("Invalid L-BFGS options.");
            }
        }

        [[nodiscard]] Result optimize(const VectorT &initial_guess, const ObjectiveFunction &objective,
                                      const VectorT &lower_bounds, const VectorT &upper_bounds) const {
            if (initial_guess.size() != lower_bounds.size() || initial_guess.size() != upper_bounds.size()) {
                LOG_ERROR("L-BFGS: dimension mismatch between x0 ({}), lower ({}) and upper ({}) bounds",
                          initial_guess.size(), lower_bounds.size(), upper_bounds.size());
                throw std::invalid_argument("Initial guess and bounds must have the same size.");
            }
            if ((lower_bounds.array() > upper_bounds.array()).any()) {
                LOG_ERROR("L-BFGS: lower bounds exceed upper bounds");
                throw std::invalid_argument("Lower bounds must not exceed upper bounds.");
            }

            VectorT x = project(initial_guess, lower_bounds, upper_bounds);
            VectorT grad(x.size());
            T fx = objective(x, grad);

            if (!std::isfinite(fx) || !grad.allFinite()) {
                LOG_WARN("L-BFGS: objective is not finite at the starting point");
                return {x, std::numeric_limits<T>::infinity(), 0, false};
            }

            std::vector<VectorT> s_history;
            std::vector<VectorT> y_history;

            int iteration = 0;
            for (; iteration < options_.max_iterations; ++iteration) {
                const VectorT projected = projectedGradient(x, grad, lower_bounds, upper_bounds);
                if (projected.norm() < options_.gradient_tolerance) {
                    LOG_TRACE("L-BFGS: gradient norm tolerance reached after {} iterations", iteration);
                    return {x, fx, iteration, true};
                }

                VectorT direction = computeSearchDirection(grad, s_history, y_history);
                freezeActiveBounds(x, direction, lower_bounds, upper_bounds);
                if (direction.dot(grad) >= 0) {
                    LOG_TRACE("L-BFGS: not a descent direction, resetting to projected steepest descent");
                    s_history.clear();
                    y_history.clear();
                    direction = -projected;
                }

                T step_size = s_history.empty() ? std::min(T(1), T(1) / direction.norm()) : T(1);
                VectorT x_new;
                VectorT grad_new(x.size());
                T fx_new = std::numeric_limits<T>::infinity();
                bool accepted = false;

                for (int i = 0; i < options_.max_line_search_iterations; ++i) {
                    x_new = project(x + step_size * direction, lower_bounds, upper_bounds);
                    const VectorT step = x_new - x;
                    if (step.norm() <= std::numeric_limits<T>::epsilon() * (T(1) + x.norm())) {
                        break;
                    }
                    fx_new = objective(x_new, grad_new);
                    if (std::isfinite(fx_new) && grad_new.allFinite() &&
                        fx_new <= fx + options_.wolfe_c1 * grad.dot(step)) {
                        accepted = true;
                        break;
                    }
                    step_size *= options_.backtrack_factor;
                }

                if (!accepted) {
                    LOG_TRACE("L-BFGS: line search failed at iteration {}, keeping f(x) = {}", iteration, fx);
                    return {x, fx, iteration, false};
                }

                const VectorT s = x_new - x;
                const VectorT y = grad_new - grad;
                if (s.dot(y) > std::numeric_limits<T>::epsilon() * y.squaredNorm()) {
                    updateHistory(s, y, s_history, y_history);
                }

                const T decrease = fx - fx_new;
                x = x_new;
                grad = grad_new;
                fx = fx_new;
                LOG_TRACE("L-BFGS iteration {}: f(x) = {}, ||grad|| = {}", iteration, fx, grad.norm());

                if (decrease <= options_.function_tolerance * std::max({std::abs(fx), std::abs(fx + decrease), T(1)})) {
                    LOG_TRACE("L-BFGS: function value improvement tolerance reached after {} iterations",
                              iteration + 1);
                    return {x, fx, iteration + 1, true};
                }
            }

            LOG_DEBUG("L-BFGS: iteration budget of {} exhausted, using best point with f(x) = {}",
                      options_.max_iterations, fx);
            return {x, fx, iteration, false};
        }

        [[nodiscard]] const Options &options() const noexcept { return options_; }

    private:
        Options options_;

        static VectorT project(const VectorT &x, const VectorT &lower, const VectorT &upper) {
            return x.cwiseMax(lower).cwiseMin(upper);
        }

        static VectorT projectedGradient(const VectorT &x, const VectorT &grad, const VectorT &lower,
                                         const VectorT &upper) {
            VectorT projected = grad;
            for (Eigen::Index i = 0; i < x.size(); ++i) {
                if ((x(i) <= lower(i) && grad(i) > 0) || (x(i) >= upper(i) && grad(i) < 0)) {
                    projected(i) = 0;
                }
            }
            return projected;
        }

        static void freezeActiveBounds(const VectorT &x, VectorT &direction, const VectorT &lower,
                                       const VectorT &upper) {
            for (Eigen::Index i = 0; i < x.size(); ++i) {
                if ((x(i) <= lower(i) && direction(i) < 0) || (x(i) >= upper(i) && direction(i) > 0)) {
                    direction(i) = 0;
                }
            }
        }

        // Two-loop recursion
        static VectorT computeSearchDirection(const VectorT &grad, const std::vector<VectorT> &s_history,
                                              const std::vector<VectorT> &y_history) {
            if (s_history.empty()) {
                return -grad;
            }

            VectorT q = grad;
            std::vector<T> alpha(s_history.size());
            std::vector<T> rho(s_history.size());

            for (int i = static_cast<int>(s_history.size()) - 1; i >= 0; --i) {
                rho[i] = T(1) / y_history[i].dot(s_history[i]);
                alpha[i] = rho[i] * s_history[i].dot(q);
                q -= alpha[i] * y_history[i];
            }

            const T gamma = s_history.back().dot(y_history.back()) / y_history.back().squaredNorm();
            VectorT z = gamma * q;

            for (size_t i = 0; i < s_history.size(); ++i) {
                const T beta = rho[i] * y_history[i].dot(z);
                z += s_history[i] * (alpha[i] - beta);
            }

            return -z;
        }

        void updateHistory(const VectorT &s, const VectorT &y, std::vector<VectorT> &s_history,
                           std::vector<VectorT> &y_history) const {
            if (static_cast<int>(s_history.size()) == options_.memory_size) {
                s_history.erase(s_history.begin());
                y_history.erase(y_history.begin());
            }
            s_history.push_back(s);
            y_history.push_back(y);
        }
    };

} // namespace optimization

#endif // LBFGS_OPTIMIZER_HPP
