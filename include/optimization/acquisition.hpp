// File: optimization/acquisition.hpp

#ifndef ACQUISITION_HPP
#define ACQUISITION_HPP

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

#include "common/exceptions.hpp"
#include "common/logging/logger.hpp"
#include "optimization/gaussian/posterior.hpp"
#include "types/concepts.hpp"

namespace optimization {

    // Scores candidate points from the surrogate posterior; higher scores are more promising.
    template<FloatingPoint T = double>
    class Acquisition {
    public:
        using VectorType = Eigen::Matrix<T, Eigen::Dynamic, 1>;

        enum class Strategy { UCB, EI, PI };

        explicit Acquisition(const Strategy strategy = Strategy::UCB, const T epsilon = 2.0) :
            strategy_(strategy), epsilon_(epsilon) {
            if (!std::isfinite(epsilon_)) {
                LOG_ERROR("Acquisition exploration weight must be finite, received {}", epsilon_);
                throw common::ConfigurationError("Acquisition exploration weight must be finite.");
            }
            LOG_DEBUG("Acquisition function initialized with strategy {} and epsilon {}", strategyToString(strategy_),
                      epsilon_);
        }

        // best_observed is only used by EI and PI
        [[nodiscard]] VectorType score(const Posterior<T> &posterior, const T best_observed) const {
            switch (strategy_) {
                case Strategy::UCB:
                    return upperConfidenceBound(posterior.mean, posterior.std_dev, epsilon_);
                case Strategy::EI:
                    return expectedImprovement(posterior.mean, posterior.std_dev, best_observed);
                case Strategy::PI:
                    return probabilityOfImprovement(posterior.mean, posterior.std_dev, best_observed);
            }
            LOG_ERROR("Unknown acquisition strategy {}", static_cast<int>(strategy_));
            throw std::logic_error("Unknown acquisition strategy");
        }

        // mean + epsilon * std_dev; epsilon = 0 is pure exploitation
        [[nodiscard]] static VectorType upperConfidenceBound(const VectorType &mean, const VectorType &std_dev,
                                                             const T epsilon) {
            checkSizes(mean, std_dev);
            return mean + epsilon * std_dev;
        }

        [[nodiscard]] static VectorType expectedImprovement(const VectorType &mean, const VectorType &std_dev,
                                                            const T best_observed) {
            checkSizes(mean, std_dev);
            VectorType result(mean.size());
            for (Eigen::Index i = 0; i < mean.size(); ++i) {
                const T improvement = mean(i) - best_observed;
                const T z = improvement / std_dev(i);
                result(i) = improvement * normalCDF(z) + std_dev(i) * normalPDF(z);
            }
            return result;
        }

        [[nodiscard]] static VectorType probabilityOfImprovement(const VectorType &mean, const VectorType &std_dev,
                                                                 const T best_observed) {
            checkSizes(mean, std_dev);
            VectorType result(mean.size());
            for (Eigen::Index i = 0; i < mean.size(); ++i) {
                result(i) = normalCDF((mean(i) - best_observed) / std_dev(i));
            }
            return result;
        }

        [[nodiscard]] Strategy strategy() const noexcept { return strategy_; }
        [[nodiscard]] T epsilon() const noexcept { return epsilon_; }

        static std::string_view strategyToString(const Strategy strategy) {
            const auto &strategy_map = getStrategyMap();
            if (auto it = strategy_map.find(strategy); it != strategy_map.end()) {
                return it->second;
            }
            LOG_WARN("Unknown strategy encountered: {}", static_cast<int>(strategy));
            return "UNKNOWN";
        }

        static Strategy stringToStrategy(std::string_view str) {
            const auto &strategy_map = getStrategyMap();
            auto it = std::find_if(strategy_map.begin(), strategy_map.end(),
                                   [str](const auto &pair) { return pair.second == str; });
            if (it != strategy_map.end()) {
                return it->first;
            }
            LOG_ERROR("Unknown acquisition strategy: {}", str);
            throw common::ConfigurationError("Unknown acquisition strategy: " + std::string(str));
        }

    private:
        Strategy strategy_;
        T epsilon_;

        static void checkSizes(const VectorType &mean, const VectorType &std_dev) {
            if (mean.size() != std_dev.size()) {
                LOG_ERROR("Posterior mean ({}) and standard deviation ({}) sizes differ", mean.size(), std_dev.size());
                throw std::invalid_argument("Posterior mean and standard deviation must have the same size.");
            }
        }

        static T normalCDF(const T x) { return T(0.5) * (T(1) + std::erf(x / std::numbers::sqrt2_v<T>)); }

        static T normalPDF(const T x) {
            return std::exp(T(-0.5) * x * x) / std::sqrt(T(2) * std::numbers::pi_v<T>);
        }

        static const std::unordered_map<Strategy, std::string_view> &getStrategyMap() {
            static const std::unordered_map<Strategy, std::string_view> strategy_map = {
                    {Strategy::UCB, "UCB"}, {Strategy::EI, "EI"}, {Strategy::PI, "PI"}};
            return strategy_map;
        }
    };

} // namespace optimization

#endif // ACQUISITION_HPP
