// File: config/run_settings.hpp

#ifndef RUN_SETTINGS_HPP
#define RUN_SETTINGS_HPP

#include <string>

#include "config/configuration.hpp"
#include "optimization/pool_optimizer.hpp"

namespace config {

    struct PoolSettings {
        std::string function; // benchmark name, "branin" or "sphere"
        int size;
        int dimensions;
    };

    struct LoggingSettings {
        std::string directory = "./logs";
        std::string file = "poolbo.log";
        std::string level = "info";
    };

    // Everything the poolbo executable needs for one run
    struct RunSettings {
        optimization::PoolOptimizer::Config optimizer;
        unsigned int seed;
        PoolSettings pool;
        LoggingSettings logging;
    };

    /*
     * Required keys: optimization.budget, optimization.initial_samples, optimization.acquisition.epsilon,
     * optimization.seed, pool.function, pool.size, pool.dimensions. Everything else falls back to a default.
     * Throws common::ConfigurationError on missing or invalid values.
     */
    [[nodiscard]] RunSettings loadRunSettings(const Configuration &configuration);

} // namespace config

#endif // RUN_SETTINGS_HPP
