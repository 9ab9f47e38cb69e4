// File: config/run_settings.cpp

#include "config/run_settings.hpp"

#include <utility>

#include "common/exceptions.hpp"
#include "common/logging/logger.hpp"
#include "scaling/scaler_factory.hpp"

namespace config {

    RunSettings loadRunSettings(const Configuration &configuration) {
        optimization::PoolOptimizer::Config optimizer(
                configuration.require<int>("optimization.budget"),
                configuration.require<int>("optimization.initial_samples"),
                configuration.require<double>("optimization.acquisition.epsilon"));

        optimizer.strategy = optimization::Acquisition<double>::stringToStrategy(
                configuration.get("optimization.acquisition.strategy", "UCB"));
        optimizer.input_scaling =
                scaling::stringToScalerType(configuration.get("optimization.scaling.input", "standard"));

        optimizer.likelihood = optimization::GaussianLikelihood<double>(
                configuration.get<double>("optimization.gp.noise_prior_scale", 0.01),
                configuration.get<double>("optimization.gp.min_noise", 1e-6),
                configuration.get<double>("optimization.gp.max_noise", 10.0));

        auto &surrogate = optimizer.surrogate;
        surrogate.restarts = configuration.get<int>("optimization.gp.restarts", surrogate.restarts);
        surrogate.jitter = configuration.get<double>("optimization.gp.jitter", surrogate.jitter);
        surrogate.max_jitter = configuration.get<double>("optimization.gp.max_jitter", surrogate.max_jitter);
        surrogate.lbfgs.max_iterations =
                configuration.get<int>("optimization.gp.max_iterations", surrogate.lbfgs.max_iterations);
        surrogate.lbfgs.gradient_tolerance =
                configuration.get<double>("optimization.gp.gradient_tolerance", surrogate.lbfgs.gradient_tolerance);

        PoolSettings pool{configuration.require<std::string>("pool.function"), configuration.require<int>("pool.size"),
                          configuration.require<int>("pool.dimensions")};
        if (pool.size < 1 || pool.dimensions < 1) {
            LOG_ERROR("Pool size ({}) and dimensions ({}) must be positive", pool.size, pool.dimensions);
            throw common::ConfigurationError("Pool size and dimensions must be positive.");
        }

        LoggingSettings logging;
        logging.directory = configuration.get("logging.directory", logging.directory.c_str());
        logging.file = configuration.get("logging.file", logging.file.c_str());
        logging.level = configuration.get("logging.level", logging.level.c_str());

        return {std::move(optimizer), configuration.require<unsigned int>("optimization.seed"), std::move(pool),
                std::move(logging)};
    }

} // namespace config
