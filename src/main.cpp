// File: main.cpp

#include <exception>
#include <string>

#include "executor.hpp"
#include "poolbo.hpp"

int main(const int argc, char *argv[]) {
    const std::string configuration_file = argc > 1 ? argv[1] : "configuration.yaml";

    try {
        config::initialize(configuration_file);
        const auto settings = config::loadRunSettings(config::Configuration::getInstance());
        common::logging::Logger::initialize(settings.logging.directory, settings.logging.file,
                                            settings.logging.level);
        config::show();

        Executor::execute(settings);
    } catch (const common::ConfigurationError &e) {
        LOG_CRITICAL("Configuration error: {}", e.what());
        return 1;
    } catch (const common::NumericalError &e) {
        LOG_CRITICAL("Numerical error: {}", e.what());
        return 1;
    } catch (const std::exception &e) {
        LOG_CRITICAL("Unhandled exception: {}", e.what());
        return 1;
    }
    return 0;
}
