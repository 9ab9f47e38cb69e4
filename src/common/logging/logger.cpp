// File: common/logging/logger.cpp

#include "common/logging/logger.hpp"

#include <filesystem>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace common::logging {

    std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
    spdlog::level::level_enum Logger::level_ = spdlog::level::info;
    std::string Logger::pattern_ = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [%s:%# %!] %v";
    std::once_flag Logger::init_flag_;

    void Logger::init(const std::string &log_directory, const std::string &log_filename, const std::string &log_level,
                      const std::string &pattern) {
        pattern_ = pattern;
        level_ = getLogLevel(log_level);
        createSinks(log_directory, log_filename);
    }

    void Logger::initialize(const std::string &log_directory, const std::string &log_filename,
                            const std::string &log_level) {
        bool created = false;
        std::call_once(init_flag_, [&]() {
            init(log_directory, log_filename, log_level);
            created = true;
        });
        if (!created) {
            level_ = getLogLevel(log_level);
            createSinks(log_directory, log_filename);
        }
    }

    void Logger::createSinks(const std::string &log_directory, const std::string &log_filename) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        try {
            if (!std::filesystem::exists(log_directory)) {
                std::filesystem::create_directories(log_directory);
            }
            sinks.push_back(
                    std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_directory + "/" + log_filename, true));
        } catch (const std::exception &ex) {
            std::cerr << "Log file sink unavailable, logging to console only: " << ex.what() << std::endl;
        }

        try {
            logger_ = std::make_shared<spdlog::logger>("poolbo", sinks.begin(), sinks.end());
            logger_->set_level(level_);
            logger_->set_pattern(pattern_);

            spdlog::drop("poolbo");
            spdlog::register_logger(logger_);
            spdlog::set_default_logger(logger_);
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        }
    }

    spdlog::level::level_enum Logger::getLogLevel(const std::string &level) {
        static const std::unordered_map<std::string_view, spdlog::level::level_enum> level_map = {
                {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
                {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
                {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
                {"off", spdlog::level::off}};
        const auto iterator = level_map.find(level);
        return iterator != level_map.end() ? iterator->second : spdlog::level::info;
    }

} // namespace common::logging
