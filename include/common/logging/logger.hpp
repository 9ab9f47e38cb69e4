// File: common/logging/logger.hpp

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "common/formatting/fmt_eigen.hpp"

// NOTE: Logger MUST NOT depend on config::Configuration, the configuration itself logs while loading.
namespace common::logging {

    class Logger {
    public:
        Logger(const Logger &) = delete;

        Logger &operator=(const Logger &) = delete;

        ~Logger() = default;

        template<typename... Args>
        static void log(spdlog::level::level_enum level, const char *file, int line, const char *func, const char *fmt,
                        Args &&...args);

        // Explicit initialization with sinks chosen by the caller. Messages logged before this call went to the
        // default sinks (./logs/poolbo.log); the sinks are replaced here.
        static void initialize(const std::string &log_directory, const std::string &log_filename,
                               const std::string &log_level);

        static spdlog::level::level_enum getLogLevel(const std::string &level);

    private:
        static std::shared_ptr<spdlog::logger> logger_;
        static std::string pattern_;
        static spdlog::level::level_enum level_;
        static std::once_flag init_flag_;

        static void init(const std::string &log_directory = "./logs", const std::string &log_filename = "poolbo.log",
                         const std::string &log_level = "info",
                         const std::string &pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [%s:%# %!] %v");

        static void createSinks(const std::string &log_directory, const std::string &log_filename);
    };

#define LOG_(level, fmt, ...)                                                                                          \
    common::logging::Logger::log(common::logging::Logger::getLogLevel(level), __FILE__, __LINE__, __FUNCTION__, fmt,   \
                                 ##__VA_ARGS__)
#define LOG_TRACE(fmt, ...) LOG_("trace", fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) LOG_("debug", fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) LOG_("info", fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) LOG_("warn", fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) LOG_("error", fmt, ##__VA_ARGS__)
#define LOG_CRITICAL(fmt, ...) LOG_("critical", fmt, ##__VA_ARGS__)

    template<typename... Args>
    void Logger::log(spdlog::level::level_enum level, const char *file, int line, const char *func, const char *fmt,
                     Args &&...args) {
        std::call_once(init_flag_, []() { init(); });
        if (!logger_) {
            std::cerr << "Logger not initialized!" << std::endl;
            return;
        }
        if (!logger_->should_log(level)) {
            return;
        }

        spdlog::source_loc source{file, line, func};
        if constexpr (sizeof...(args) > 0) {
            auto formatted_string = fmt::vformat(fmt, fmt::make_format_args(args...));
            logger_->log(source, level, formatted_string);
        } else {
            logger_->log(source, level, fmt);
        }
    }

} // namespace common::logging

#endif // LOGGER_HPP
