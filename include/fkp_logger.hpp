#pragma once

#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Thread-safe singleton logger class.
 *
 * Single point of access to the logger used by the simulator, the
 * kernel and the command-line front end. Messages are queued and
 * written to a coloured console sink by a background thread, so
 * progress reporting from worker threads never blocks the numerics.
 */
class FKPLogger {
  public:
    /**
     * @brief Retrieves the singleton instance of the logger.
     *
     * The logger is created on first use and shared afterwards.
     *
     * @return std::shared_ptr<spdlog::logger>& A shared pointer to the logger instance.
     */
    static std::shared_ptr<spdlog::logger>& getInstance() {
        static std::shared_ptr<spdlog::logger> instance = createLogger();
        return instance;
    }

    /**
     * @brief Sets the logging level dynamically at runtime.
     *
     * @param level The desired logging level (e.g., spdlog::level::info, spdlog::level::debug).
     */
    static void setLevel(spdlog::level::level_enum level) {
        getInstance()->set_level(level);
    }

  private:
    FKPLogger() = default;

    /**
     * @brief Creates and configures the logger instance.
     *
     * The level is taken from the LOG_LEVEL environment variable when it
     * is set, otherwise info.
     *
     * @return std::shared_ptr<spdlog::logger> The configured logger instance.
     */
    static std::shared_ptr<spdlog::logger> createLogger() {
        try {
            size_t queue_size = 8192;
            spdlog::init_thread_pool(queue_size, 1);

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [thread %t] [%^%l%$] %v");

            std::vector<spdlog::sink_ptr> sinks{console_sink};
            auto async_logger = std::make_shared<spdlog::async_logger>(
              "FKPLogger",
              sinks.begin(),
              sinks.end(),
              spdlog::thread_pool(),
              spdlog::async_overflow_policy::block);

            const char* logLevelEnv = std::getenv("LOG_LEVEL");
            if (logLevelEnv) {
                async_logger->set_level(spdlog::level::from_str(logLevelEnv));
            } else {
                async_logger->set_level(spdlog::level::info);
            }

            spdlog::register_logger(async_logger);

            return async_logger;
        } catch (const spdlog::spdlog_ex& ex) {
            throw std::runtime_error(std::string("Logger initialization failed: ")
                                     + ex.what());
        }
    }
};

/// Project-wide logger used at call sites as `logger.info(...)`
inline spdlog::logger& logger = *FKPLogger::getInstance();
