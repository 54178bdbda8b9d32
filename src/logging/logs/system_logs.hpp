#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <string>
#include "logging/logger/async_logger.hpp"

/**
 * Lifecycle messages for the application: configuration, run folder,
 * startup and shutdown.
 */
class SystemLogs {
public:
    static void log_configuration_loaded(const std::string& config_directory);
    static void log_run_started(const PredictionTrader::Logging::RunIdentity& run_identity, const std::string& run_folder);
    static void log_shutdown_complete(unsigned long logger_polls, const std::string& elapsed_time);

    static void log_fatal_error(const std::string& error_message);
    static void log_system_startup_error(const std::string& error_message);
    static void log_system_shutdown_error(const std::string& error_message);
};

#endif // SYSTEM_LOGS_HPP
