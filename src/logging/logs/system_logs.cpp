#include "system_logs.hpp"

using PredictionTrader::Logging::log_message;

void SystemLogs::log_configuration_loaded(const std::string& config_directory) {
    log_message("CONFIG: Loaded and validated configuration from " + config_directory);
}

void SystemLogs::log_run_started(const PredictionTrader::Logging::RunIdentity& run_identity, const std::string& run_folder) {
    log_message("SYSTEM_STARTUP: Seed " + std::to_string(run_identity.seed) + ", build " + run_identity.build_tag +
                ", run folder " + run_folder);
}

void SystemLogs::log_shutdown_complete(unsigned long logger_polls, const std::string& elapsed_time) {
    log_message("SYSTEM_SHUTDOWN: Run finished in " + elapsed_time + ", logger drained after " +
                std::to_string(logger_polls) + " polls");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message("FATAL: " + error_message);
}

void SystemLogs::log_system_startup_error(const std::string& error_message) {
    log_message("ERROR: System startup error: " + error_message);
}

void SystemLogs::log_system_shutdown_error(const std::string& error_message) {
    log_message("ERROR: System shutdown error: " + error_message);
}
