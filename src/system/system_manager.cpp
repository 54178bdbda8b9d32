#include "system_manager.hpp"
#include <memory>
#include <stdexcept>
#include <thread>
#include "configs/system_config.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include "logging/logs/system_logs.hpp"
#include "logging/logs/simulation_logs.hpp"
#include "logging/export/json_exporter.hpp"
#include "logging/logger/async_logger.hpp"
#include "trader/config_loader/config_loader.hpp"
#include "trader/simulation/simulation_runner.hpp"
#include "utils/time_utils.hpp"

using namespace PredictionTrader::Logging;
using namespace PredictionTrader::Threads;

namespace PredictionTrader {
namespace System {

namespace {
    constexpr const char* POINTS_LOG_FILE = "points.csv";
}

SystemInitializationResult initialize(const std::string& config_directory) {
    SystemInitializationResult initialization_result;

    // Installed before config loading, which logs parse problems
    auto logging_context = std::make_shared<LoggingContext>();
    set_logging_context(*logging_context);

    try {
        PredictionTrader::Config::SystemConfig loaded_config;
        int config_load_result = load_system_config(loaded_config, config_directory);
        if (config_load_result != 0) {
            throw std::runtime_error("Configuration loading failed with result " + std::to_string(config_load_result));
        }
        SystemLogs::log_configuration_loaded(config_directory);

        initialization_result.system_state = std::make_unique<SystemState>(loaded_config);
        initialization_result.system_state->logging_context = logging_context;
        initialization_result.logger = initialize_run_logging(loaded_config);

        if (loaded_config.logging.enable_csv_points_log) {
            initialize_csv_points_logger(POINTS_LOG_FILE);
        }
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(std::string("System initialization failed: ") + exception_error.what());
        throw;
    }

    return initialization_result;
}

void startup(SystemState& system_state, std::shared_ptr<AsyncLogger> logger, SystemThreads& handles) {
    if (!logger || !system_state.logging_context) {
        throw std::runtime_error("System startup requires an initialized logger and logging context");
    }

    system_state.logging_thread = std::make_unique<LoggingThread>(logger, *system_state.logging_context, handles.logger_polls,
                                                                  system_state.config.logging.poll_interval_milliseconds);
    try {
        handles.logger_thread = std::thread(std::ref(*system_state.logging_thread));
    } catch (const std::exception& exception_error) {
        SystemLogs::log_system_startup_error(exception_error.what());
        throw;
    }

    SystemLogs::log_run_started(system_state.logging_context->run_identity, system_state.logging_context->run_folder);
}

static void write_run_outputs(const SystemState& system_state) {
    const PredictionTrader::Config::LoggingConfig& logging_config = system_state.config.logging;

    if (logging_config.enable_csv_points_log) {
        if (!system_state.logging_context->csv_points_logger) {
            throw std::runtime_error("CSV points logging enabled but no points logger installed");
        }
        system_state.logging_context->csv_points_logger->log_points(system_state.result.points);
        SimulationLogs::log_output_written("Points CSV", system_state.logging_context->csv_points_logger->get_file_path());
    }

    if (logging_config.enable_json_export) {
        std::string json_export_path = run_output_path(logging_config.json_export_file);
        write_simulation_json(system_state.result, json_export_path);
        SimulationLogs::log_output_written("JSON export", json_export_path);
    }
}

void run(SystemState& system_state) {
    try {
        SimulationLogs::log_run_header(system_state.config);
        system_state.result = PredictionTrader::Core::generate_simulation(system_state.config.simulation, system_state.config.seed);
        SimulationLogs::log_simulation_report(system_state.result, system_state.config);
        write_run_outputs(system_state);
    } catch (const std::exception& exception_error) {
        SimulationLogs::log_simulation_error(exception_error.what());
        throw;
    }
}

void shutdown(SystemState& system_state, std::shared_ptr<AsyncLogger> logger, SystemThreads& handles) {
    try {
        if (system_state.logging_context && system_state.logging_context->csv_points_logger) {
            system_state.logging_context->csv_points_logger->flush();
        }

        // Last line that reaches the run log file
        SystemLogs::log_shutdown_complete(handles.logger_polls.load(),
                                          TimeUtils::format_elapsed_seconds(std::chrono::steady_clock::now() - handles.start_time));

        if (logger) {
            logger->stop();
        }
        if (handles.logger_thread.joinable()) {
            handles.logger_thread.join();
        }
    } catch (const std::exception& exception_error) {
        SystemLogs::log_system_shutdown_error(exception_error.what());
        throw;
    }
}

} // namespace System
} // namespace PredictionTrader
