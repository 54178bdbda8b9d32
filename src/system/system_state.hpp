#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <memory>
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include "trader/data_structures/data_structures.hpp"

/**
 * @brief Central system state container
 *
 * Owns the configuration, the logging context and the result of the run.
 */
struct SystemState {
    // =========================================================================
    // CONFIGURATION AND MODULES
    // =========================================================================
    PredictionTrader::Config::SystemConfig config;                                  // Complete system configuration
    std::shared_ptr<PredictionTrader::Logging::LoggingContext> logging_context;     // Logging context
    std::unique_ptr<PredictionTrader::Threads::LoggingThread> logging_thread;       // Logging thread module

    // =========================================================================
    // RUN OUTPUT
    // =========================================================================
    PredictionTrader::Core::SimulationResult result;

    explicit SystemState(const PredictionTrader::Config::SystemConfig& initial) : config(initial) {}
};

#endif // SYSTEM_STATE_HPP
