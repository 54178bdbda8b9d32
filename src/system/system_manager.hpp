#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include <string>
#include "system/system_state.hpp"
#include "system/system_threads.hpp"
#include "logging/logger/async_logger.hpp"

namespace PredictionTrader {
namespace System {

struct SystemInitializationResult {
    std::unique_ptr<SystemState> system_state;
    std::shared_ptr<PredictionTrader::Logging::AsyncLogger> logger;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// System initialization - config loading, validation, run folder, loggers
SystemInitializationResult initialize(const std::string& config_directory);

// System lifecycle management
void startup(SystemState& system_state, std::shared_ptr<PredictionTrader::Logging::AsyncLogger> logger, SystemThreads& handles);
void run(SystemState& system_state);
void shutdown(SystemState& system_state, std::shared_ptr<PredictionTrader::Logging::AsyncLogger> logger, SystemThreads& handles);

} // namespace System
} // namespace PredictionTrader

#endif // SYSTEM_MANAGER_HPP
