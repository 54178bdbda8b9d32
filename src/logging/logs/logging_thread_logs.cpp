#include "logging_thread_logs.hpp"
#include "logging/logger/async_logger.hpp"

namespace PredictionTrader {
namespace Logging {

void LoggingThreadLogs::log_thread_exception(const std::string& error_message) {
    log_message("LoggingThread stopped on error: " + error_message);
}

void LoggingThreadLogs::log_thread_exited() {
    log_message("LoggingThread drained and closed the run log");
}

void LoggingThreadLogs::log_loop_iteration_exception(const std::string& error_message) {
    log_message("LoggingThread dropped a batch: " + error_message);
}

} // namespace Logging
} // namespace PredictionTrader
