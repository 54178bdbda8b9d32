#include "logging_thread.hpp"
#include "logging/logs/logging_thread_logs.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace PredictionTrader::Logging;

namespace PredictionTrader {
namespace Threads {

void LoggingThread::operator()() {
    set_logging_context(*logging_context);
    set_log_thread_tag("LOGGER");

    try {
        std::ofstream log_file(async_logger->get_file_path(), std::ios::app);
        if (!log_file.is_open()) {
            throw std::runtime_error("Failed to open run log file: " + async_logger->get_file_path());
        }

        write_until_stopped(log_file);
        write_remaining(log_file);
        LoggingThreadLogs::log_thread_exited();
    } catch (const std::exception& exception_error) {
        LoggingThreadLogs::log_thread_exception(exception_error.what());
    }
}

void LoggingThread::write_until_stopped(std::ofstream& log_file) {
    std::vector<std::string> batch;
    while (async_logger->is_running()) {
        try {
            async_logger->wait_for_batch(batch, poll_interval);
            if (!batch.empty()) {
                write_log_lines(batch, log_file);
                batch.clear();
            }
            polls->fetch_add(1);
        } catch (const std::exception& exception_error) {
            batch.clear();
            LoggingThreadLogs::log_loop_iteration_exception(exception_error.what());
        }
    }
}

// Lines enqueued between the last poll and stop()
void LoggingThread::write_remaining(std::ofstream& log_file) {
    std::vector<std::string> batch;
    async_logger->drain(batch);
    if (!batch.empty()) {
        write_log_lines(batch, log_file);
    }
}

} // namespace Threads
} // namespace PredictionTrader
