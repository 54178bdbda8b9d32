#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <atomic>
#include <fstream>
#include <memory>
#include "logging/logger/async_logger.hpp"

namespace PredictionTrader {
namespace Threads {

/**
 * Owns the run log file. Writes queued lines to console and file until the
 * async logger is stopped, then drains what is left.
 */
class LoggingThread {
public:
    LoggingThread(std::shared_ptr<PredictionTrader::Logging::AsyncLogger> logger,
                  PredictionTrader::Logging::LoggingContext& context,
                  std::atomic<unsigned long>& poll_counter,
                  int poll_interval_milliseconds)
        : async_logger(logger), logging_context(&context), polls(&poll_counter), poll_interval(poll_interval_milliseconds) {}

    void operator()();

private:
    std::shared_ptr<PredictionTrader::Logging::AsyncLogger> async_logger;
    PredictionTrader::Logging::LoggingContext* logging_context;
    std::atomic<unsigned long>* polls;
    int poll_interval;

    void write_until_stopped(std::ofstream& log_file);
    void write_remaining(std::ofstream& log_file);
};

} // namespace Threads
} // namespace PredictionTrader

#endif // LOGGING_THREAD_HPP
