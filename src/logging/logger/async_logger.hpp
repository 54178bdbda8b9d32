#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "configs/system_config.hpp"
#include "csv_points_logger.hpp"

namespace PredictionTrader {
namespace Logging {

constexpr size_t LOG_TAG_WIDTH = 6;

/**
 * Names one simulation run on disk.
 * The run folder carries start time, seed and build tag; files inside it
 * carry the seed so outputs copied out of the folder stay attributable.
 */
struct RunIdentity {
    std::uint64_t seed = 0;
    std::string started_at;     // DD-HH-MM, local time
    std::string build_tag;      // Short commit hash recorded at configure time

    std::string folder_name() const;
    std::string output_file_name(const std::string& file_name) const;
};

RunIdentity make_run_identity(std::uint64_t seed);

/**
 * Line queue between the threads that log and the logging thread.
 * Lines enqueued before stop() are still handed out by drain().
 */
class AsyncLogger {
public:
    explicit AsyncLogger(const std::string& log_file_path) : file_path(log_file_path) {}

    const std::string& get_file_path() const { return file_path; }
    bool is_running() const { return running.load(); }

    void start();
    void stop();
    void enqueue(const std::string& formatted_line);

    // Blocks until a line arrives, stop() is called or the poll interval passes, then drains.
    void wait_for_batch(std::vector<std::string>& batch, int poll_interval_milliseconds);
    void drain(std::vector<std::string>& batch);

private:
    std::string file_path;
    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<std::string> pending_lines;
    std::atomic<bool> running{false};
};

/**
 * Shared by every thread of one run. Each thread installs it with
 * set_logging_context() before its first log call.
 */
struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::shared_ptr<CSVPointsLogger> csv_points_logger;
    std::mutex console_mutex;
    RunIdentity run_identity;
    std::string run_folder;
};

// Pads or truncates to LOG_TAG_WIDTH.
std::string format_thread_tag(const std::string& tag_value);
void set_log_thread_tag(const std::string& tag_value);

// Queues the line when the async logger runs, otherwise prints it directly.
void log_message(const std::string& message);

// Console plus run log file; called from the logging thread only.
void write_log_lines(const std::vector<std::string>& lines, std::ofstream& log_file);

std::string extract_base_filename(const std::string& full_path);
std::string create_run_folder(const std::string& log_directory, const RunIdentity& identity);

// <run_folder>/<stem>_seed<seed><ext> for the current context.
std::string run_output_path(const std::string& file_name);

// Validates the config, creates the run folder and starts the async logger.
std::shared_ptr<AsyncLogger> initialize_run_logging(const PredictionTrader::Config::SystemConfig& config);
std::shared_ptr<CSVPointsLogger> initialize_csv_points_logger(const std::string& file_name);

// Throws std::runtime_error when the calling thread has no context installed.
LoggingContext* get_logging_context();
void set_logging_context(LoggingContext& context);

} // namespace Logging
} // namespace PredictionTrader

#endif // ASYNC_LOGGER_HPP
