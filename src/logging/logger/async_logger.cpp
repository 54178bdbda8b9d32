#include "async_logger.hpp"
#include "trader/config_loader/config_loader.hpp"
#include "utils/time_utils.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#ifndef PREDICTION_TRADER_BUILD_TAG
#define PREDICTION_TRADER_BUILD_TAG "unknown"
#endif

namespace PredictionTrader {
namespace Logging {

namespace {
    thread_local LoggingContext* thread_logging_context = nullptr;
    thread_local std::string thread_log_tag = "MAIN  ";

    std::string format_log_line(const std::string& message) {
        return TimeUtils::get_current_human_readable_time() + " [" + thread_log_tag + "]   " + message + "\n";
    }
}

// ========================================================================
// RUN IDENTITY
// ========================================================================

std::string RunIdentity::folder_name() const {
    return "run_" + started_at + "_seed" + std::to_string(seed) + "_" + build_tag;
}

std::string RunIdentity::output_file_name(const std::string& file_name) const {
    std::filesystem::path file_path(extract_base_filename(file_name));
    return file_path.stem().string() + "_seed" + std::to_string(seed) + file_path.extension().string();
}

RunIdentity make_run_identity(std::uint64_t seed) {
    RunIdentity identity;
    identity.seed = seed;
    identity.started_at = TimeUtils::get_current_run_label();
    identity.build_tag = PREDICTION_TRADER_BUILD_TAG;
    return identity;
}

// ========================================================================
// ASYNC QUEUE
// ========================================================================

void AsyncLogger::start() {
    running.store(true);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        running.store(false);
    }
    queue_cv.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        pending_lines.push_back(formatted_line);
    }
    queue_cv.notify_one();
}

void AsyncLogger::wait_for_batch(std::vector<std::string>& batch, int poll_interval_milliseconds) {
    std::unique_lock<std::mutex> queue_lock(queue_mutex);
    queue_cv.wait_for(queue_lock, std::chrono::milliseconds(poll_interval_milliseconds),
                      [this] { return !pending_lines.empty() || !running.load(); });
    batch.insert(batch.end(), pending_lines.begin(), pending_lines.end());
    pending_lines.clear();
}

void AsyncLogger::drain(std::vector<std::string>& batch) {
    std::lock_guard<std::mutex> queue_lock(queue_mutex);
    batch.insert(batch.end(), pending_lines.begin(), pending_lines.end());
    pending_lines.clear();
}

// ========================================================================
// LOGGING CONTEXT AND OUTPUT
// ========================================================================

LoggingContext* get_logging_context() {
    if (!thread_logging_context) {
        throw std::runtime_error("Logging context not installed on this thread");
    }
    return thread_logging_context;
}

void set_logging_context(LoggingContext& context) {
    thread_logging_context = &context;
}

std::string format_thread_tag(const std::string& tag_value) {
    std::string tag_string = tag_value.substr(0, LOG_TAG_WIDTH);
    tag_string.append(LOG_TAG_WIDTH - tag_string.size(), ' ');
    return tag_string;
}

void set_log_thread_tag(const std::string& tag_value) {
    thread_log_tag = format_thread_tag(tag_value);
}

void log_message(const std::string& message) {
    LoggingContext* logging_context = thread_logging_context;
    if (!logging_context) {
        std::cerr << "Logging context missing, message: " << message << std::endl;
        return;
    }

    std::string log_line = format_log_line(message);
    if (logging_context->async_logger && logging_context->async_logger->is_running()) {
        logging_context->async_logger->enqueue(log_line);
        return;
    }

    std::lock_guard<std::mutex> console_lock(logging_context->console_mutex);
    std::cout << log_line << std::flush;
}

void write_log_lines(const std::vector<std::string>& lines, std::ofstream& log_file) {
    LoggingContext* logging_context = get_logging_context();
    {
        std::lock_guard<std::mutex> console_lock(logging_context->console_mutex);
        for (const auto& log_line : lines) {
            std::cout << log_line;
        }
        std::cout << std::flush;
    }

    for (const auto& log_line : lines) {
        log_file << log_line;
    }
    log_file.flush();
    if (!log_file) {
        throw std::runtime_error("Failed to write run log file");
    }
}

// ========================================================================
// RUN FOLDER AND OUTPUT FILES
// ========================================================================

std::string extract_base_filename(const std::string& full_path) {
    size_t last_slash = full_path.find_last_of('/');
    return last_slash == std::string::npos ? full_path : full_path.substr(last_slash + 1);
}

std::string create_run_folder(const std::string& log_directory, const RunIdentity& identity) {
    std::string run_folder = log_directory + "/" + identity.folder_name();

    std::error_code filesystem_error;
    std::filesystem::create_directories(run_folder, filesystem_error);
    if (filesystem_error) {
        throw std::runtime_error("Failed to create run folder " + run_folder + ": " + filesystem_error.message());
    }
    return run_folder;
}

std::string run_output_path(const std::string& file_name) {
    LoggingContext* logging_context = get_logging_context();
    if (logging_context->run_folder.empty()) {
        throw std::runtime_error("Run folder not created - call initialize_run_logging first");
    }
    return logging_context->run_folder + "/" + logging_context->run_identity.output_file_name(file_name);
}

std::shared_ptr<AsyncLogger> initialize_run_logging(const PredictionTrader::Config::SystemConfig& config) {
    LoggingContext* logging_context = get_logging_context();

    std::string configuration_error_message;
    if (!validate_config(config, configuration_error_message)) {
        throw std::runtime_error("Configuration validation failed: " + configuration_error_message);
    }

    logging_context->run_identity = make_run_identity(config.seed);
    logging_context->run_folder = create_run_folder(config.logging.log_directory, logging_context->run_identity);

    auto async_logger = std::make_shared<AsyncLogger>(run_output_path(config.logging.log_file));
    async_logger->start();
    logging_context->async_logger = async_logger;
    set_log_thread_tag("MAIN");

    return async_logger;
}

std::shared_ptr<CSVPointsLogger> initialize_csv_points_logger(const std::string& file_name) {
    LoggingContext* logging_context = get_logging_context();
    auto points_logger = std::make_shared<CSVPointsLogger>(run_output_path(file_name));
    logging_context->csv_points_logger = points_logger;
    return points_logger;
}

} // namespace Logging
} // namespace PredictionTrader
