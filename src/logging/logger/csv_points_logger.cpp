#include "csv_points_logger.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>

namespace PredictionTrader {
namespace Logging {

CSVPointsLogger::CSVPointsLogger(const std::string& log_file_path) : file_path(log_file_path) {
    try {
        std::filesystem::path file_path_obj(file_path);
        if (file_path_obj.has_parent_path()) {
            std::filesystem::create_directories(file_path_obj.parent_path());
        }

        file_stream.open(file_path, std::ios::out | std::ios::trunc);
        if (!file_stream.is_open()) {
            throw std::runtime_error("Failed to open points log file: " + file_path);
        }

        initialized = true;
        write_header();
    } catch (const std::exception& e) {
        std::cerr << "CRITICAL ERROR: Failed to initialize CSV points logger: " << e.what() << std::endl;
        throw; // Re-throw to ensure system fails - no defaults allowed
    }
}

CSVPointsLogger::~CSVPointsLogger() {
    if (file_stream.is_open()) {
        file_stream.close();
    }
}

void CSVPointsLogger::write_header() {
    if (!file_stream.is_open()) {
        throw std::runtime_error("Cannot write header - file not open");
    }

    file_stream << "index,t,prob,momentum,raw_change,drift,z,abs_z,news_relevance,news_polarity,"
                << "signal_score,trade_threshold,position_size,risk_utilization,decision\n";
    file_stream.flush();
}

void CSVPointsLogger::ensure_initialized() {
    if (!initialized || !file_stream.is_open()) {
        throw std::runtime_error("CSV points logger not properly initialized");
    }
}

void CSVPointsLogger::write_point_row(const Core::SimulationPoint& point) {
    file_stream << point.index << ","
                << std::fixed << std::setprecision(6) << point.t << ","
                << std::fixed << std::setprecision(6) << point.prob << ","
                << std::fixed << std::setprecision(8) << point.momentum << ","
                << std::fixed << std::setprecision(8) << point.raw_change << ","
                << std::fixed << std::setprecision(6) << point.drift << ","
                << std::fixed << std::setprecision(6) << point.z << ","
                << std::fixed << std::setprecision(6) << point.abs_z << ","
                << std::fixed << std::setprecision(6) << point.news_relevance << ","
                << Core::polarity_to_string(point.news_polarity) << ","
                << std::fixed << std::setprecision(6) << point.signal_score << ","
                << std::fixed << std::setprecision(6) << point.trade_threshold << ","
                << std::fixed << std::setprecision(6) << point.position_size << ","
                << point.risk_utilization << ","
                << Core::decision_to_string(point.decision) << "\n";
}

void CSVPointsLogger::log_point(const Core::SimulationPoint& point) {
    ensure_initialized();

    std::lock_guard<std::mutex> lock(file_mutex);
    write_point_row(point);
    file_stream.flush();
}

void CSVPointsLogger::log_points(const std::vector<Core::SimulationPoint>& points) {
    ensure_initialized();

    std::lock_guard<std::mutex> lock(file_mutex);
    for (const auto& point : points) {
        write_point_row(point);
    }
    file_stream.flush();
}

void CSVPointsLogger::flush() {
    if (file_stream.is_open()) {
        file_stream.flush();
    }
}

} // namespace Logging
} // namespace PredictionTrader
