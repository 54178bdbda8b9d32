#ifndef CSV_POINTS_LOGGER_HPP
#define CSV_POINTS_LOGGER_HPP

#include "trader/data_structures/data_structures.hpp"
#include <fstream>
#include <string>
#include <mutex>
#include <vector>

namespace PredictionTrader {
namespace Logging {

/**
 * CSV logger for simulation points.
 * One row per point, written to <run_folder>/points_seed<seed>.csv
 */
class CSVPointsLogger {
private:
    std::string file_path;
    std::ofstream file_stream;
    std::mutex file_mutex;
    bool initialized = false;

    void write_header();
    void ensure_initialized();
    void write_point_row(const Core::SimulationPoint& point);

public:
    explicit CSVPointsLogger(const std::string& log_file_path);
    ~CSVPointsLogger();

    // No default constructor - system must fail if not properly initialized
    CSVPointsLogger() = delete;

    // No copy constructor or assignment
    CSVPointsLogger(const CSVPointsLogger&) = delete;
    CSVPointsLogger& operator=(const CSVPointsLogger&) = delete;

    void log_point(const Core::SimulationPoint& point);
    void log_points(const std::vector<Core::SimulationPoint>& points);

    void flush();
    bool is_initialized() const { return initialized; }
    const std::string& get_file_path() const { return file_path; }
};

} // namespace Logging
} // namespace PredictionTrader

#endif // CSV_POINTS_LOGGER_HPP
