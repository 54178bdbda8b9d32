// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace PredictionTrader {
namespace Config {

struct LoggingConfig {
    std::string log_file = "prediction_trader.log";
    std::string log_directory = "runtime_logs";
    int poll_interval_milliseconds = 50;

    // Run outputs
    bool enable_csv_points_log = true;
    bool enable_json_export = true;
    std::string json_export_file = "simulation.json";
};

} // namespace Config
} // namespace PredictionTrader

#endif // LOGGING_CONFIG_HPP
