#ifndef SIMULATION_LOGS_HPP
#define SIMULATION_LOGS_HPP

#include <string>
#include "configs/system_config.hpp"
#include "trader/data_structures/data_structures.hpp"

using PredictionTrader::Config::SystemConfig;
using PredictionTrader::Config::FeedConfig;

namespace PredictionTrader {
namespace Logging {

/**
 * Run report for one simulation.
 * Everything here reads a finished SimulationResult and only writes log lines.
 */
class SimulationLogs {
public:
    static void log_run_header(const SystemConfig& config);
    static void log_path_summary(const Core::SimulationResult& result);
    static void log_momentum_statistics_table(const Core::MomentumStatistics& statistics, double display_threshold);
    static void log_news_feed(const Core::SimulationResult& result, double current_time, const FeedConfig& config);
    static void log_decision_feed(const Core::SimulationResult& result, double current_time, const FeedConfig& config);
    static void log_agent_state_table(const Core::SimulationPoint& point);
    static void log_decision_counts(const Core::SimulationResult& result);

    // Full report at feed.report_time (end of run when negative)
    static void log_simulation_report(const Core::SimulationResult& result, const SystemConfig& config);

    static void log_output_written(const std::string& output_label, const std::string& output_path);
    static void log_simulation_error(const std::string& error_message);
};

} // namespace Logging
} // namespace PredictionTrader

#endif // SIMULATION_LOGS_HPP
