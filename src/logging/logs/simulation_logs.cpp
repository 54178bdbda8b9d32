#include "simulation_logs.hpp"
#include "logging/logger/logging_macros.hpp"
#include "trader/feed/decision_feed.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

using PredictionTrader::Logging::log_message;
using PredictionTrader::Core::format_fixed;

namespace PredictionTrader {
namespace Logging {

void SimulationLogs::log_run_header(const SystemConfig& config) {
    LOG_RUN_BANNER("PREDICTION MARKET SIMULATION");

    LOG_TABLE_HEADER("SIMULATION", "Run Configuration");
    LOG_TABLE_ROW("Length", std::to_string(config.simulation.length) + " points");
    LOG_TABLE_ROW("Seed", std::to_string(config.seed));
    LOG_TABLE_ROW("Time Horizon", format_fixed(config.simulation.path.time_horizon, 1));
    LOG_TABLE_ROW("Initial Prob", format_fixed(config.simulation.path.initial_probability, 2));
    LOG_TABLE_ROW("Prob Bounds", "[" + format_fixed(config.simulation.path.probability_floor, 2) + ", " +
                                format_fixed(config.simulation.path.probability_ceiling, 2) + "]");
    LOG_TABLE_ROW("Noise Intensity", format_fixed(config.simulation.path.noise_intensity, 2));
    LOG_TABLE_ROW("Regime Shifts", std::to_string(config.simulation.path.regimes.size()));

    LOG_TABLE_SEPARATOR();

    LOG_TABLE_ROW("News Z Threshold", format_fixed(config.simulation.news.z_threshold, 2));
    LOG_TABLE_ROW("Trade Threshold", format_fixed(config.simulation.decision.trade_threshold, 2));
    LOG_TABLE_ROW("High Conviction", format_fixed(config.simulation.decision.high_conviction_threshold, 2));
    LOG_TABLE_ROW("Max Position", format_fixed(config.simulation.risk.max_position, 2));
    LOG_TABLE_ROW("Risk Budget", format_fixed(config.simulation.risk.risk_budget, 2));
    LOG_TABLE_FOOTER();
}

void SimulationLogs::log_path_summary(const Core::SimulationResult& result) {
    if (result.points.empty()) {
        LOG_SECTION_LINE("Path summary: no points");
        return;
    }

    double lowest_probability = result.points.front().prob;
    double highest_probability = result.points.front().prob;
    for (const auto& point : result.points) {
        lowest_probability = std::min(lowest_probability, point.prob);
        highest_probability = std::max(highest_probability, point.prob);
    }

    LOG_TABLE_HEADER("PATH", "Probability Path Summary");
    LOG_TABLE_ROW("Points", std::to_string(result.points.size()));
    LOG_TABLE_ROW("Time Step", format_fixed(result.points.size() > 1 ? result.points[1].t - result.points[0].t : 0.0, 4));
    LOG_TABLE_ROW("Start Prob", format_fixed(result.points.front().prob, 4));
    LOG_TABLE_ROW("End Prob", format_fixed(result.points.back().prob, 4));
    LOG_TABLE_ROW("Min / Max Prob", format_fixed(lowest_probability, 4) + " / " + format_fixed(highest_probability, 4));
    LOG_TABLE_ROW("Final Drift", format_fixed(result.points.back().drift, 4));
    LOG_TABLE_ROW("News Events", std::to_string(result.news_events.size()));
    LOG_TABLE_ROW("Decisions", std::to_string(result.decisions.size()));
    LOG_TABLE_FOOTER();
}

void SimulationLogs::log_momentum_statistics_table(const Core::MomentumStatistics& statistics, double display_threshold) {
    LOG_TABLE_HEADER("MOMENTUM", "Global dP/dt Statistics");
    LOG_TABLE_ROW("Mean", format_fixed(statistics.mean, 6));
    LOG_TABLE_ROW("Std Deviation", format_fixed(statistics.standard_deviation, 6));
    LOG_TABLE_ROW("Degenerate", statistics.degenerate ? "YES (floor applied)" : "NO");
    LOG_TABLE_ROW("Display Band", "+/- " + format_fixed(display_threshold, 6));
    LOG_TABLE_FOOTER();
}

void SimulationLogs::log_news_feed(const Core::SimulationResult& result, double current_time, const FeedConfig& config) {
    std::vector<Core::NewsEvent> recent_news = Core::select_recent_news(result.news_events, current_time, config.news_window);

    LOG_SECTION_HEADER("NEWS FEED (t " + format_fixed(current_time - config.news_window, 1) + " .. " + format_fixed(current_time, 1) + ")");
    if (recent_news.empty()) {
        LOG_SECTION_LINE("No news in window");
    }
    for (const auto& event : recent_news) {
        Core::NewsImpact impact = Core::classify_news_impact(event.relevance, config);
        LOG_SECTION_LINE("t = " + format_fixed(event.t, 1) + "  Relevance " + format_fixed(event.relevance, 2) +
                           "  [" + Core::impact_to_string(impact) + " impact] [" + Core::describe_news_polarity(event.polarity) + "]");
        LOG_SECTION_DETAIL(event.headline);
    }
    LOG_SECTION_FOOTER();
}

void SimulationLogs::log_decision_feed(const Core::SimulationResult& result, double current_time, const FeedConfig& config) {
    std::vector<Core::DecisionRecord> recent_decisions = Core::select_recent_decisions(result.decisions, current_time, config.decision_window);

    LOG_SECTION_HEADER("DECISION LOG (t " + format_fixed(current_time - config.decision_window, 1) + " .. " + format_fixed(current_time, 1) + ")");
    if (recent_decisions.empty()) {
        LOG_SECTION_LINE("No decisions in window");
    }
    for (const auto& record : recent_decisions) {
        LOG_SECTION_LINE("t = " + format_fixed(record.t, 1) + "  " + Core::format_decision_label(record.decision) +
                           "  Signal " + format_fixed(record.signal_score, 2) + " \xC2\xB7 P=" + format_fixed(record.prob, 2));
        LOG_SECTION_DETAIL(Core::describe_decision(record, config));
    }
    LOG_SECTION_FOOTER();
}

void SimulationLogs::log_agent_state_table(const Core::SimulationPoint& point) {
    LOG_TABLE_HEADER("AGENT STATE", Core::describe_agent_mode(point.decision));
    LOG_TABLE_ROW("Time", format_fixed(point.t, 1));
    LOG_TABLE_ROW("Probability", format_fixed(point.prob, 2));
    LOG_TABLE_ROW("dP/dt", format_fixed(point.momentum, 3));
    LOG_TABLE_ROW("Momentum Z", format_fixed(point.z, 2));
    LOG_TABLE_ROW("News Relevance", format_fixed(point.news_relevance, 2));
    LOG_TABLE_ROW("News Polarity", Core::describe_news_polarity(point.news_polarity));
    LOG_TABLE_ROW("Signal Score", format_fixed(point.signal_score, 2));
    LOG_TABLE_ROW("Position", format_fixed(point.position_size, 2));
    LOG_TABLE_ROW("Risk Used", std::to_string(point.risk_utilization) + "%");
    LOG_TABLE_FOOTER();
}

void SimulationLogs::log_decision_counts(const Core::SimulationResult& result) {
    std::map<Core::TradeDecision, int> decision_counts;
    for (const auto& point : result.points) {
        decision_counts[point.decision]++;
    }

    LOG_TABLE_HEADER("DECISIONS", "Counts Over Run");
    for (Core::TradeDecision decision : {Core::TradeDecision::OBSERVE, Core::TradeDecision::ENTER, Core::TradeDecision::SCALE,
                                         Core::TradeDecision::HOLD, Core::TradeDecision::EXIT}) {
        LOG_TABLE_ROW(Core::format_decision_label(decision), std::to_string(decision_counts[decision]));
    }
    LOG_TABLE_FOOTER();
}

void SimulationLogs::log_simulation_report(const Core::SimulationResult& result, const SystemConfig& config) {
    if (result.points.empty()) {
        throw std::runtime_error("Cannot report on an empty simulation");
    }

    double report_time = config.feed.report_time < 0.0 ? result.points.back().t : config.feed.report_time;
    size_t report_index = Core::find_point_index_at_time(result.points, report_time);
    double display_threshold = Core::compute_momentum_display_threshold(result.points, config.feed);

    log_path_summary(result);
    log_momentum_statistics_table(result.momentum_statistics, display_threshold);
    log_news_feed(result, report_time, config.feed);
    log_decision_feed(result, report_time, config.feed);
    log_agent_state_table(result.points[report_index]);
    log_decision_counts(result);
}

void SimulationLogs::log_output_written(const std::string& output_label, const std::string& output_path) {
    LOG_SECTION_LINE(output_label + " written: " + output_path);
}

void SimulationLogs::log_simulation_error(const std::string& error_message) {
    log_message("ERROR: Simulation failed: " + error_message);
}

} // namespace Logging
} // namespace PredictionTrader
