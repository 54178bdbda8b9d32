#ifndef DECISION_FEED_HPP
#define DECISION_FEED_HPP

#include <string>
#include <vector>
#include "configs/feed_config.hpp"
#include "trader/data_structures/data_structures.hpp"

using PredictionTrader::Config::FeedConfig;

namespace PredictionTrader {
namespace Core {

enum class NewsImpact {
    LOW,
    MEDIUM,
    HIGH
};

std::string impact_to_string(NewsImpact impact);

// Trailing-window views: entries with current_time - window <= t <= current_time, in time order.
std::vector<DecisionRecord> select_recent_decisions(const std::vector<DecisionRecord>& decisions, double current_time, double window);
std::vector<NewsEvent> select_recent_news(const std::vector<NewsEvent>& news_events, double current_time, double window);

// Last point with t <= time, or 0 when time precedes the path.
size_t find_point_index_at_time(const std::vector<SimulationPoint>& points, double time);

NewsImpact classify_news_impact(double relevance, const FeedConfig& config);

std::string format_decision_label(TradeDecision decision);
std::string describe_agent_mode(TradeDecision decision);
std::string describe_news_polarity(NewsPolarity polarity);

/**
 * One-line narrative for a decision record, pieces joined by " · ":
 * action, dP/dt, news relevance (only above the mention threshold), position.
 */
std::string describe_decision(const DecisionRecord& record, const FeedConfig& config);

// Display-only momentum band; unrelated to the decision engine trade threshold.
double compute_momentum_display_threshold(const std::vector<SimulationPoint>& points, const FeedConfig& config);

std::string format_fixed(double value, int precision);

} // namespace Core
} // namespace PredictionTrader

#endif // DECISION_FEED_HPP
