#include "decision_feed.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace PredictionTrader {
namespace Core {

namespace {
    constexpr double MOMENTUM_DISPLAY_MAGNITUDE_FLOOR = 0.0001;
    constexpr const char* FEED_PIECE_SEPARATOR = " \xC2\xB7 ";

    bool is_inside_window(double t, double current_time, double window) {
        return t >= current_time - window && t <= current_time;
    }
}

std::string impact_to_string(NewsImpact impact) {
    switch (impact) {
        case NewsImpact::HIGH: return "high";
        case NewsImpact::MEDIUM: return "medium";
        case NewsImpact::LOW: return "low";
    }
    throw std::runtime_error("Unknown news impact");
}

std::string format_fixed(double value, int precision) {
    std::ostringstream formatted_stream;
    formatted_stream << std::fixed << std::setprecision(precision) << value;
    return formatted_stream.str();
}

std::vector<DecisionRecord> select_recent_decisions(const std::vector<DecisionRecord>& decisions, double current_time, double window) {
    std::vector<DecisionRecord> recent_decisions;
    for (const auto& record : decisions) {
        if (is_inside_window(record.t, current_time, window)) {
            recent_decisions.push_back(record);
        }
    }
    return recent_decisions;
}

std::vector<NewsEvent> select_recent_news(const std::vector<NewsEvent>& news_events, double current_time, double window) {
    std::vector<NewsEvent> recent_news;
    for (const auto& event : news_events) {
        if (is_inside_window(event.t, current_time, window)) {
            recent_news.push_back(event);
        }
    }
    return recent_news;
}

size_t find_point_index_at_time(const std::vector<SimulationPoint>& points, double time) {
    size_t point_index = 0;
    for (size_t i = 0; i < points.size(); ++i) {
        if (points[i].t <= time) {
            point_index = i;
        } else {
            break;
        }
    }
    return point_index;
}

NewsImpact classify_news_impact(double relevance, const FeedConfig& config) {
    if (relevance > config.high_impact_threshold) {
        return NewsImpact::HIGH;
    }
    if (relevance > config.medium_impact_threshold) {
        return NewsImpact::MEDIUM;
    }
    return NewsImpact::LOW;
}

std::string format_decision_label(TradeDecision decision) {
    switch (decision) {
        case TradeDecision::ENTER: return "Entry";
        case TradeDecision::SCALE: return "Scale";
        case TradeDecision::HOLD: return "Hold";
        case TradeDecision::EXIT: return "Exit";
        case TradeDecision::OBSERVE: return "Observe";
    }
    return "Observe";
}

std::string describe_agent_mode(TradeDecision decision) {
    switch (decision) {
        case TradeDecision::ENTER: return "Entering position";
        case TradeDecision::SCALE: return "Scaling position";
        case TradeDecision::HOLD: return "Holding risk";
        case TradeDecision::EXIT: return "Exiting / de-risking";
        case TradeDecision::OBSERVE: return "Idle / observing";
    }
    return "Idle / observing";
}

std::string describe_news_polarity(NewsPolarity polarity) {
    switch (polarity) {
        case NewsPolarity::POSITIVE: return "Supports event";
        case NewsPolarity::NEGATIVE: return "Challenges event";
        case NewsPolarity::NEUTRAL: return "Neutral";
    }
    return "Neutral";
}

std::string describe_decision(const DecisionRecord& record, const FeedConfig& config) {
    const std::string direction_label = record.momentum >= 0.0 ? "long" : "short";
    std::vector<std::string> description_pieces;

    switch (record.decision) {
        case TradeDecision::ENTER:
            description_pieces.push_back("Opening " + direction_label + " position");
            break;
        case TradeDecision::SCALE:
            description_pieces.push_back("Adding to " + direction_label + " position");
            break;
        case TradeDecision::HOLD:
            description_pieces.push_back("Maintaining exposure");
            break;
        case TradeDecision::EXIT:
            description_pieces.push_back("Reducing or closing exposure");
            break;
        case TradeDecision::OBSERVE:
            break;
    }

    description_pieces.push_back("dP/dt = " + format_fixed(record.momentum, 3));

    if (record.news_relevance > config.news_relevance_mention_threshold) {
        description_pieces.push_back("news relevance = " + format_fixed(record.news_relevance, 2));
    }

    description_pieces.push_back("position = " + format_fixed(record.position_size, 2));

    std::string description;
    for (size_t i = 0; i < description_pieces.size(); ++i) {
        if (i > 0) {
            description += FEED_PIECE_SEPARATOR;
        }
        description += description_pieces[i];
    }
    return description;
}

double compute_momentum_display_threshold(const std::vector<SimulationPoint>& points, const FeedConfig& config) {
    double max_abs_momentum = 0.0;
    for (const auto& point : points) {
        max_abs_momentum = std::max(max_abs_momentum, std::fabs(point.momentum));
    }
    return config.momentum_threshold_base * std::max(MOMENTUM_DISPLAY_MAGNITUDE_FLOOR, max_abs_momentum);
}

} // namespace Core
} // namespace PredictionTrader
