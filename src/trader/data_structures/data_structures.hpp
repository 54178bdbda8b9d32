#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <vector>

namespace PredictionTrader {
namespace Core {

enum class NewsPolarity {
    POSITIVE,
    NEGATIVE,
    NEUTRAL
};

enum class TradeDecision {
    OBSERVE,
    ENTER,
    SCALE,
    HOLD,
    EXIT
};

std::string polarity_to_string(NewsPolarity polarity);
NewsPolarity parse_polarity(const std::string& polarity_str);
std::string decision_to_string(TradeDecision decision);
TradeDecision parse_decision(const std::string& decision_str);

/**
 * One sample of the probability path.
 * index/t/prob/momentum/raw_change/drift come from the path pass; the
 * remaining fields are filled by the decision pass once global momentum
 * statistics are known.
 */
struct SimulationPoint {
    int index;
    double t;
    double prob;
    double momentum;
    double raw_change;
    double drift;

    double z;
    double abs_z;
    double news_relevance;
    NewsPolarity news_polarity;
    double signal_score;
    double trade_threshold;
    double position_size;
    int risk_utilization;
    TradeDecision decision;

    SimulationPoint()
        : index(0), t(0.0), prob(0.0), momentum(0.0), raw_change(0.0), drift(0.0),
          z(0.0), abs_z(0.0), news_relevance(0.0), news_polarity(NewsPolarity::NEUTRAL),
          signal_score(0.0), trade_threshold(0.0), position_size(0.0), risk_utilization(0),
          decision(TradeDecision::OBSERVE) {}
};

struct NewsEvent {
    double t;
    int index;
    double relevance;
    NewsPolarity polarity;
    std::string headline;

    NewsEvent() : t(0.0), index(0), relevance(0.0), polarity(NewsPolarity::NEUTRAL) {}
};

struct DecisionRecord {
    double t;
    int index;
    double prob;
    TradeDecision decision;
    double signal_score;
    double news_relevance;
    double momentum;
    double position_size;

    DecisionRecord()
        : t(0.0), index(0), prob(0.0), decision(TradeDecision::OBSERVE), signal_score(0.0),
          news_relevance(0.0), momentum(0.0), position_size(0.0) {}
};

struct MomentumStatistics {
    double mean;
    double standard_deviation;
    bool degenerate;   // standard deviation was zero and the floor was substituted

    MomentumStatistics() : mean(0.0), standard_deviation(0.0), degenerate(false) {}
};

// Output of one run. Produced whole by generate_simulation and never mutated afterwards.
struct SimulationResult {
    std::vector<SimulationPoint> points;
    std::vector<NewsEvent> news_events;
    std::vector<DecisionRecord> decisions;
    MomentumStatistics momentum_statistics;
};

// Request objects (to avoid multi-parameter functions).
struct DecisionTransitionRequest {
    double signal_score;
    double position_size;
    int direction;
    DecisionTransitionRequest(double signal_score_param, double position_size_param, int direction_param)
        : signal_score(signal_score_param), position_size(position_size_param), direction(direction_param) {}
};

struct DecisionTransition {
    TradeDecision decision;
    double position_size;

    DecisionTransition() : decision(TradeDecision::OBSERVE), position_size(0.0) {}
    DecisionTransition(TradeDecision decision_param, double position_size_param)
        : decision(decision_param), position_size(position_size_param) {}
};

struct NewsContext {
    bool has_recent_news;
    double relevance;
    NewsPolarity polarity;

    NewsContext() : has_recent_news(false), relevance(0.0), polarity(NewsPolarity::NEUTRAL) {}
};

} // namespace Core
} // namespace PredictionTrader

#endif // DATA_STRUCTURES_HPP
