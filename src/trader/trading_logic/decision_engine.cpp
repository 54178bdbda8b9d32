#include "decision_engine.hpp"
#include "trader/news/news_cursor.hpp"
#include "trader/strategy_analysis/momentum_statistics.hpp"
#include "trader/strategy_analysis/risk_manager.hpp"
#include "trader/strategy_analysis/strategy_logic.hpp"
#include <cmath>

namespace PredictionTrader {
namespace Core {

DecisionRecord build_decision_record(const SimulationPoint& point) {
    DecisionRecord record;
    record.t = point.t;
    record.index = point.index;
    record.prob = point.prob;
    record.decision = point.decision;
    record.signal_score = point.signal_score;
    record.news_relevance = point.news_relevance;
    record.momentum = point.momentum;
    record.position_size = point.position_size;
    return record;
}

std::vector<DecisionRecord> run_decision_engine(std::vector<SimulationPoint>& points,
                                                const std::vector<NewsEvent>& news_events,
                                                const MomentumStatistics& statistics,
                                                const SimulationConfig& config) {
    std::vector<DecisionRecord> decisions;
    RiskManager risk_manager(config);
    NewsCursor news_cursor(news_events);
    double position_size = 0.0;

    for (auto& point : points) {
        const double z_score = compute_z_score(point.momentum, statistics);
        const double abs_z_score = std::abs(z_score);

        NewsContext news_context = news_cursor.resolve_context(point.t, config.signal);
        const double signal_score = compute_signal_score(abs_z_score, news_context.relevance, config.signal);

        // Direction follows the momentum sign even when news dominates the score
        DecisionTransitionRequest transition_request(signal_score, position_size, direction_from_z_score(z_score));
        DecisionTransition transition = evaluate_decision_transition(transition_request, config);
        position_size = transition.position_size;

        point.z = z_score;
        point.abs_z = abs_z_score;
        point.news_relevance = news_context.relevance;
        point.news_polarity = news_context.polarity;
        point.signal_score = signal_score;
        point.trade_threshold = config.decision.trade_threshold;
        point.position_size = position_size;
        point.risk_utilization = risk_manager.calculate_risk_utilization(position_size);
        point.decision = transition.decision;

        if (point.decision != TradeDecision::OBSERVE) {
            decisions.push_back(build_decision_record(point));
        }
    }

    return decisions;
}

} // namespace Core
} // namespace PredictionTrader
