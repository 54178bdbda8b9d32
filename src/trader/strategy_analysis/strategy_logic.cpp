#include "strategy_logic.hpp"
#include "risk_manager.hpp"
#include <algorithm>

namespace PredictionTrader {
namespace Core {

double compute_momentum_component(double abs_z_score, const SignalConfig& config) {
    return std::clamp((abs_z_score - config.momentum_z_floor) / config.momentum_z_span, 0.0, 1.0);
}

double compute_signal_score(double abs_z_score, double news_relevance, const SignalConfig& config) {
    double momentum_component = compute_momentum_component(abs_z_score, config);
    return std::clamp(config.momentum_weight * momentum_component + config.news_weight * news_relevance, 0.0, 1.0);
}

int direction_from_z_score(double z_score) {
    return z_score >= 0.0 ? 1 : -1;
}

TradeDecision select_trade_decision(double signal_score, double position_size, const SimulationConfig& config) {
    const DecisionConfig& decision_config = config.decision;
    RiskManager risk_manager(config);

    TradeDecision decision = TradeDecision::OBSERVE;

    if (signal_score > decision_config.trade_threshold) {
        if (position_size == 0.0) {
            decision = TradeDecision::ENTER;
        } else if (signal_score > decision_config.high_conviction_threshold && risk_manager.has_scaling_capacity(position_size)) {
            decision = TradeDecision::SCALE;
        } else {
            decision = TradeDecision::HOLD;
        }
    }

    // Risk-off takes priority over everything above
    if (signal_score < decision_config.trade_threshold * decision_config.exit_relaxation_factor && position_size != 0.0) {
        decision = TradeDecision::EXIT;
    }

    return decision;
}

DecisionTransition evaluate_decision_transition(const DecisionTransitionRequest& request, const SimulationConfig& config) {
    RiskManager risk_manager(config);
    TradeDecision decision = select_trade_decision(request.signal_score, request.position_size, config);
    double next_position_size = risk_manager.apply_position_update(decision, request.position_size, request.signal_score, request.direction);
    return DecisionTransition(decision, next_position_size);
}

} // namespace Core
} // namespace PredictionTrader
