#ifndef STRATEGY_LOGIC_HPP
#define STRATEGY_LOGIC_HPP

#include "configs/simulation_config.hpp"
#include "trader/data_structures/data_structures.hpp"

using PredictionTrader::Config::SimulationConfig;
using PredictionTrader::Config::SignalConfig;
using PredictionTrader::Config::DecisionConfig;

namespace PredictionTrader {
namespace Core {

double compute_momentum_component(double abs_z_score, const SignalConfig& config);
double compute_signal_score(double abs_z_score, double news_relevance, const SignalConfig& config);

// Long when momentum z is non-negative, short otherwise.
int direction_from_z_score(double z_score);

TradeDecision select_trade_decision(double signal_score, double position_size, const SimulationConfig& config);

/**
 * Decision state machine step.
 * Pure transition: (signal score, position, direction) -> (decision, new position).
 */
DecisionTransition evaluate_decision_transition(const DecisionTransitionRequest& request, const SimulationConfig& config);

} // namespace Core
} // namespace PredictionTrader

#endif // STRATEGY_LOGIC_HPP
