#include "risk_manager.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace PredictionTrader {
namespace Core {

RiskManager::RiskManager(const SimulationConfig& simulation_config) : config(simulation_config) {}

double RiskManager::calculate_entry_delta(double signal_score, int direction) const {
    return signal_score * config.decision.entry_sizing_coefficient * direction;
}

double RiskManager::calculate_scale_delta(double signal_score, int direction) const {
    return signal_score * config.decision.entry_sizing_coefficient * config.decision.scale_sizing_factor * direction;
}

double RiskManager::clamp_position(double position_size) const {
    return std::clamp(position_size, -config.risk.max_position, config.risk.max_position);
}

bool RiskManager::has_scaling_capacity(double position_size) const {
    return std::abs(position_size) < config.risk.max_position;
}

double RiskManager::apply_position_update(TradeDecision decision, double position_size, double signal_score, int direction) const {
    if (!std::isfinite(position_size) || !std::isfinite(signal_score)) {
        throw std::runtime_error("Invalid position update input: position=" + std::to_string(position_size) +
                                 " signal=" + std::to_string(signal_score));
    }

    switch (decision) {
        case TradeDecision::ENTER:
            return clamp_position(position_size + calculate_entry_delta(signal_score, direction));
        case TradeDecision::SCALE:
            return clamp_position(position_size + calculate_scale_delta(signal_score, direction));
        case TradeDecision::HOLD:
            // Slow decay toward flat while keeping exposure
            return position_size * config.decision.hold_decay;
        case TradeDecision::EXIT:
            // Rapid de-risk, not an instant flatten
            return position_size * config.decision.exit_decay;
        case TradeDecision::OBSERVE:
        default:
            return position_size;
    }
}

int RiskManager::calculate_risk_utilization(double position_size) const {
    const double risk_capacity = config.risk.max_position * config.risk.risk_budget;
    if (risk_capacity <= 0.0 || !std::isfinite(risk_capacity)) {
        throw std::runtime_error("Invalid risk capacity for utilization: " + std::to_string(risk_capacity));
    }
    return static_cast<int>(std::lround(std::abs(position_size) / risk_capacity * 100.0));
}

} // namespace Core
} // namespace PredictionTrader
