#ifndef RISK_MANAGER_HPP
#define RISK_MANAGER_HPP

#include "configs/simulation_config.hpp"
#include "trader/data_structures/data_structures.hpp"

using PredictionTrader::Config::SimulationConfig;

namespace PredictionTrader {
namespace Core {

/**
 * Position sizing and risk accounting for the decision engine.
 * Keeps every position inside [-max_position, max_position].
 */
class RiskManager {
public:
    explicit RiskManager(const SimulationConfig& config);

    double apply_position_update(TradeDecision decision, double position_size, double signal_score, int direction) const;
    int calculate_risk_utilization(double position_size) const;
    bool has_scaling_capacity(double position_size) const;
    double clamp_position(double position_size) const;

private:
    const SimulationConfig& config;

    double calculate_entry_delta(double signal_score, int direction) const;
    double calculate_scale_delta(double signal_score, int direction) const;
};

} // namespace Core
} // namespace PredictionTrader

#endif // RISK_MANAGER_HPP
