// RiskConfig.hpp
#ifndef RISK_CONFIG_HPP
#define RISK_CONFIG_HPP

namespace PredictionTrader {
namespace Config {

struct RiskConfig {
    double max_position = 1.0;     // Absolute position cap, position_size stays in [-max, max]
    double risk_budget = 1.0;      // Fraction of max_position counted as 100% utilization
};

} // namespace Config
} // namespace PredictionTrader

#endif // RISK_CONFIG_HPP
