#ifndef SIMULATION_CONFIG_HPP
#define SIMULATION_CONFIG_HPP

#include <vector>
#include "strategy_config.hpp"
#include "risk_config.hpp"

namespace PredictionTrader {
namespace Config {

/**
 * One scheduled drift adjustment. Applied once, on the step whose time lies
 * within half a time-step of trigger_time.
 */
struct RegimeShift {
    double trigger_time;
    double drift_delta;
};

inline std::vector<RegimeShift> default_regime_schedule() {
    return {
        {20.0, 0.02},
        {45.0, -0.03},
        {70.0, 0.025}
    };
}

struct PathConfig {
    double time_horizon = 100.0;                     // Simulated time spanned by the path
    double initial_probability = 0.5;                // Probability before the first step
    double probability_floor = 0.04;
    double probability_ceiling = 0.96;
    double noise_intensity = 0.35;                   // Scale of each smoothed noise increment
    double drift_step_coefficient = 0.04;            // Drift contribution per step
    double noise_step_coefficient = 0.02;            // Noise contribution per step
    std::vector<RegimeShift> regimes = default_regime_schedule();
};

struct NewsConfig {
    double z_threshold = 1.3;                        // |z| needed before a point can produce news
    double emission_probability = 0.5;              // Coin flip applied to qualifying points
    double base_relevance = 0.4;
    double relevance_per_z = 0.4;                    // Extra relevance per unit of |z| above threshold
    double relevance_jitter = 0.2;                   // Uniform jitter added to relevance
};

/**
 * Complete configuration of one simulation run.
 * Defaults reproduce the reference market: 400 points over 100 time units.
 */
struct SimulationConfig {
    int length = 400;
    PathConfig path;
    NewsConfig news;
    SignalConfig signal;
    DecisionConfig decision;
    RiskConfig risk;
};

} // namespace Config
} // namespace PredictionTrader

#endif // SIMULATION_CONFIG_HPP
