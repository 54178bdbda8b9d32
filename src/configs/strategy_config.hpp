#ifndef STRATEGY_CONFIG_HPP
#define STRATEGY_CONFIG_HPP

namespace PredictionTrader {
namespace Config {

struct SignalConfig {
    // ========================================================================
    // NEWS RELEVANCE
    // ========================================================================

    double relevance_time_window = 6.0;              // Max |news.t - point.t| for news to count as recent

    // ========================================================================
    // SIGNAL SCORE COMPOSITION
    // ========================================================================

    double momentum_z_floor = 0.4;                   // |z| below this contributes nothing
    double momentum_z_span = 2.4;                    // |z| range mapped onto [0, 1]
    double momentum_weight = 0.6;                    // Weight of the momentum component
    double news_weight = 0.4;                        // Weight of recent news relevance
};

struct DecisionConfig {
    // ========================================================================
    // DECISION THRESHOLDS
    // ========================================================================

    double trade_threshold = 0.35;                   // Signal score needed to act
    double high_conviction_threshold = 0.7;          // Signal score needed to scale an open position
    double exit_relaxation_factor = 0.6;             // Exit when score < trade_threshold * factor

    // ========================================================================
    // POSITION SIZING
    // ========================================================================

    double entry_sizing_coefficient = 0.35;          // Position delta per unit of signal on entry
    double scale_sizing_factor = 0.7;                // Scale delta = entry delta * factor
    double hold_decay = 0.995;                       // Per-step decay while holding
    double exit_decay = 0.3;                         // Position multiplier on exit
};

} // namespace Config
} // namespace PredictionTrader

#endif // STRATEGY_CONFIG_HPP
