#ifndef DECISION_ENGINE_HPP
#define DECISION_ENGINE_HPP

#include <vector>
#include "configs/simulation_config.hpp"
#include "trader/data_structures/data_structures.hpp"

using PredictionTrader::Config::SimulationConfig;

namespace PredictionTrader {
namespace Core {

/**
 * Second pass over a finished path.
 * Scores every point from its momentum z-score and recent news, steps the
 * decision state machine, and enriches the points in place. Returns the
 * decision log: one record per point whose decision is not observe.
 */
std::vector<DecisionRecord> run_decision_engine(std::vector<SimulationPoint>& points,
                                                const std::vector<NewsEvent>& news_events,
                                                const MomentumStatistics& statistics,
                                                const SimulationConfig& config);

DecisionRecord build_decision_record(const SimulationPoint& point);

} // namespace Core
} // namespace PredictionTrader

#endif // DECISION_ENGINE_HPP
