#ifndef MOMENTUM_STATISTICS_HPP
#define MOMENTUM_STATISTICS_HPP

#include <vector>
#include "trader/data_structures/data_structures.hpp"

namespace PredictionTrader {
namespace Core {

// Substituted for a zero standard deviation so z-scores stay finite.
constexpr double STANDARD_DEVIATION_FLOOR = 1e-6;

MomentumStatistics compute_momentum_statistics(const std::vector<double>& momentum_values);
MomentumStatistics compute_momentum_statistics(const std::vector<SimulationPoint>& points);

double compute_z_score(double momentum, const MomentumStatistics& statistics);

} // namespace Core
} // namespace PredictionTrader

#endif // MOMENTUM_STATISTICS_HPP
