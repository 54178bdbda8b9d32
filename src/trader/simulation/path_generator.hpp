#ifndef PATH_GENERATOR_HPP
#define PATH_GENERATOR_HPP

#include <vector>
#include "configs/simulation_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "random_source.hpp"

using PredictionTrader::Config::SimulationConfig;

namespace PredictionTrader {
namespace Core {

double compute_time_step(const SimulationConfig& config);

/**
 * First pass: builds the probability path.
 * Only index, t, prob, momentum, raw_change and drift are populated.
 * Throws std::invalid_argument when config.length < 2.
 */
std::vector<SimulationPoint> generate_probability_path(const SimulationConfig& config, RandomSource& random_source);

} // namespace Core
} // namespace PredictionTrader

#endif // PATH_GENERATOR_HPP
