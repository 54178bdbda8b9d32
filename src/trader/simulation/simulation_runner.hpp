#ifndef SIMULATION_RUNNER_HPP
#define SIMULATION_RUNNER_HPP

#include <cstdint>
#include "configs/simulation_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "random_source.hpp"

using PredictionTrader::Config::SimulationConfig;

namespace PredictionTrader {
namespace Core {

/**
 * Runs the full pipeline: path, momentum statistics, news, decisions.
 * The configuration is validated before anything is generated; an invalid
 * configuration throws std::invalid_argument and no output is produced.
 */
SimulationResult generate_simulation(const SimulationConfig& config, RandomSource& random_source);
SimulationResult generate_simulation(const SimulationConfig& config, std::uint64_t seed);

} // namespace Core
} // namespace PredictionTrader

#endif // SIMULATION_RUNNER_HPP
