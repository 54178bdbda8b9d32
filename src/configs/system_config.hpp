#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include <cstdint>
#include "simulation_config.hpp"
#include "feed_config.hpp"
#include "logging_config.hpp"

namespace PredictionTrader {
namespace Config {

/**
 * Main application configuration.
 * Simulation config holds everything the generator needs; feed and logging
 * only shape how a finished run is reported.
 */
struct SystemConfig {
    SimulationConfig simulation;       // Path, news, signal, decision and risk parameters
    std::uint64_t seed = 42;           // Seed for the run's random source
    FeedConfig feed;                   // Report windows and display thresholds
    LoggingConfig logging;             // Logging and output files
};

} // namespace Config
} // namespace PredictionTrader

#endif // SYSTEM_CONFIG_HPP
