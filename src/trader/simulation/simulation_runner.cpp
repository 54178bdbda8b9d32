#include "simulation_runner.hpp"
#include "path_generator.hpp"
#include "trader/config_loader/config_loader.hpp"
#include "trader/news/news_synthesizer.hpp"
#include "trader/strategy_analysis/momentum_statistics.hpp"
#include "trader/trading_logic/decision_engine.hpp"
#include <stdexcept>
#include <string>

namespace PredictionTrader {
namespace Core {

SimulationResult generate_simulation(const SimulationConfig& config, RandomSource& random_source) {
    std::string validation_error;
    if (!validate_simulation_config(config, validation_error)) {
        throw std::invalid_argument("Invalid simulation configuration: " + validation_error);
    }

    SimulationResult result;
    result.points = generate_probability_path(config, random_source);
    result.momentum_statistics = compute_momentum_statistics(result.points);
    result.news_events = synthesize_news_events(result.points, result.momentum_statistics, config.news, random_source);
    result.decisions = run_decision_engine(result.points, result.news_events, result.momentum_statistics, config);
    return result;
}

SimulationResult generate_simulation(const SimulationConfig& config, std::uint64_t seed) {
    SeededRandomSource random_source(seed);
    return generate_simulation(config, random_source);
}

} // namespace Core
} // namespace PredictionTrader
