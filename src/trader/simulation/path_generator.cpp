#include "path_generator.hpp"
#include "noise_process.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace PredictionTrader {
namespace Core {

double compute_time_step(const SimulationConfig& config) {
    if (config.length < 2) {
        throw std::invalid_argument("simulation.length must be >= 2, got " + std::to_string(config.length));
    }
    return config.path.time_horizon / static_cast<double>(config.length - 1);
}

std::vector<SimulationPoint> generate_probability_path(const SimulationConfig& config, RandomSource& random_source) {
    const double time_step = compute_time_step(config);
    const double half_time_step = time_step / 2.0;
    const Config::PathConfig& path_config = config.path;

    std::vector<SimulationPoint> points;
    points.reserve(static_cast<size_t>(config.length));

    // Each regime fires at most once, even if rounding puts two steps inside the window
    std::vector<bool> regime_fired(path_config.regimes.size(), false);

    double probability = path_config.initial_probability;
    double drift = 0.0;
    double noise = 0.0;

    for (int point_index = 0; point_index < config.length; ++point_index) {
        const double current_time = point_index * time_step;

        for (size_t regime_index = 0; regime_index < path_config.regimes.size(); ++regime_index) {
            const Config::RegimeShift& regime = path_config.regimes[regime_index];
            if (!regime_fired[regime_index] && std::abs(current_time - regime.trigger_time) < half_time_step) {
                drift += regime.drift_delta;
                regime_fired[regime_index] = true;
            }
        }

        noise = next_noise_value(noise, path_config.noise_intensity, random_source);
        const double step_change = drift * path_config.drift_step_coefficient + noise * path_config.noise_step_coefficient;
        const double previous_probability = probability;
        probability = std::clamp(probability + step_change, path_config.probability_floor, path_config.probability_ceiling);

        SimulationPoint point;
        point.index = point_index;
        point.t = current_time;
        point.prob = probability;
        // Clamped probability, so momentum can read below step_change / dt near the bounds
        point.momentum = point_index == 0 ? 0.0 : (probability - points.back().prob) / time_step;
        point.raw_change = probability - previous_probability;
        point.drift = drift;
        points.push_back(point);
    }

    return points;
}

} // namespace Core
} // namespace PredictionTrader
