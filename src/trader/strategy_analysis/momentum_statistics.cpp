#include "momentum_statistics.hpp"
#include <cmath>
#include <stdexcept>

namespace PredictionTrader {
namespace Core {

MomentumStatistics compute_momentum_statistics(const std::vector<double>& momentum_values) {
    if (momentum_values.empty()) {
        throw std::invalid_argument("Momentum statistics require at least one value");
    }

    const double sample_count = static_cast<double>(momentum_values.size());

    double momentum_sum = 0.0;
    for (double momentum_value : momentum_values) {
        momentum_sum += momentum_value;
    }
    const double mean_value = momentum_sum / sample_count;

    // Population variance: divide by N
    double squared_deviation_sum = 0.0;
    for (double momentum_value : momentum_values) {
        squared_deviation_sum += (momentum_value - mean_value) * (momentum_value - mean_value);
    }
    const double variance_value = squared_deviation_sum / sample_count;

    MomentumStatistics statistics;
    statistics.mean = mean_value;
    statistics.standard_deviation = std::sqrt(variance_value);
    if (statistics.standard_deviation == 0.0) {
        statistics.standard_deviation = STANDARD_DEVIATION_FLOOR;
        statistics.degenerate = true;
    }
    return statistics;
}

MomentumStatistics compute_momentum_statistics(const std::vector<SimulationPoint>& points) {
    std::vector<double> momentum_values;
    momentum_values.reserve(points.size());
    for (const auto& point : points) {
        momentum_values.push_back(point.momentum);
    }
    return compute_momentum_statistics(momentum_values);
}

double compute_z_score(double momentum, const MomentumStatistics& statistics) {
    return (momentum - statistics.mean) / statistics.standard_deviation;
}

} // namespace Core
} // namespace PredictionTrader
