#include "noise_process.hpp"
#include <algorithm>

namespace PredictionTrader {
namespace Core {

double next_noise_value(double previous_noise, double intensity, RandomSource& random_source) {
    double raw_noise = previous_noise + (random_source.next_unit() - 0.5) * intensity;
    return std::clamp(raw_noise, NOISE_LOWER_BOUND, NOISE_UPPER_BOUND);
}

} // namespace Core
} // namespace PredictionTrader
