#ifndef NOISE_PROCESS_HPP
#define NOISE_PROCESS_HPP

#include "random_source.hpp"

namespace PredictionTrader {
namespace Core {

constexpr double NOISE_LOWER_BOUND = -1.0;
constexpr double NOISE_UPPER_BOUND = 1.0;

// Smoothed noise: previous value plus a centred uniform step, clamped to [-1, 1].
// The caller threads the returned value into the next call.
double next_noise_value(double previous_noise, double intensity, RandomSource& random_source);

} // namespace Core
} // namespace PredictionTrader

#endif // NOISE_PROCESS_HPP
