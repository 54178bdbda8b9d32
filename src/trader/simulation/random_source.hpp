#ifndef RANDOM_SOURCE_HPP
#define RANDOM_SOURCE_HPP

#include <cstdint>
#include <random>
#include <vector>

namespace PredictionTrader {
namespace Core {

/**
 * Uniform random source on [0, 1).
 * Every draw a simulation makes goes through one of these, so a run is
 * reproducible from its source alone.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double next_unit() = 0;
};

// Mersenne twister mapped onto 53-bit doubles; identical sequence on every standard library.
class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(std::uint64_t seed_value) : engine(seed_value) {}
    double next_unit() override;

private:
    std::mt19937_64 engine;
};

class ConstantRandomSource : public RandomSource {
public:
    explicit ConstantRandomSource(double constant_value);
    double next_unit() override { return value; }

private:
    double value;
};

// Replays a fixed sequence, wrapping around at the end.
class SequenceRandomSource : public RandomSource {
public:
    explicit SequenceRandomSource(const std::vector<double>& sequence_values);
    double next_unit() override;
    size_t draws() const { return draw_count; }

private:
    std::vector<double> values;
    size_t draw_count;
};

} // namespace Core
} // namespace PredictionTrader

#endif // RANDOM_SOURCE_HPP
