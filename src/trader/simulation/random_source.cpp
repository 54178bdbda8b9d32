#include "random_source.hpp"
#include <stdexcept>
#include <string>

namespace PredictionTrader {
namespace Core {

namespace {
    constexpr int MANTISSA_SHIFT = 11;
    constexpr double TWO_POW_MINUS_53 = 1.0 / 9007199254740992.0;

    void validate_unit_value(double value) {
        if (!(value >= 0.0 && value < 1.0)) {
            throw std::invalid_argument("Random source values must lie in [0, 1): " + std::to_string(value));
        }
    }
}

double SeededRandomSource::next_unit() {
    return static_cast<double>(engine() >> MANTISSA_SHIFT) * TWO_POW_MINUS_53;
}

ConstantRandomSource::ConstantRandomSource(double constant_value) : value(constant_value) {
    validate_unit_value(constant_value);
}

SequenceRandomSource::SequenceRandomSource(const std::vector<double>& sequence_values)
    : values(sequence_values), draw_count(0) {
    if (values.empty()) {
        throw std::invalid_argument("Sequence random source requires at least one value");
    }
    for (double sequence_value : values) {
        validate_unit_value(sequence_value);
    }
}

double SequenceRandomSource::next_unit() {
    double next_value = values[draw_count % values.size()];
    ++draw_count;
    return next_value;
}

} // namespace Core
} // namespace PredictionTrader
