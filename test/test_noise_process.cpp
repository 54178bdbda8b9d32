// ============================================================================
// test_noise_process.cpp
// Smoothed noise process and random sources
// ============================================================================

#include "test_framework.hpp"
#include "trader/simulation/noise_process.hpp"
#include "trader/simulation/random_source.hpp"
#include <stdexcept>
#include <vector>

using namespace PredictionTrader::Core;

void test_midpoint_draw_keeps_noise() {
    TEST_SECTION("Midpoint draw keeps noise");

    ConstantRandomSource random_source(0.5);
    TEST_ASSERT(next_noise_value(0.0, 0.35, random_source) == 0.0, "Zero noise stays zero on a 0.5 draw");
    TEST_ASSERT(next_noise_value(0.3, 0.35, random_source) == 0.3, "Previous noise carried through on a 0.5 draw");
}

void test_step_is_centred_and_scaled() {
    TEST_SECTION("Step is centred and scaled by intensity");

    SequenceRandomSource random_source({0.75, 0.25});
    TEST_ASSERT_NEAR(next_noise_value(0.0, 0.4, random_source), 0.1, 1e-12, "0.75 draw adds +0.25 * intensity");
    TEST_ASSERT_NEAR(next_noise_value(0.0, 0.4, random_source), -0.1, 1e-12, "0.25 draw adds -0.25 * intensity");
}

void test_noise_clamped_to_unit_band() {
    TEST_SECTION("Noise clamped to [-1, 1]");

    SequenceRandomSource high_source({0.99});
    double noise = 0.0;
    for (int i = 0; i < 100; ++i) {
        noise = next_noise_value(noise, 0.35, high_source);
        TEST_ASSERT(noise <= NOISE_UPPER_BOUND, "Noise never exceeds upper bound");
    }
    TEST_ASSERT(noise == NOISE_UPPER_BOUND, "Persistent high draws saturate at +1");

    SequenceRandomSource low_source({0.0});
    noise = 0.0;
    for (int i = 0; i < 100; ++i) {
        noise = next_noise_value(noise, 0.35, low_source);
    }
    TEST_ASSERT(noise == NOISE_LOWER_BOUND, "Persistent low draws saturate at -1");
}

void test_seeded_source_reproducible() {
    TEST_SECTION("Seeded source reproducible");

    SeededRandomSource first_source(7);
    SeededRandomSource second_source(7);
    SeededRandomSource other_source(8);
    bool identical = true;
    bool differs = false;
    bool in_range = true;
    for (int i = 0; i < 1000; ++i) {
        double first_value = first_source.next_unit();
        double second_value = second_source.next_unit();
        double other_value = other_source.next_unit();
        identical = identical && first_value == second_value;
        differs = differs || first_value != other_value;
        in_range = in_range && first_value >= 0.0 && first_value < 1.0;
    }
    TEST_ASSERT(identical, "Same seed yields the same sequence");
    TEST_ASSERT(differs, "Different seeds yield different sequences");
    TEST_ASSERT(in_range, "Draws lie in [0, 1)");
}

void test_sequence_source_wraps_and_counts() {
    TEST_SECTION("Sequence source wraps and counts draws");

    SequenceRandomSource random_source({0.1, 0.2});
    TEST_ASSERT(random_source.next_unit() == 0.1, "First value");
    TEST_ASSERT(random_source.next_unit() == 0.2, "Second value");
    TEST_ASSERT(random_source.next_unit() == 0.1, "Wraps to the start");
    TEST_ASSERT(random_source.draws() == 3, "Three draws counted");
}

void test_invalid_sources_rejected() {
    TEST_SECTION("Invalid source values rejected");

    bool constant_threw = false;
    try {
        ConstantRandomSource random_source(1.0);
    } catch (const std::invalid_argument&) {
        constant_threw = true;
    }
    TEST_ASSERT(constant_threw, "Constant 1.0 is outside [0, 1)");

    bool empty_threw = false;
    try {
        SequenceRandomSource random_source(std::vector<double>{});
    } catch (const std::invalid_argument&) {
        empty_threw = true;
    }
    TEST_ASSERT(empty_threw, "Empty sequence rejected");

    bool negative_threw = false;
    try {
        SequenceRandomSource random_source({0.2, -0.1});
    } catch (const std::invalid_argument&) {
        negative_threw = true;
    }
    TEST_ASSERT(negative_threw, "Negative sequence value rejected");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "Noise Process Tests\n";
    std::cout << "========================================\n";

    test_midpoint_draw_keeps_noise();
    test_step_is_centred_and_scaled();
    test_noise_clamped_to_unit_band();
    test_seeded_source_reproducible();
    test_sequence_source_wraps_and_counts();
    test_invalid_sources_rejected();

    return report_test_results("Noise Process");
}
