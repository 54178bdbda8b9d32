// ============================================================================
// test_simulation_runner.cpp
// End-to-end generate_simulation: bounds, decision log, determinism, validation
// ============================================================================

#include "test_framework.hpp"
#include "trader/simulation/simulation_runner.hpp"
#include "trader/trading_logic/decision_engine.hpp"
#include "trader/strategy_analysis/momentum_statistics.hpp"
#include <stdexcept>
#include <vector>

using namespace PredictionTrader::Core;

bool points_identical(const SimulationPoint& a, const SimulationPoint& b) {
    return a.index == b.index && a.t == b.t && a.prob == b.prob && a.momentum == b.momentum &&
           a.raw_change == b.raw_change && a.drift == b.drift && a.z == b.z && a.abs_z == b.abs_z &&
           a.news_relevance == b.news_relevance && a.news_polarity == b.news_polarity &&
           a.signal_score == b.signal_score && a.trade_threshold == b.trade_threshold &&
           a.position_size == b.position_size && a.risk_utilization == b.risk_utilization &&
           a.decision == b.decision;
}

void test_bounds_hold_across_seeds() {
    TEST_SECTION("Bounds hold across seeds");

    SimulationConfig config;
    bool probability_ok = true;
    bool position_ok = true;
    bool signal_ok = true;
    bool utilization_ok = true;
    bool threshold_ok = true;
    bool any_trade = false;
    for (std::uint64_t seed = 1; seed <= 20; ++seed) {
        SimulationResult result = generate_simulation(config, seed);
        for (const auto& point : result.points) {
            probability_ok = probability_ok && point.prob >= 0.04 && point.prob <= 0.96;
            position_ok = position_ok && point.position_size >= -1.0 && point.position_size <= 1.0;
            signal_ok = signal_ok && point.signal_score >= 0.0 && point.signal_score <= 1.0;
            utilization_ok = utilization_ok && point.risk_utilization >= 0 && point.risk_utilization <= 100;
            threshold_ok = threshold_ok && point.trade_threshold == 0.35;
        }
        any_trade = any_trade || !result.decisions.empty();
    }
    TEST_ASSERT(probability_ok, "prob within [0.04, 0.96]");
    TEST_ASSERT(position_ok, "position_size within [-1, 1]");
    TEST_ASSERT(signal_ok, "signal_score within [0, 1]");
    TEST_ASSERT(utilization_ok, "risk_utilization within [0, 100]");
    TEST_ASSERT(threshold_ok, "trade_threshold recorded on every point");
    TEST_ASSERT(any_trade, "Agent trades on at least one seed");
}

void test_decision_log_matches_points() {
    TEST_SECTION("Decision log matches points");

    SimulationConfig config;
    SimulationResult result = generate_simulation(config, 42);

    size_t non_observe_count = 0;
    size_t record_index = 0;
    bool records_match = true;
    for (const auto& point : result.points) {
        if (point.decision == TradeDecision::OBSERVE) {
            continue;
        }
        ++non_observe_count;
        if (record_index >= result.decisions.size()) {
            records_match = false;
            break;
        }
        const DecisionRecord& record = result.decisions[record_index++];
        records_match = records_match && record.t == point.t && record.index == point.index &&
                        record.position_size == point.position_size && record.decision == point.decision &&
                        record.signal_score == point.signal_score && record.prob == point.prob;
    }
    TEST_ASSERT(non_observe_count == result.decisions.size(), "One record per non-observe point");
    TEST_ASSERT(records_match, "Records carry the point's t, index, decision and position");
    TEST_ASSERT(result.points.size() == 400, "Default length is 400");

    bool news_aligned = true;
    for (const auto& event : result.news_events) {
        news_aligned = news_aligned && event.index >= 0 && event.index < static_cast<int>(result.points.size()) &&
                       result.points[event.index].t == event.t;
    }
    TEST_ASSERT(news_aligned, "Every news event time equals a point time");

    MomentumStatistics recomputed = compute_momentum_statistics(result.points);
    TEST_ASSERT(recomputed.mean == result.momentum_statistics.mean, "Result statistics describe the returned path");
}

void test_same_seed_identical() {
    TEST_SECTION("Same seed identical");

    SimulationConfig config;
    SimulationResult first_result = generate_simulation(config, 777);
    SimulationResult second_result = generate_simulation(config, 777);

    bool identical = first_result.points.size() == second_result.points.size() &&
                     first_result.news_events.size() == second_result.news_events.size() &&
                     first_result.decisions.size() == second_result.decisions.size();
    for (size_t i = 0; identical && i < first_result.points.size(); ++i) {
        identical = points_identical(first_result.points[i], second_result.points[i]);
    }
    for (size_t i = 0; identical && i < first_result.news_events.size(); ++i) {
        identical = first_result.news_events[i].t == second_result.news_events[i].t &&
                    first_result.news_events[i].relevance == second_result.news_events[i].relevance &&
                    first_result.news_events[i].headline == second_result.news_events[i].headline;
    }
    TEST_ASSERT(identical, "Same seed and config give bit-identical output");

    SimulationResult other_result = generate_simulation(config, 778);
    bool differs = false;
    for (size_t i = 0; i < other_result.points.size() && !differs; ++i) {
        differs = other_result.points[i].prob != first_result.points[i].prob;
    }
    TEST_ASSERT(differs, "Different seed gives a different path");
}

void test_midpoint_source_run() {
    TEST_SECTION("Midpoint source run");

    SimulationConfig config;
    config.length = 50;
    ConstantRandomSource random_source(0.5);
    SimulationResult result = generate_simulation(config, random_source);

    TEST_ASSERT(result.points.size() == 50, "Fifty points");
    TEST_ASSERT(result.news_events.empty(), "Coin 0.5 never emits news");
    bool no_news_relevance = true;
    for (const auto& point : result.points) {
        no_news_relevance = no_news_relevance && point.news_relevance == 0.0 && point.news_polarity == NewsPolarity::NEUTRAL;
    }
    TEST_ASSERT(no_news_relevance, "Points carry no news context");
}

void test_length_two_run() {
    TEST_SECTION("Length two run");

    SimulationConfig config;
    config.length = 2;
    SimulationResult result = generate_simulation(config, 9);
    TEST_ASSERT(result.points.size() == 2, "Two points");
    TEST_ASSERT(result.points[0].momentum == 0.0, "momentum[0] = 0");
    TEST_ASSERT(result.news_events.empty(), "No news without interior points");
}

void test_decision_engine_uses_recent_news() {
    TEST_SECTION("Decision engine uses recent news");

    SimulationConfig config;
    std::vector<SimulationPoint> points(20);
    for (size_t i = 0; i < points.size(); ++i) {
        points[i].index = static_cast<int>(i);
        points[i].t = static_cast<double>(i);
    }
    MomentumStatistics statistics;
    statistics.mean = 0.0;
    statistics.standard_deviation = 1.0;

    std::vector<NewsEvent> news_events(1);
    news_events[0].t = 5.0;
    news_events[0].index = 5;
    news_events[0].relevance = 1.0;
    news_events[0].polarity = NewsPolarity::POSITIVE;

    std::vector<DecisionRecord> decisions = run_decision_engine(points, news_events, statistics, config);

    TEST_ASSERT(points[0].news_relevance == 1.0, "Upcoming event within 6 already visible at t = 0");
    TEST_ASSERT_NEAR(points[0].signal_score, 0.4, 1e-12, "News-only score is 0.4");
    TEST_ASSERT(points[0].decision == TradeDecision::ENTER, "Score 0.4 enters from flat");
    TEST_ASSERT_NEAR(points[0].position_size, 0.4 * 0.35, 1e-12, "Zero z enters long");
    TEST_ASSERT(points[1].decision == TradeDecision::HOLD, "Next step holds");
    TEST_ASSERT(points[11].news_relevance == 0.0, "Event at t = 5 stale by t = 11");
    TEST_ASSERT(points[11].decision == TradeDecision::EXIT, "Signal collapse exits");
    TEST_ASSERT(points[11].risk_utilization == static_cast<int>(std::lround(std::fabs(points[11].position_size) * 100.0)), "Utilization follows position");
    TEST_ASSERT(!decisions.empty() && decisions.front().index == 0, "First record is the entry");
}

void test_invalid_config_rejected() {
    TEST_SECTION("Invalid config rejected");

    SimulationConfig short_config;
    short_config.length = 1;
    SimulationConfig inverted_bounds_config;
    inverted_bounds_config.path.probability_floor = 0.9;
    inverted_bounds_config.path.probability_ceiling = 0.1;
    SimulationConfig bad_probability_config;
    bad_probability_config.news.emission_probability = 1.5;
    SimulationConfig bad_risk_config;
    bad_risk_config.risk.max_position = 0.0;
    SimulationConfig oversized_risk_config;
    oversized_risk_config.risk.max_position = 3.0;
    oversized_risk_config.risk.risk_budget = 0.25;
    SimulationConfig unbounded_probability_config;
    unbounded_probability_config.path.probability_floor = 0.0;
    unbounded_probability_config.path.probability_ceiling = 1.0;

    for (const SimulationConfig* invalid_config : {&short_config, &inverted_bounds_config, &bad_probability_config, &bad_risk_config,
                                                   &oversized_risk_config, &unbounded_probability_config}) {
        bool threw = false;
        try {
            generate_simulation(*invalid_config, 1);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        TEST_ASSERT(threw, "Invalid configuration throws invalid_argument");
    }

    SequenceRandomSource untouched_source({0.3});
    bool short_threw = false;
    try {
        generate_simulation(short_config, untouched_source);
    } catch (const std::invalid_argument&) {
        short_threw = true;
    }
    TEST_ASSERT(short_threw && untouched_source.draws() == 0, "Validation happens before any draw");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "Simulation Runner Tests\n";
    std::cout << "========================================\n";

    test_bounds_hold_across_seeds();
    test_decision_log_matches_points();
    test_same_seed_identical();
    test_midpoint_source_run();
    test_length_two_run();
    test_decision_engine_uses_recent_news();
    test_invalid_config_rejected();

    return report_test_results("Simulation Runner");
}
