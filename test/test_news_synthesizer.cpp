// ============================================================================
// test_news_synthesizer.cpp
// Momentum-anomaly news: thresholds, coin flips, relevance, headlines
// ============================================================================

#include "test_framework.hpp"
#include "trader/news/news_synthesizer.hpp"
#include "trader/news/news_cursor.hpp"
#include "trader/strategy_analysis/momentum_statistics.hpp"
#include "trader/simulation/path_generator.hpp"
#include "trader/simulation/random_source.hpp"
#include <stdexcept>
#include <vector>

using namespace PredictionTrader::Core;
using PredictionTrader::Config::NewsConfig;
using PredictionTrader::Config::SignalConfig;

std::vector<SimulationPoint> make_points(const std::vector<double>& momentum_values) {
    std::vector<SimulationPoint> points;
    for (size_t i = 0; i < momentum_values.size(); ++i) {
        SimulationPoint point;
        point.index = static_cast<int>(i);
        point.t = static_cast<double>(i);
        point.momentum = momentum_values[i];
        points.push_back(point);
    }
    return points;
}

void test_spike_emits_event() {
    TEST_SECTION("Spike emits event");

    // mean 2, std 4, spike z = 2
    std::vector<SimulationPoint> points = make_points({0.0, 0.0, 10.0, 0.0, 0.0});
    MomentumStatistics statistics = compute_momentum_statistics(points);
    SequenceRandomSource random_source({0.1, 0.5, 0.6});
    std::vector<NewsEvent> events = synthesize_news_events(points, statistics, NewsConfig(), random_source);

    TEST_ASSERT(events.size() == 1, "One qualifying point, coin succeeds");
    TEST_ASSERT(events.size() == 1 && events[0].index == 2 && events[0].t == 2.0, "Event carries the point's index and time");
    TEST_ASSERT(events.size() == 1 && events[0].polarity == NewsPolarity::POSITIVE, "Positive z gives positive polarity");
    TEST_ASSERT(events.size() == 1 && std::fabs(events[0].relevance - 0.78) < 1e-12, "0.4 + (2 - 1.3) * 0.4 + 0.5 * 0.2");
    TEST_ASSERT(events.size() == 1 && events[0].headline == "Major fund signals confidence in scenario", "Headline index floor(0.6 * 4) = 2");
    TEST_ASSERT(random_source.draws() == 3, "Coin, jitter and headline draws only");
}

void test_failed_coin_is_silent() {
    TEST_SECTION("Failed coin is silent");

    std::vector<SimulationPoint> points = make_points({0.0, 0.0, 10.0, 0.0, 0.0});
    MomentumStatistics statistics = compute_momentum_statistics(points);
    SequenceRandomSource random_source({0.5});
    std::vector<NewsEvent> events = synthesize_news_events(points, statistics, NewsConfig(), random_source);

    TEST_ASSERT(events.empty(), "Coin 0.5 is not below 0.5");
    TEST_ASSERT(random_source.draws() == 1, "Non-qualifying points draw nothing");
}

void test_negative_spike() {
    TEST_SECTION("Negative spike");

    std::vector<SimulationPoint> points = make_points({0.0, 0.0, -10.0, 0.0, 0.0});
    MomentumStatistics statistics = compute_momentum_statistics(points);
    SequenceRandomSource random_source({0.0, 0.0, 0.99});
    std::vector<NewsEvent> events = synthesize_news_events(points, statistics, NewsConfig(), random_source);

    TEST_ASSERT(events.size() == 1, "Negative spike qualifies on |z|");
    TEST_ASSERT(events.size() == 1 && events[0].polarity == NewsPolarity::NEGATIVE, "Negative z gives negative polarity");
    TEST_ASSERT(events.size() == 1 && events[0].headline == "New report challenges baseline assumptions", "Last negative headline");
    TEST_ASSERT(events.size() == 1 && std::fabs(events[0].relevance - 0.68) < 1e-12, "Zero jitter relevance");
}

void test_endpoints_excluded() {
    TEST_SECTION("Endpoints excluded");

    std::vector<SimulationPoint> points = make_points({10.0, 0.0, 0.0, 0.0, -10.0});
    MomentumStatistics statistics = compute_momentum_statistics(points);
    SequenceRandomSource random_source({0.0});
    std::vector<NewsEvent> events = synthesize_news_events(points, statistics, NewsConfig(), random_source);

    TEST_ASSERT(events.empty(), "First and last points never emit news");
    TEST_ASSERT(random_source.draws() == 0, "No draws for endpoints");
}

void test_relevance_clamped() {
    TEST_SECTION("Relevance clamped");

    std::vector<double> momentum_values(50, 0.0);
    momentum_values[25] = 1.0;   // z = 7
    std::vector<SimulationPoint> points = make_points(momentum_values);
    MomentumStatistics statistics = compute_momentum_statistics(points);
    SequenceRandomSource random_source({0.0, 0.9, 0.0});
    std::vector<NewsEvent> events = synthesize_news_events(points, statistics, NewsConfig(), random_source);

    TEST_ASSERT(events.size() == 1, "Single extreme spike emits");
    TEST_ASSERT(events.size() == 1 && events[0].relevance == 1.0, "Relevance clamped to 1");
}

void test_short_paths_have_no_news() {
    TEST_SECTION("Short paths have no news");

    SimulationConfig config;
    config.length = 2;
    SeededRandomSource random_source(11);
    std::vector<SimulationPoint> points = generate_probability_path(config, random_source);
    MomentumStatistics statistics = compute_momentum_statistics(points);
    std::vector<NewsEvent> events = synthesize_news_events(points, statistics, config.news, random_source);
    TEST_ASSERT(events.empty(), "Length 2 has no interior points");

    std::vector<SimulationPoint> no_points;
    TEST_ASSERT(synthesize_news_events(no_points, statistics, config.news, random_source).empty(), "Empty path has no news");
}

void test_seeded_events_sparse_and_aligned() {
    TEST_SECTION("Seeded events sparse and aligned");

    SimulationConfig config;
    SeededRandomSource random_source(2024);
    std::vector<SimulationPoint> points = generate_probability_path(config, random_source);
    MomentumStatistics statistics = compute_momentum_statistics(points);
    std::vector<NewsEvent> events = synthesize_news_events(points, statistics, config.news, random_source);

    bool aligned = true;
    bool ordered = true;
    bool relevance_in_range = true;
    for (size_t i = 0; i < events.size(); ++i) {
        const NewsEvent& event = events[i];
        aligned = aligned && event.index > 0 && event.index < config.length - 1 && points[event.index].t == event.t;
        relevance_in_range = relevance_in_range && event.relevance >= 0.0 && event.relevance <= 1.0;
        if (i > 0) {
            ordered = ordered && events[i - 1].t < event.t;
        }
    }
    TEST_ASSERT(aligned, "Every event time equals an interior point time");
    TEST_ASSERT(ordered, "Events in strictly increasing time order");
    TEST_ASSERT(relevance_in_range, "Relevance within [0, 1]");
    TEST_ASSERT(events.size() < points.size() / 4, "News stays sparse");
}

void test_neutral_pool_rejected() {
    TEST_SECTION("Neutral pool rejected");

    bool threw = false;
    try {
        headline_pool(NewsPolarity::NEUTRAL);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    TEST_ASSERT(threw, "No headline pool for neutral polarity");
    TEST_ASSERT(headline_pool(NewsPolarity::POSITIVE).size() == 4, "Four positive headlines");
    TEST_ASSERT(headline_pool(NewsPolarity::NEGATIVE).size() == 4, "Four negative headlines");

    NewsEvent default_event;
    TEST_ASSERT(default_event.headline.empty() && default_event.polarity == NewsPolarity::NEUTRAL,
                "Default event is neutral with no headline");
}

void test_news_cursor_monotone() {
    TEST_SECTION("News cursor monotone");

    std::vector<NewsEvent> events(3);
    events[0].t = 10.0;
    events[0].relevance = 0.5;
    events[1].t = 20.0;
    events[1].relevance = 0.6;
    events[2].t = 40.0;
    events[2].relevance = 0.7;
    NewsCursor news_cursor(events);
    SignalConfig config;

    // Before any event the cursor sits on the first one, which counts inside the window
    NewsContext early_context = news_cursor.resolve_context(5.0, config);
    TEST_ASSERT(early_context.has_recent_news && early_context.relevance == 0.5, "Upcoming first event within 6 counts");
    TEST_ASSERT(!news_cursor.resolve_context(3.0, config).has_recent_news, "Upcoming first event beyond 6 ignored");

    size_t last_position = 0;
    bool monotone = true;
    for (double t = 0.0; t <= 50.0; t += 0.5) {
        news_cursor.advance_to(t);
        monotone = monotone && news_cursor.position() >= last_position;
        last_position = news_cursor.position();
    }
    TEST_ASSERT(monotone, "Cursor never regresses");
    TEST_ASSERT(news_cursor.position() == 2, "Cursor ends on the last event");

    NewsCursor replay_cursor(events);
    NewsContext context = replay_cursor.resolve_context(25.0, config);
    TEST_ASSERT(context.has_recent_news && context.relevance == 0.6, "Most recent event at t = 20 within window");
    context = replay_cursor.resolve_context(30.0, config);
    TEST_ASSERT(!context.has_recent_news && context.relevance == 0.0, "Stale event outside window contributes nothing");
    context = replay_cursor.resolve_context(10.0, config);
    TEST_ASSERT(replay_cursor.position() == 1, "Earlier query does not rewind");

    std::vector<NewsEvent> no_events;
    NewsCursor empty_cursor(no_events);
    TEST_ASSERT(empty_cursor.advance_to(10.0) == nullptr, "Empty cursor yields nothing");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "News Synthesizer Tests\n";
    std::cout << "========================================\n";

    test_spike_emits_event();
    test_failed_coin_is_silent();
    test_negative_spike();
    test_endpoints_excluded();
    test_relevance_clamped();
    test_short_paths_have_no_news();
    test_seeded_events_sparse_and_aligned();
    test_neutral_pool_rejected();
    test_news_cursor_monotone();

    return report_test_results("News Synthesizer");
}
