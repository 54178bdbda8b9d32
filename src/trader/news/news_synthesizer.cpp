#include "news_synthesizer.hpp"
#include "trader/strategy_analysis/momentum_statistics.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace PredictionTrader {
namespace Core {

namespace {
    const std::vector<std::string> POSITIVE_HEADLINES = {
        "Polls tighten in favor of outcome",
        "Key indicator surprises to the upside",
        "Major fund signals confidence in scenario",
        "Market liquidity spikes as buyers step in"
    };

    const std::vector<std::string> NEGATIVE_HEADLINES = {
        "Unexpected data undermines prior consensus",
        "Key stakeholder walks back earlier commitment",
        "Liquidity thins out as traders de-risk",
        "New report challenges baseline assumptions"
    };
}

const std::vector<std::string>& headline_pool(NewsPolarity polarity) {
    switch (polarity) {
        case NewsPolarity::POSITIVE:
            return POSITIVE_HEADLINES;
        case NewsPolarity::NEGATIVE:
            return NEGATIVE_HEADLINES;
        default:
            throw std::invalid_argument("No headline pool for neutral polarity");
    }
}

std::string select_headline(NewsPolarity polarity, RandomSource& random_source) {
    const std::vector<std::string>& pool = headline_pool(polarity);
    size_t headline_index = static_cast<size_t>(std::floor(random_source.next_unit() * static_cast<double>(pool.size())));
    headline_index = std::min(headline_index, pool.size() - 1);
    return pool[headline_index];
}

std::vector<NewsEvent> synthesize_news_events(const std::vector<SimulationPoint>& points,
                                              const MomentumStatistics& statistics,
                                              const NewsConfig& config,
                                              RandomSource& random_source) {
    std::vector<NewsEvent> news_events;
    if (points.size() < 3) {
        return news_events;
    }

    for (size_t point_index = 1; point_index + 1 < points.size(); ++point_index) {
        const SimulationPoint& point = points[point_index];
        const double z_score = compute_z_score(point.momentum, statistics);
        const double abs_z_score = std::abs(z_score);

        // Coin is only drawn for qualifying points
        if (abs_z_score > config.z_threshold && random_source.next_unit() < config.emission_probability) {
            NewsEvent news_event;
            news_event.t = point.t;
            news_event.index = point.index;
            news_event.relevance = std::clamp(
                config.base_relevance + (abs_z_score - config.z_threshold) * config.relevance_per_z +
                    random_source.next_unit() * config.relevance_jitter,
                0.0, 1.0);
            news_event.polarity = z_score > 0.0 ? NewsPolarity::POSITIVE : NewsPolarity::NEGATIVE;
            news_event.headline = select_headline(news_event.polarity, random_source);
            news_events.push_back(news_event);
        }
    }

    return news_events;
}

} // namespace Core
} // namespace PredictionTrader
