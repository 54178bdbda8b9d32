#ifndef NEWS_SYNTHESIZER_HPP
#define NEWS_SYNTHESIZER_HPP

#include <string>
#include <vector>
#include "configs/simulation_config.hpp"
#include "trader/data_structures/data_structures.hpp"
#include "trader/simulation/random_source.hpp"

using PredictionTrader::Config::NewsConfig;

namespace PredictionTrader {
namespace Core {

const std::vector<std::string>& headline_pool(NewsPolarity polarity);
std::string select_headline(NewsPolarity polarity, RandomSource& random_source);

/**
 * Scans interior points (first and last excluded) for momentum anomalies.
 * A point with |z| above the threshold emits a news event only if an
 * independent coin flip succeeds, so news stays sparse.
 * Events come out in point order.
 */
std::vector<NewsEvent> synthesize_news_events(const std::vector<SimulationPoint>& points,
                                              const MomentumStatistics& statistics,
                                              const NewsConfig& config,
                                              RandomSource& random_source);

} // namespace Core
} // namespace PredictionTrader

#endif // NEWS_SYNTHESIZER_HPP
