#ifndef FEED_CONFIG_HPP
#define FEED_CONFIG_HPP

namespace PredictionTrader {
namespace Config {

struct FeedConfig {
    double decision_window = 40.0;                   // Trailing time window for the decision log
    double news_window = 50.0;                       // Trailing time window for the news feed
    double report_time = -1.0;                       // Time the report is taken at (negative = end of run)
    double news_relevance_mention_threshold = 0.25;  // Relevance above which descriptions mention news
    double high_impact_threshold = 0.7;
    double medium_impact_threshold = 0.45;

    // Display-only, scaled by the largest |momentum| of the run.
    // Not the decision engine's trade threshold.
    double momentum_threshold_base = 0.35;
};

} // namespace Config
} // namespace PredictionTrader

#endif // FEED_CONFIG_HPP
