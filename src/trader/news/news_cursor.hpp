#ifndef NEWS_CURSOR_HPP
#define NEWS_CURSOR_HPP

#include <vector>
#include "configs/strategy_config.hpp"
#include "trader/data_structures/data_structures.hpp"

using PredictionTrader::Config::SignalConfig;

namespace PredictionTrader {
namespace Core {

/**
 * Forward-only cursor over time-ordered news events.
 * Sits on the most recent event not after the last queried time, or on the
 * first event while no event has happened yet. Never rewinds.
 */
class NewsCursor {
public:
    explicit NewsCursor(const std::vector<NewsEvent>& events) : news_events(events), news_index(0) {}

    const NewsEvent* advance_to(double current_time);
    NewsContext resolve_context(double current_time, const SignalConfig& config);
    size_t position() const { return news_index; }

private:
    const std::vector<NewsEvent>& news_events;
    size_t news_index;
};

} // namespace Core
} // namespace PredictionTrader

#endif // NEWS_CURSOR_HPP
