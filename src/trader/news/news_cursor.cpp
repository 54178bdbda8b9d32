#include "news_cursor.hpp"
#include <cmath>

namespace PredictionTrader {
namespace Core {

const NewsEvent* NewsCursor::advance_to(double current_time) {
    if (news_events.empty()) {
        return nullptr;
    }
    while (news_index + 1 < news_events.size() && news_events[news_index + 1].t <= current_time) {
        ++news_index;
    }
    return &news_events[news_index];
}

NewsContext NewsCursor::resolve_context(double current_time, const SignalConfig& config) {
    NewsContext context;
    const NewsEvent* news_event = advance_to(current_time);
    if (news_event && std::abs(news_event->t - current_time) < config.relevance_time_window) {
        context.has_recent_news = true;
        context.relevance = news_event->relevance;
        context.polarity = news_event->polarity;
    }
    return context;
}

} // namespace Core
} // namespace PredictionTrader
