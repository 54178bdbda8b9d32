#include "data_structures.hpp"
#include <stdexcept>

namespace PredictionTrader {
namespace Core {

std::string polarity_to_string(NewsPolarity polarity) {
    switch (polarity) {
        case NewsPolarity::POSITIVE:
            return "positive";
        case NewsPolarity::NEGATIVE:
            return "negative";
        case NewsPolarity::NEUTRAL:
            return "neutral";
        default:
            throw std::runtime_error("Unknown news polarity");
    }
}

NewsPolarity parse_polarity(const std::string& polarity_str) {
    if (polarity_str == "positive") {
        return NewsPolarity::POSITIVE;
    } else if (polarity_str == "negative") {
        return NewsPolarity::NEGATIVE;
    } else if (polarity_str == "neutral") {
        return NewsPolarity::NEUTRAL;
    }
    throw std::runtime_error("Invalid news polarity: " + polarity_str + ". Must be 'positive', 'negative' or 'neutral'");
}

std::string decision_to_string(TradeDecision decision) {
    switch (decision) {
        case TradeDecision::OBSERVE:
            return "observe";
        case TradeDecision::ENTER:
            return "enter";
        case TradeDecision::SCALE:
            return "scale";
        case TradeDecision::HOLD:
            return "hold";
        case TradeDecision::EXIT:
            return "exit";
        default:
            throw std::runtime_error("Unknown trade decision");
    }
}

TradeDecision parse_decision(const std::string& decision_str) {
    if (decision_str == "observe") return TradeDecision::OBSERVE;
    if (decision_str == "enter") return TradeDecision::ENTER;
    if (decision_str == "scale") return TradeDecision::SCALE;
    if (decision_str == "hold") return TradeDecision::HOLD;
    if (decision_str == "exit") return TradeDecision::EXIT;
    throw std::runtime_error("Invalid trade decision: " + decision_str);
}

} // namespace Core
} // namespace PredictionTrader
