#include "json_exporter.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace PredictionTrader {
namespace Logging {

json point_to_json(const Core::SimulationPoint& point) {
    json point_json = json::object();
    point_json["index"] = point.index;
    point_json["t"] = point.t;
    point_json["prob"] = point.prob;
    point_json["momentum"] = point.momentum;
    point_json["raw_change"] = point.raw_change;
    point_json["drift"] = point.drift;
    point_json["z"] = point.z;
    point_json["abs_z"] = point.abs_z;
    point_json["news_relevance"] = point.news_relevance;
    point_json["news_polarity"] = Core::polarity_to_string(point.news_polarity);
    point_json["signal_score"] = point.signal_score;
    point_json["trade_threshold"] = point.trade_threshold;
    point_json["position_size"] = point.position_size;
    point_json["risk_utilization"] = point.risk_utilization;
    point_json["decision"] = Core::decision_to_string(point.decision);
    return point_json;
}

json news_event_to_json(const Core::NewsEvent& event) {
    json event_json = json::object();
    event_json["t"] = event.t;
    event_json["index"] = event.index;
    event_json["relevance"] = event.relevance;
    event_json["polarity"] = Core::polarity_to_string(event.polarity);
    event_json["headline"] = event.headline;
    return event_json;
}

json decision_record_to_json(const Core::DecisionRecord& record) {
    json record_json = json::object();
    record_json["t"] = record.t;
    record_json["index"] = record.index;
    record_json["prob"] = record.prob;
    record_json["decision"] = Core::decision_to_string(record.decision);
    record_json["signal_score"] = record.signal_score;
    record_json["news_relevance"] = record.news_relevance;
    record_json["momentum"] = record.momentum;
    record_json["position_size"] = record.position_size;
    return record_json;
}

json simulation_to_json(const Core::SimulationResult& result) {
    json simulation_json = json::object();

    json statistics_json = json::object();
    statistics_json["mean"] = result.momentum_statistics.mean;
    statistics_json["standard_deviation"] = result.momentum_statistics.standard_deviation;
    statistics_json["degenerate"] = result.momentum_statistics.degenerate;
    simulation_json["momentum_statistics"] = statistics_json;

    json points_json = json::array();
    for (const auto& point : result.points) {
        points_json.push_back(point_to_json(point));
    }
    simulation_json["points"] = points_json;

    json news_json = json::array();
    for (const auto& event : result.news_events) {
        news_json.push_back(news_event_to_json(event));
    }
    simulation_json["news_events"] = news_json;

    json decisions_json = json::array();
    for (const auto& record : result.decisions) {
        decisions_json.push_back(decision_record_to_json(record));
    }
    simulation_json["decisions"] = decisions_json;

    return simulation_json;
}

void write_simulation_json(const Core::SimulationResult& result, const std::string& output_path) {
    std::ofstream output_stream(output_path, std::ios::out | std::ios::trunc);
    if (!output_stream.is_open()) {
        throw std::runtime_error("Failed to open JSON export file: " + output_path);
    }
    output_stream << simulation_to_json(result).dump(2) << "\n";
    if (!output_stream) {
        throw std::runtime_error("Failed to write JSON export file: " + output_path);
    }
}

} // namespace Logging
} // namespace PredictionTrader
