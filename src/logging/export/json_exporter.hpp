#ifndef JSON_EXPORTER_HPP
#define JSON_EXPORTER_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "trader/data_structures/data_structures.hpp"

namespace PredictionTrader {
namespace Logging {

nlohmann::json point_to_json(const Core::SimulationPoint& point);
nlohmann::json news_event_to_json(const Core::NewsEvent& event);
nlohmann::json decision_record_to_json(const Core::DecisionRecord& record);

/**
 * Full run export: momentum statistics plus the points, news_events and
 * decisions sequences, each in time order.
 */
nlohmann::json simulation_to_json(const Core::SimulationResult& result);

// Throws std::runtime_error when the file cannot be written.
void write_simulation_json(const Core::SimulationResult& result, const std::string& output_path);

} // namespace Logging
} // namespace PredictionTrader

#endif // JSON_EXPORTER_HPP
