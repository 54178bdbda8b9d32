// ============================================================================
// test_json_exporter.cpp
// JSON export of a simulation result
// ============================================================================

#include "test_framework.hpp"
#include "logging/export/json_exporter.hpp"
#include "trader/simulation/simulation_runner.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace PredictionTrader::Core;
using PredictionTrader::Logging::simulation_to_json;
using PredictionTrader::Logging::write_simulation_json;
using json = nlohmann::json;

void test_export_contains_sequences() {
    TEST_SECTION("Export contains sequences");

    SimulationConfig config;
    config.length = 120;
    SimulationResult result = generate_simulation(config, 42);
    json simulation_json = simulation_to_json(result);

    TEST_ASSERT(simulation_json["points"].size() == result.points.size(), "All points exported");
    TEST_ASSERT(simulation_json["news_events"].size() == result.news_events.size(), "All news events exported");
    TEST_ASSERT(simulation_json["decisions"].size() == result.decisions.size(), "All decisions exported");
    TEST_ASSERT(simulation_json["momentum_statistics"]["standard_deviation"].get<double>() == result.momentum_statistics.standard_deviation,
                "Statistics exported");

    const json& last_point = simulation_json["points"].back();
    TEST_ASSERT(last_point["index"].get<int>() == 119, "Point index exported");
    TEST_ASSERT(last_point["prob"].get<double>() == result.points.back().prob, "Probability exported at full precision");
    TEST_ASSERT(last_point["decision"].get<std::string>() == decision_to_string(result.points.back().decision), "Decision as lowercase name");
    TEST_ASSERT(last_point.contains("drift") && last_point.contains("risk_utilization"), "Point fields present");

    if (!result.news_events.empty()) {
        const json& first_event = simulation_json["news_events"].front();
        TEST_ASSERT(first_event["headline"].get<std::string>() == result.news_events.front().headline, "Headline exported");
        TEST_ASSERT(parse_polarity(first_event["polarity"].get<std::string>()) == result.news_events.front().polarity, "Polarity exported");
    }
}

void test_write_and_reload() {
    TEST_SECTION("Write and reload");

    SimulationConfig config;
    config.length = 30;
    SimulationResult result = generate_simulation(config, 5);

    std::filesystem::path output_path = std::filesystem::temp_directory_path() / "prediction_trader_export_test.json";
    write_simulation_json(result, output_path.string());

    std::ifstream input_stream(output_path);
    json reloaded = json::parse(input_stream);
    TEST_ASSERT(reloaded["points"].size() == 30, "Reloaded file has every point");
    std::filesystem::remove(output_path);

    bool threw = false;
    try {
        write_simulation_json(result, "/nonexistent_directory/for/export.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    TEST_ASSERT(threw, "Unwritable path throws runtime_error");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "JSON Exporter Tests\n";
    std::cout << "========================================\n";

    test_export_contains_sequences();
    test_write_and_reload();

    return report_test_results("JSON Exporter");
}
