#include "config_loader.hpp"
#include "logging/logger/logging_macros.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

using PredictionTrader::Logging::log_message;

namespace {
    constexpr double MIN_PROBABILITY_FLOOR = 0.04;
    constexpr double MAX_PROBABILITY_CEILING = 0.96;

    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(), ::tolower);
        return normalized_value == "1" || normalized_value == "true" || normalized_value == "yes";
    }

    // std::stod/stoi accept trailing garbage; config values must be consumed whole
    inline double to_double(const std::string& input_value) {
        size_t parsed_characters = 0;
        double parsed_value = std::stod(input_value, &parsed_characters);
        if (parsed_characters != input_value.size()) {
            throw std::invalid_argument("Malformed numeric value: " + input_value);
        }
        return parsed_value;
    }

    inline int to_int(const std::string& input_value) {
        size_t parsed_characters = 0;
        int parsed_value = std::stoi(input_value, &parsed_characters);
        if (parsed_characters != input_value.size()) {
            throw std::invalid_argument("Malformed integer value: " + input_value);
        }
        return parsed_value;
    }

    inline std::uint64_t to_uint64(const std::string& input_value) {
        if (!input_value.empty() && input_value[0] == '-') {
            throw std::invalid_argument("Seed must be non-negative: " + input_value);
        }
        size_t parsed_characters = 0;
        unsigned long long parsed_value = std::stoull(input_value, &parsed_characters);
        if (parsed_characters != input_value.size()) {
            throw std::invalid_argument("Malformed seed value: " + input_value);
        }
        return static_cast<std::uint64_t>(parsed_value);
    }

    // "time:delta;time:delta;..."
    std::vector<PredictionTrader::Config::RegimeShift> parse_regime_schedule(const std::string& input_value) {
        std::vector<PredictionTrader::Config::RegimeShift> regime_schedule;
        std::stringstream schedule_stream(input_value);
        std::string regime_entry_string;
        while (std::getline(schedule_stream, regime_entry_string, ';')) {
            regime_entry_string = trim(regime_entry_string);
            if (regime_entry_string.empty()) continue;
            size_t separator_position = regime_entry_string.find(':');
            if (separator_position == std::string::npos) {
                throw std::invalid_argument("Regime entry must be time:delta, got: " + regime_entry_string);
            }
            PredictionTrader::Config::RegimeShift regime_shift;
            regime_shift.trigger_time = to_double(trim(regime_entry_string.substr(0, separator_position)));
            regime_shift.drift_delta = to_double(trim(regime_entry_string.substr(separator_position + 1)));
            regime_schedule.push_back(regime_shift);
        }
        return regime_schedule;
    }

    inline bool is_unit_interval(double value) {
        return std::isfinite(value) && value >= 0.0 && value <= 1.0;
    }

    inline bool is_positive(double value) {
        return std::isfinite(value) && value > 0.0;
    }
}

bool load_config_from_csv(PredictionTrader::Config::SystemConfig& cfg, const std::string& csv_path) {
    try {
    std::ifstream config_file_stream(csv_path);
        if (!config_file_stream.is_open()) {
            log_message("ERROR: Could not open config file: " + csv_path);
            return false;
        }
    std::string config_line_string;
    while (std::getline(config_file_stream, config_line_string)) {
            try {
        if (config_line_string.empty()) continue;
                config_line_string = trim(config_line_string);
                if (config_line_string.empty() || config_line_string[0] == '#') continue;
        std::stringstream config_line_stream(config_line_string);
        std::string config_key_string, config_value_string;
        if (!std::getline(config_line_stream, config_key_string, ',')) continue;
        if (!std::getline(config_line_stream, config_value_string)) continue;
                config_key_string = trim(config_key_string);
                config_value_string = trim(config_value_string);

        PredictionTrader::Config::SimulationConfig& simulation = cfg.simulation;

        // Simulation run
        if (config_key_string == "simulation.length") simulation.length = to_int(config_value_string);
        else if (config_key_string == "simulation.seed") cfg.seed = to_uint64(config_value_string);

        // Path generation
        else if (config_key_string == "path.time_horizon") simulation.path.time_horizon = to_double(config_value_string);
        else if (config_key_string == "path.initial_probability") simulation.path.initial_probability = to_double(config_value_string);
        else if (config_key_string == "path.probability_floor") simulation.path.probability_floor = to_double(config_value_string);
        else if (config_key_string == "path.probability_ceiling") simulation.path.probability_ceiling = to_double(config_value_string);
        else if (config_key_string == "path.noise_intensity") simulation.path.noise_intensity = to_double(config_value_string);
        else if (config_key_string == "path.drift_step_coefficient") simulation.path.drift_step_coefficient = to_double(config_value_string);
        else if (config_key_string == "path.noise_step_coefficient") simulation.path.noise_step_coefficient = to_double(config_value_string);
        else if (config_key_string == "path.regimes") simulation.path.regimes = parse_regime_schedule(config_value_string);

        // News synthesis
        else if (config_key_string == "news.z_threshold") simulation.news.z_threshold = to_double(config_value_string);
        else if (config_key_string == "news.emission_probability") simulation.news.emission_probability = to_double(config_value_string);
        else if (config_key_string == "news.base_relevance") simulation.news.base_relevance = to_double(config_value_string);
        else if (config_key_string == "news.relevance_per_z") simulation.news.relevance_per_z = to_double(config_value_string);
        else if (config_key_string == "news.relevance_jitter") simulation.news.relevance_jitter = to_double(config_value_string);

        // Signal score
        else if (config_key_string == "signal.relevance_time_window") simulation.signal.relevance_time_window = to_double(config_value_string);
        else if (config_key_string == "signal.momentum_z_floor") simulation.signal.momentum_z_floor = to_double(config_value_string);
        else if (config_key_string == "signal.momentum_z_span") simulation.signal.momentum_z_span = to_double(config_value_string);
        else if (config_key_string == "signal.momentum_weight") simulation.signal.momentum_weight = to_double(config_value_string);
        else if (config_key_string == "signal.news_weight") simulation.signal.news_weight = to_double(config_value_string);

        // Decision state machine
        else if (config_key_string == "decision.trade_threshold") simulation.decision.trade_threshold = to_double(config_value_string);
        else if (config_key_string == "decision.high_conviction_threshold") simulation.decision.high_conviction_threshold = to_double(config_value_string);
        else if (config_key_string == "decision.exit_relaxation_factor") simulation.decision.exit_relaxation_factor = to_double(config_value_string);
        else if (config_key_string == "decision.entry_sizing_coefficient") simulation.decision.entry_sizing_coefficient = to_double(config_value_string);
        else if (config_key_string == "decision.scale_sizing_factor") simulation.decision.scale_sizing_factor = to_double(config_value_string);
        else if (config_key_string == "decision.hold_decay") simulation.decision.hold_decay = to_double(config_value_string);
        else if (config_key_string == "decision.exit_decay") simulation.decision.exit_decay = to_double(config_value_string);

        // Risk
        else if (config_key_string == "risk.max_position") simulation.risk.max_position = to_double(config_value_string);
        else if (config_key_string == "risk.risk_budget") simulation.risk.risk_budget = to_double(config_value_string);

        // Decision feed / report
        else if (config_key_string == "feed.decision_window") cfg.feed.decision_window = to_double(config_value_string);
        else if (config_key_string == "feed.news_window") cfg.feed.news_window = to_double(config_value_string);
        else if (config_key_string == "feed.report_time") cfg.feed.report_time = to_double(config_value_string);
        else if (config_key_string == "feed.news_relevance_mention_threshold") cfg.feed.news_relevance_mention_threshold = to_double(config_value_string);
        else if (config_key_string == "feed.high_impact_threshold") cfg.feed.high_impact_threshold = to_double(config_value_string);
        else if (config_key_string == "feed.medium_impact_threshold") cfg.feed.medium_impact_threshold = to_double(config_value_string);
        else if (config_key_string == "feed.momentum_threshold_base") cfg.feed.momentum_threshold_base = to_double(config_value_string);

        // Logging
        else if (config_key_string == "logging.log_file") cfg.logging.log_file = config_value_string;
        else if (config_key_string == "logging.log_directory") cfg.logging.log_directory = config_value_string;
        else if (config_key_string == "logging.poll_interval_milliseconds") cfg.logging.poll_interval_milliseconds = to_int(config_value_string);
        else if (config_key_string == "logging.enable_csv_points_log") cfg.logging.enable_csv_points_log = to_bool(config_value_string);
        else if (config_key_string == "logging.enable_json_export") cfg.logging.enable_json_export = to_bool(config_value_string);
        else if (config_key_string == "logging.json_export_file") cfg.logging.json_export_file = config_value_string;

        else {
            log_message("WARNING: Unknown config key: " + config_key_string + " in " + csv_path);
        }
            } catch (const std::exception& line_exception_error) {
                log_message("CRITICAL: Error parsing config line: " + config_line_string + " - " + std::string(line_exception_error.what()));
                throw;
            }
        }
    return true;
    } catch (const std::exception& exception_error) {
        log_message("Exception in load_config_from_csv: " + std::string(exception_error.what()));
        return false;
    }
}

int load_system_config(PredictionTrader::Config::SystemConfig& config, const std::string& config_directory) {
    // Load configuration from separate logical files
    std::vector<std::string> config_files = {
        config_directory + "/simulation_config.csv",
        config_directory + "/feed_config.csv",
        config_directory + "/logging_config.csv"
    };

    for (const auto& config_path : config_files) {
        if (!load_config_from_csv(config, config_path)) {
            log_message("ERROR: Failed to load config CSV from " + config_path);
            return 1;
        }
    }

    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        log_message("ERROR: Configuration validation failed: " + validation_error);
        return 1;
    }

    return 0;
}

bool validate_simulation_config(const PredictionTrader::Config::SimulationConfig& config, std::string& error_message) {
    if (config.length < 2) {
        error_message = "simulation.length must be >= 2 (got " + std::to_string(config.length) + ")";
        return false;
    }

    // Path generation
    const PredictionTrader::Config::PathConfig& path = config.path;
    if (!is_positive(path.time_horizon)) {
        error_message = "path.time_horizon must be > 0";
        return false;
    }
    if (!std::isfinite(path.probability_floor) || !std::isfinite(path.probability_ceiling) ||
        path.probability_floor < MIN_PROBABILITY_FLOOR || path.probability_ceiling > MAX_PROBABILITY_CEILING ||
        path.probability_floor >= path.probability_ceiling) {
        error_message = "path.probability_floor and path.probability_ceiling must satisfy 0.04 <= floor < ceiling <= 0.96";
        return false;
    }
    if (!std::isfinite(path.initial_probability) ||
        path.initial_probability <= path.probability_floor || path.initial_probability >= path.probability_ceiling) {
        error_message = "path.initial_probability must lie strictly between probability_floor and probability_ceiling";
        return false;
    }
    if (!std::isfinite(path.noise_intensity) || path.noise_intensity < 0.0) {
        error_message = "path.noise_intensity must be >= 0";
        return false;
    }
    if (!std::isfinite(path.drift_step_coefficient) || !std::isfinite(path.noise_step_coefficient)) {
        error_message = "path step coefficients must be finite";
        return false;
    }
    for (const auto& regime : path.regimes) {
        if (!std::isfinite(regime.trigger_time) || !std::isfinite(regime.drift_delta)) {
            error_message = "regime schedule entries must be finite";
            return false;
        }
    }

    // News synthesis
    const PredictionTrader::Config::NewsConfig& news = config.news;
    if (!std::isfinite(news.z_threshold) || news.z_threshold < 0.0) {
        error_message = "news.z_threshold must be >= 0";
        return false;
    }
    if (!is_unit_interval(news.emission_probability)) {
        error_message = "news.emission_probability must lie in [0, 1]";
        return false;
    }
    if (!is_unit_interval(news.base_relevance) || !std::isfinite(news.relevance_per_z) || news.relevance_per_z < 0.0 ||
        !is_unit_interval(news.relevance_jitter)) {
        error_message = "news relevance parameters out of range";
        return false;
    }

    // Signal score
    const PredictionTrader::Config::SignalConfig& signal = config.signal;
    if (!is_positive(signal.relevance_time_window)) {
        error_message = "signal.relevance_time_window must be > 0";
        return false;
    }
    if (!std::isfinite(signal.momentum_z_floor) || signal.momentum_z_floor < 0.0 || !is_positive(signal.momentum_z_span)) {
        error_message = "signal.momentum_z_floor must be >= 0 and signal.momentum_z_span > 0";
        return false;
    }
    if (!is_unit_interval(signal.momentum_weight) || !is_unit_interval(signal.news_weight)) {
        error_message = "signal weights must lie in [0, 1]";
        return false;
    }

    // Decision state machine
    const PredictionTrader::Config::DecisionConfig& decision = config.decision;
    if (!is_unit_interval(decision.trade_threshold) || !is_unit_interval(decision.high_conviction_threshold) ||
        decision.high_conviction_threshold < decision.trade_threshold) {
        error_message = "decision thresholds must satisfy 0 <= trade_threshold <= high_conviction_threshold <= 1";
        return false;
    }
    if (!is_unit_interval(decision.exit_relaxation_factor)) {
        error_message = "decision.exit_relaxation_factor must lie in [0, 1]";
        return false;
    }
    if (!is_positive(decision.entry_sizing_coefficient) || !is_positive(decision.scale_sizing_factor)) {
        error_message = "decision sizing coefficients must be > 0";
        return false;
    }
    if (!is_unit_interval(decision.hold_decay) || !is_unit_interval(decision.exit_decay)) {
        error_message = "decision.hold_decay and decision.exit_decay must lie in [0, 1]";
        return false;
    }

    // Risk
    // Positions stay in [-1, 1] and utilization in [0, 100]
    if (!is_positive(config.risk.max_position) || config.risk.max_position > 1.0) {
        error_message = "risk.max_position must satisfy 0 < max_position <= 1";
        return false;
    }
    if (!std::isfinite(config.risk.risk_budget) || config.risk.risk_budget < 1.0) {
        error_message = "risk.risk_budget must be >= 1";
        return false;
    }

    return true;
}

bool validate_config(const PredictionTrader::Config::SystemConfig& config, std::string& error_message) {
    if (!validate_simulation_config(config.simulation, error_message)) {
        return false;
    }

    // Decision feed
    if (!is_positive(config.feed.decision_window) || !is_positive(config.feed.news_window)) {
        error_message = "feed.decision_window and feed.news_window must be > 0";
        return false;
    }
    if (!std::isfinite(config.feed.report_time)) {
        error_message = "feed.report_time must be finite";
        return false;
    }
    if (!is_unit_interval(config.feed.medium_impact_threshold) || !is_unit_interval(config.feed.high_impact_threshold) ||
        config.feed.medium_impact_threshold >= config.feed.high_impact_threshold) {
        error_message = "feed impact thresholds must satisfy 0 <= medium < high <= 1";
        return false;
    }
    if (!is_unit_interval(config.feed.news_relevance_mention_threshold)) {
        error_message = "feed.news_relevance_mention_threshold must lie in [0, 1]";
        return false;
    }
    if (!is_positive(config.feed.momentum_threshold_base)) {
        error_message = "feed.momentum_threshold_base must be > 0";
        return false;
    }

    // Logging
    if (config.logging.log_file.empty()) {
        error_message = "logging.log_file is required (provide via logging_config.csv)";
        return false;
    }
    if (config.logging.log_directory.empty()) {
        error_message = "logging.log_directory is required (provide via logging_config.csv)";
        return false;
    }
    if (config.logging.poll_interval_milliseconds <= 0) {
        error_message = "logging.poll_interval_milliseconds must be > 0";
        return false;
    }
    if (config.logging.enable_json_export && config.logging.json_export_file.empty()) {
        error_message = "logging.json_export_file is required when JSON export is enabled";
        return false;
    }

    return true;
}
