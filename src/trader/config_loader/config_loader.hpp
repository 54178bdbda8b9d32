#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

bool load_config_from_csv(PredictionTrader::Config::SystemConfig& cfg, const std::string& csv_path);
int load_system_config(PredictionTrader::Config::SystemConfig& config, const std::string& config_directory);
bool validate_config(const PredictionTrader::Config::SystemConfig& config, std::string& errorMessage);
bool validate_simulation_config(const PredictionTrader::Config::SimulationConfig& config, std::string& errorMessage);

#endif // CONFIG_LOADER_HPP
