#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

// Load key,value CSV into SystemConfig. Unknown keys are logged and ignored. Returns false if the file cannot be opened.
// Throws std::runtime_error when a value cannot be parsed for its key.
bool load_config_from_csv(HybridTrader::Config::SystemConfig& cfg, const std::string& csv_path);

// Apply one key,value pair. Returns false for unknown keys.
bool apply_config_value(HybridTrader::Config::SystemConfig& cfg, const std::string& config_key, const std::string& config_value);

// Load complete system configuration from csv_path. Returns 0 on success, 1 on failure.
int load_system_config(HybridTrader::Config::SystemConfig& config, const std::string& csv_path);

// Validate system configuration. Returns true if valid, false otherwise with error message.
bool validate_config(const HybridTrader::Config::SystemConfig& config, std::string& errorMessage);

#endif // CONFIG_LOADER_HPP
