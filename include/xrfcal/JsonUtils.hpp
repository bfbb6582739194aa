#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace xrfcal {
// Throws ConfigurationError when the file is missing or not valid JSON
nlohmann::json load_json(const std::string& path);
void save_json(const nlohmann::json& j, const std::string& path, int indent = 2);
// Replace ${VAR} in every string value by the environment variable
void expand_env(nlohmann::json& j);
// Local time, ISO 8601 without zone ("2024-03-01T14:05:09")
std::string iso_timestamp_now();
} // namespace xrfcal
