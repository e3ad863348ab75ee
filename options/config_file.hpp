#pragma once

#include "options.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace cmdbench
{

// Apply the keys of a parsed JSON configuration to `opts`. Keys that are
// absent leave the current value alone. Throws ConfigError on wrong types
// and unknown enum values.
void applyConfig(const nlohmann::json& root, Options& opts);

// Load from file (JSON). Throws ConfigError if the file cannot be read or
// parsed.
void loadConfigFile(const std::string& jsonPath, Options& opts);

} // namespace cmdbench
