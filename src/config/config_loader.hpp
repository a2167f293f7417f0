#pragma once

#include <string>

#include "config/config_schema.hpp"

namespace kivybot::config {

// Reads ~/.kivybot/config.json (or $KIVYBOT_CONFIG), then applies KIVYBOT_* overrides.
Config LoadConfig();

// Applies a JSON document on top of the defaults. Malformed input keeps the defaults.
Config ParseConfig(const std::string& json_text);

}  // namespace kivybot::config
