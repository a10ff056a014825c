// QuickRoute - Logging

#pragma once

#include <string_view>

namespace quickroute {

/// Install the colored stdout logger as spdlog's default.
/// Accepts debug, info, warn or error; anything else falls back to info.
void setup_logging(std::string_view level);

}  // namespace quickroute
