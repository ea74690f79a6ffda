#pragma once

#include "config/config.hpp"

namespace spreadarb {

// Install the "spreadarb" logger as spdlog's default
void setup_logging(const LoggingConfig& config);

} // namespace spreadarb
