#pragma once

#include "chronicle/config.hpp"

namespace chronicle {

// Configures the spdlog default logger. Unknown level names fall back to info.
void init_logging(const LoggingConfig& config);

} // namespace chronicle
