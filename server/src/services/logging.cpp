#include "chronicle/logging.hpp"
#include <spdlog/spdlog.h>

namespace chronicle {

void init_logging(const LoggingConfig& config) {
    spdlog::set_pattern(config.log_pattern);

    // from_str maps unknown names to off, so check the round trip
    auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Unknown LOG_LEVEL '{}', using info", config.log_level);
        return;
    }
    spdlog::set_level(level);
}

} // namespace chronicle
