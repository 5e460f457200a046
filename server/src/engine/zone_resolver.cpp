#include "chronicle/zone_resolver.hpp"
#include <spdlog/spdlog.h>
#include <ctime>

namespace chronicle {

ZoneOffset ZoneResolver::default_offset(Instant at) const {
    if (fixed_) return *fixed_;

    std::time_t seconds = static_cast<std::time_t>(to_epoch_millis(at) / kMillisPerSecond);
    std::tm local{};
    if (localtime_r(&seconds, &local) == nullptr) {
        spdlog::warn("localtime_r failed for {}, using UTC", format_instant(at));
        return ZoneOffset::utc();
    }
    int64_t gmtoff = local.tm_gmtoff;
    if (gmtoff > ZoneOffset::kMaxSeconds || gmtoff < -ZoneOffset::kMaxSeconds) {
        spdlog::warn("Host zone offset {}s out of range, using UTC", gmtoff);
        return ZoneOffset::utc();
    }
    return ZoneOffset::of_total_seconds(gmtoff);
}

ZoneOffset ZoneResolver::resolve_bucket_offset(const std::vector<const Record*>& contributing,
                                               ZoneOffset fallback) {
    if (contributing.empty()) return fallback;
    return contributing.back()->start_zone_offset;
}

} // namespace chronicle
