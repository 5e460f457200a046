#pragma once

#include "chronicle/record_types.hpp"
#include <optional>
#include <vector>

namespace chronicle {

/**
 * Supplies the fallback offset for buckets nothing contributed to, and picks
 * the offset attributed to a bucket from its contributing records.
 *
 * Default-constructed resolvers read the host zone at evaluation time; tests
 * pin a fixed offset instead.
 */
class ZoneResolver {
public:
    ZoneResolver() = default;
    explicit ZoneResolver(ZoneOffset fixed) : fixed_(fixed) {}

    ZoneOffset default_offset(Instant at) const;
    ZoneOffset default_offset() const { return default_offset(now_instant()); }

    // Start offset of the last record in scan order, or the fallback when
    // nothing contributed
    static ZoneOffset resolve_bucket_offset(const std::vector<const Record*>& contributing,
                                            ZoneOffset fallback);

private:
    std::optional<ZoneOffset> fixed_;
};

} // namespace chronicle
