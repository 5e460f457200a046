#pragma once

#include "chronicle/record_types.hpp"
#include <algorithm>
#include <optional>
#include <vector>

namespace chronicle {

/**
 * Per-caller permissions supplied by the authorization layer.
 *
 * The engines never decide permissions themselves; they only apply these
 * predicates to what the store returns.
 */
struct AccessContext {
    DataOrigin calling_origin;
    std::vector<RecordType> readable_types;      // empty = every concrete type
    bool read_all_origins = true;                // false = own records only
    bool has_historical_access = true;
    std::optional<Instant> historical_boundary;

    static AccessContext unrestricted(const DataOrigin& origin) {
        AccessContext ctx;
        ctx.calling_origin = origin;
        return ctx;
    }

    bool can_read(RecordType type) const {
        if (readable_types.empty()) return true;
        return std::find(readable_types.begin(), readable_types.end(), type) != readable_types.end();
    }

    bool can_see_origin(const DataOrigin& origin) const {
        return read_all_origins || origin == calling_origin;
    }

    bool historical_cutoff_applies() const {
        return !has_historical_access && historical_boundary.has_value();
    }

    // Record content for reads and aggregation. Own records are always visible.
    bool can_read_content(const Record& record) const {
        if (!can_read(record.type()) || !can_see_origin(record.data_origin)) return false;
        if (historical_cutoff_applies() && record.data_origin != calling_origin &&
            record.start_time < *historical_boundary) {
            return false;
        }
        return true;
    }

    // Change-log upserts are cut off by modification time; deletes never are
    bool can_see_upsert(const Record& record) const {
        return !(historical_cutoff_applies() && record.last_modified_time < *historical_boundary);
    }
};

} // namespace chronicle
