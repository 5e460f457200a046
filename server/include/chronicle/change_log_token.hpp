#pragma once

#include "chronicle/record_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace chronicle {

/**
 * Resumable change-log cursor. Serialized only at the API boundary.
 *
 * Wire format (then base64):
 *   u8  version (1)
 *   i64 watermark sequence id, big-endian
 *   u8  n, then n x u8 record type code
 *   u16 m, then m x (u16 length, origin bytes)
 *   u16 k, then k x (u16 length, record id bytes)
 *
 * withheld_record_ids lists records created after the watermark that a
 * previous page skipped because they were already deleted. Their delete is
 * not reported unless an update shows up first.
 */
struct ChangeLogToken {
    static constexpr uint8_t kVersion = 1;

    int64_t watermark = 0;
    std::vector<RecordType> record_types;
    std::vector<DataOrigin> data_origin_filters;
    std::vector<RecordId> withheld_record_ids;

    std::string encode() const;

    // Throws InvalidTokenError for anything that is not a well-formed token
    static ChangeLogToken decode(const std::string& token);

    bool operator==(const ChangeLogToken& other) const {
        return watermark == other.watermark && record_types == other.record_types &&
               data_origin_filters == other.data_origin_filters &&
               withheld_record_ids == other.withheld_record_ids;
    }
};

} // namespace chronicle
