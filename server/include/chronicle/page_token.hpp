#pragma once

#include <cstdint>

namespace chronicle {

/**
 * Read-pagination cursor packed into a non-negative int64:
 *   bit 62      ascending flag
 *   bits 18-61  start time millis (44 bits)
 *   bits 0-17   offset among records sharing that start time (18 bits)
 * -1 means "no token".
 */
class PageToken {
public:
    static constexpr int64_t kUnset = -1;
    static constexpr int64_t kMaxTimeMillis = (int64_t{1} << 44) - 1;
    static constexpr int64_t kMaxOffset = (int64_t{1} << 18) - 1;

    // Offsets above kMaxOffset are clamped. Throws InvalidArgumentError for
    // negative or oversized values.
    static PageToken of(bool ascending, int64_t time_millis, int64_t offset);

    // First page in the given direction
    static PageToken of_ascending(bool ascending) { return PageToken(ascending, false, 0, 0); }

    // Throws InvalidTokenError for negative tokens other than kUnset
    static PageToken from(int64_t token, bool default_ascending);

    int64_t encode() const;

    bool is_ascending() const { return ascending_; }
    bool is_timestamp_set() const { return timestamp_set_; }
    int64_t time_millis() const { return time_millis_; }
    int64_t offset() const { return offset_; }

private:
    PageToken(bool ascending, bool timestamp_set, int64_t time_millis, int64_t offset)
        : ascending_(ascending), timestamp_set_(timestamp_set), time_millis_(time_millis), offset_(offset) {}

    bool ascending_;
    bool timestamp_set_;
    int64_t time_millis_;
    int64_t offset_;
};

} // namespace chronicle
