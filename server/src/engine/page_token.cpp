#include "chronicle/page_token.hpp"
#include "chronicle/errors.hpp"
#include <algorithm>

namespace chronicle {

namespace {
constexpr int kOffsetBits = 18;
constexpr int kAscendingBit = 62;
}

PageToken PageToken::of(bool ascending, int64_t time_millis, int64_t offset) {
    if (time_millis < 0) {
        throw InvalidArgumentError("timestamp can not be negative");
    }
    if (offset < 0) {
        throw InvalidArgumentError("offset can not be negative");
    }
    if (time_millis > kMaxTimeMillis) {
        throw InvalidArgumentError("timestamp too large");
    }
    return PageToken(ascending, true, time_millis, std::min(offset, kMaxOffset));
}

PageToken PageToken::from(int64_t token, bool default_ascending) {
    if (token == kUnset) {
        return of_ascending(default_ascending);
    }
    if (token < 0) {
        throw InvalidTokenError("pageToken cannot be negative");
    }
    bool ascending = ((token >> kAscendingBit) & 1) != 0;
    int64_t time_millis = (token >> kOffsetBits) & kMaxTimeMillis;
    int64_t offset = token & kMaxOffset;
    return PageToken(ascending, true, time_millis, offset);
}

int64_t PageToken::encode() const {
    if (!timestamp_set_) return kUnset;
    int64_t token = (time_millis_ << kOffsetBits) | offset_;
    if (ascending_) token |= int64_t{1} << kAscendingBit;
    return token;
}

} // namespace chronicle
