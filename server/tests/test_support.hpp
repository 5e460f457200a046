#pragma once

#include "../include/chronicle/errors.hpp"
#include "../include/chronicle/in_memory_record_store.hpp"
#include "../include/chronicle/record_types.hpp"
#include <atomic>
#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Test utilities
#define TEST_ASSERT(condition, message) \
    if (!(condition)) { \
        std::cerr << "❌ TEST FAILED: " << message << std::endl; \
        return false; \
    } else { \
        std::cout << "✅ " << message << std::endl; \
    }

namespace chronicle {
namespace testing {

inline Instant at(int64_t year, int month, int day, int hour = 0, int minute = 0) {
    return LocalDateTime::of(year, month, day, hour, minute).to_instant(ZoneOffset::utc());
}

inline Millis minutes(int64_t n) { return Millis(n * 60000); }
inline Millis hours(int64_t n) { return Millis(n * 3600000); }
inline Millis days(int64_t n) { return Millis(n * kMillisPerDay); }

inline Record base_record(const DataOrigin& origin, Instant start, Instant end, ZoneOffset offset) {
    Record record;
    record.data_origin = origin;
    record.start_time = start;
    record.end_time = end;
    record.start_zone_offset = offset;
    record.end_zone_offset = offset;
    return record;
}

inline Record steps_record(const DataOrigin& origin, Instant start, Instant end, int64_t count,
                           ZoneOffset offset = ZoneOffset::utc()) {
    Record record = base_record(origin, start, end, offset);
    record.data = StepsData{count};
    return record;
}

inline Record distance_record(const DataOrigin& origin, Instant start, Instant end, double meters,
                              ZoneOffset offset = ZoneOffset::utc()) {
    Record record = base_record(origin, start, end, offset);
    record.data = DistanceData{meters};
    return record;
}

inline Record weight_record(const DataOrigin& origin, Instant time, double kilograms,
                            ZoneOffset offset = ZoneOffset::utc()) {
    Record record = base_record(origin, time, time, offset);
    record.data = WeightData{kilograms};
    return record;
}

inline Record heart_rate_record(const DataOrigin& origin, Instant start, Instant end,
                                const std::vector<std::pair<Instant, int64_t>>& samples,
                                ZoneOffset offset = ZoneOffset::utc()) {
    Record record = base_record(origin, start, end, offset);
    HeartRateData data;
    for (const auto& [time, bpm] : samples) {
        data.samples.push_back(HeartRateSample{time, bpm});
    }
    record.data = data;
    return record;
}

// Settable clock shared with the store under test
class TestClock {
public:
    explicit TestClock(Instant start)
        : now_(std::make_shared<std::atomic<int64_t>>(to_epoch_millis(start))) {}

    InMemoryRecordStore::Clock clock() const {
        auto now = now_;
        return [now] { return instant_from_millis(now->load()); };
    }

    Instant now() const { return instant_from_millis(now_->load()); }
    void set(Instant t) { now_->store(to_epoch_millis(t)); }
    void advance(Millis delta) { now_->fetch_add(delta.count()); }

private:
    std::shared_ptr<std::atomic<int64_t>> now_;
};

inline bool near(std::optional<double> value, double expected, double epsilon = 1e-6) {
    return value.has_value() && std::fabs(*value - expected) < epsilon;
}

// Message of the exception of type E thrown by fn, if any
template <typename E, typename Fn>
std::optional<std::string> thrown_message(Fn&& fn) {
    try {
        fn();
    } catch (const E& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

inline bool starts_with(const std::optional<std::string>& value, const std::string& prefix) {
    return value.has_value() && value->compare(0, prefix.size(), prefix) == 0;
}

} // namespace testing
} // namespace chronicle
