#pragma once

#include "chronicle/interval_math.hpp"
#include "chronicle/time_types.hpp"
#include <variant>
#include <vector>

namespace chronicle {

// Fixed span, or calendar period applied on the local timeline
using GroupUnit = std::variant<Millis, Period>;

/**
 * Splits a filter range into contiguous buckets on the filter's timeline.
 *
 * The first bucket starts at the filter start and the last one is clipped to
 * the filter end. An empty range yields no buckets.
 */
class BucketPlanner {
public:
    static constexpr int kDefaultMaxGroups = 5000;

    explicit BucketPlanner(int max_groups = kDefaultMaxGroups) : max_groups_(max_groups) {}

    std::vector<TimelineInterval> plan(const TimeRangeFilter& filter, const GroupUnit& unit) const;

    // The single bucket used by un-grouped aggregation
    static TimelineInterval plan_whole(const TimeRangeFilter& filter) {
        return TimelineInterval{filter.timeline_start(), filter.timeline_end()};
    }

private:
    std::vector<TimelineInterval> plan_duration(const TimeRangeFilter& filter, Millis span) const;
    std::vector<TimelineInterval> plan_period(const TimeRangeFilter& filter, const Period& period) const;

    int max_groups_;
};

} // namespace chronicle
