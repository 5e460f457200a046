#include "chronicle/bucket_planner.hpp"
#include "chronicle/errors.hpp"
#include <algorithm>

namespace chronicle {

std::vector<TimelineInterval> BucketPlanner::plan(const TimeRangeFilter& filter, const GroupUnit& unit) const {
    if (const auto* span = std::get_if<Millis>(&unit)) {
        return plan_duration(filter, *span);
    }
    return plan_period(filter, std::get<Period>(unit));
}

std::vector<TimelineInterval> BucketPlanner::plan_duration(const TimeRangeFilter& filter, Millis span) const {
    if (span.count() < 1) {
        throw InvalidArgumentError("Duration should be at least 1 millisecond");
    }

    const Millis start = filter.timeline_start();
    const Millis end = filter.timeline_end();
    const int64_t length = (end - start).count();
    const int64_t count = length / span.count() + (length % span.count() != 0 ? 1 : 0);
    if (count > max_groups_) {
        throw InvalidArgumentError("Number of buckets must not exceed " + std::to_string(max_groups_));
    }

    std::vector<TimelineInterval> buckets;
    buckets.reserve(static_cast<size_t>(count));
    for (Millis cursor = start; cursor < end; cursor += span) {
        buckets.push_back(TimelineInterval{cursor, std::min(cursor + span, end)});
    }
    return buckets;
}

std::vector<TimelineInterval> BucketPlanner::plan_period(const TimeRangeFilter& filter, const Period& period) const {
    if (period.months < 0 || period.days < 0 || (period.months == 0 && period.days < 1)) {
        throw InvalidArgumentError("Period duration should be at least a day");
    }
    if (!filter.is_local()) {
        throw InvalidArgumentError("Grouping by period should use LocalTimeRangeFilter");
    }

    const LocalDateTime local_start = filter.local_start();
    const Millis end = filter.timeline_end();

    // Each start is derived from the filter start, so month clamping does not drift
    std::vector<TimelineInterval> buckets;
    Millis cursor = filter.timeline_start();
    for (int64_t k = 1; cursor < end; ++k) {
        if (static_cast<int64_t>(buckets.size()) >= max_groups_) {
            throw InvalidArgumentError("Number of groups must not exceed " + std::to_string(max_groups_));
        }
        Millis next = local_start.plus(period.multiplied_by(k)).local_millis();
        buckets.push_back(TimelineInterval{cursor, std::min(next, end)});
        cursor = next;
    }
    return buckets;
}

} // namespace chronicle
