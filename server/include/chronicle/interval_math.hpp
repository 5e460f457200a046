#pragma once

#include "chronicle/time_types.hpp"

namespace chronicle {

/**
 * Half-open interval on a timeline (epoch millis or local millis).
 */
struct TimelineInterval {
    Millis start{0};
    Millis end{0};

    Millis length() const { return end - start; }
    bool operator==(const TimelineInterval& o) const { return start == o.start && end == o.end; }
};

// max(0, min(record_end, bucket_end) - max(record_start, bucket_start))
Millis overlap(Millis record_start, Millis record_end, Millis bucket_start, Millis bucket_end);

// value * overlap / record_duration. Zero-length records are not rescaled.
double rescale(double value, Millis overlap_duration, Millis record_duration);

// Whether an instant falls in [bucket_start, bucket_end). A zero-length bucket
// only holds its own start.
bool instant_in_bucket(Millis t, Millis bucket_start, Millis bucket_end);

/**
 * Share of `value` attributed to a bucket for a record spanning
 * [record_start, record_end). Zero-length records contribute their full value
 * to the bucket containing record_start and nothing elsewhere.
 */
double contribution(double value, Millis record_start, Millis record_end,
                    Millis bucket_start, Millis bucket_end);

// Whether the record takes part in the bucket at all (non-zero overlap, or the
// containing bucket for an instant)
bool contributes(Millis record_start, Millis record_end, Millis bucket_start, Millis bucket_end);

} // namespace chronicle
