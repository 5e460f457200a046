#include "chronicle/interval_math.hpp"
#include <algorithm>

namespace chronicle {

Millis overlap(Millis record_start, Millis record_end, Millis bucket_start, Millis bucket_end) {
    Millis lo = std::max(record_start, bucket_start);
    Millis hi = std::min(record_end, bucket_end);
    return hi > lo ? hi - lo : Millis(0);
}

double rescale(double value, Millis overlap_duration, Millis record_duration) {
    if (record_duration.count() <= 0) return value;
    return value * static_cast<double>(overlap_duration.count()) /
           static_cast<double>(record_duration.count());
}

bool instant_in_bucket(Millis t, Millis bucket_start, Millis bucket_end) {
    if (bucket_end <= bucket_start) return t == bucket_start;
    return t >= bucket_start && t < bucket_end;
}

double contribution(double value, Millis record_start, Millis record_end,
                    Millis bucket_start, Millis bucket_end) {
    Millis duration = record_end - record_start;
    if (duration.count() <= 0) {
        return instant_in_bucket(record_start, bucket_start, bucket_end) ? value : 0.0;
    }
    return rescale(value, overlap(record_start, record_end, bucket_start, bucket_end), duration);
}

bool contributes(Millis record_start, Millis record_end, Millis bucket_start, Millis bucket_end) {
    if (record_end <= record_start) {
        return instant_in_bucket(record_start, bucket_start, bucket_end);
    }
    return overlap(record_start, record_end, bucket_start, bucket_end).count() > 0;
}

} // namespace chronicle
