#pragma once

#include "chronicle/record_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace chronicle {

enum class MetricId {
    STEPS_COUNT_TOTAL,
    DISTANCE_TOTAL,
    ACTIVE_CALORIES_TOTAL,
    HEART_RATE_BPM_AVG,
    HEART_RATE_BPM_MIN,
    HEART_RATE_BPM_MAX,
    HEART_RATE_MEASUREMENTS_COUNT,
    WEIGHT_AVG,
    WEIGHT_MIN,
    WEIGHT_MAX,
};

enum class MetricKind {
    Sum,      // proportionally rescaled over the bucket overlap
    Average,
    Min,
    Max,
    Count,
};

struct MetricDescriptor {
    MetricId id;
    const char* name;
    RecordType record_type;
    MetricKind kind;
};

const MetricDescriptor& describe_metric(MetricId id);
const std::vector<MetricId>& all_metrics();
std::optional<MetricId> metric_from_name(const std::string& name);

} // namespace chronicle
