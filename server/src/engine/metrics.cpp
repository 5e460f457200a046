#include "chronicle/metrics.hpp"

namespace chronicle {

namespace {

const std::vector<MetricDescriptor>& descriptors() {
    static const std::vector<MetricDescriptor> kDescriptors = {
        {MetricId::STEPS_COUNT_TOTAL, "STEPS_COUNT_TOTAL", RecordType::STEPS, MetricKind::Sum},
        {MetricId::DISTANCE_TOTAL, "DISTANCE_TOTAL", RecordType::DISTANCE, MetricKind::Sum},
        {MetricId::ACTIVE_CALORIES_TOTAL, "ACTIVE_CALORIES_TOTAL", RecordType::ACTIVE_CALORIES_BURNED, MetricKind::Sum},
        {MetricId::HEART_RATE_BPM_AVG, "HEART_RATE_BPM_AVG", RecordType::HEART_RATE, MetricKind::Average},
        {MetricId::HEART_RATE_BPM_MIN, "HEART_RATE_BPM_MIN", RecordType::HEART_RATE, MetricKind::Min},
        {MetricId::HEART_RATE_BPM_MAX, "HEART_RATE_BPM_MAX", RecordType::HEART_RATE, MetricKind::Max},
        {MetricId::HEART_RATE_MEASUREMENTS_COUNT, "HEART_RATE_MEASUREMENTS_COUNT", RecordType::HEART_RATE, MetricKind::Count},
        {MetricId::WEIGHT_AVG, "WEIGHT_AVG", RecordType::WEIGHT, MetricKind::Average},
        {MetricId::WEIGHT_MIN, "WEIGHT_MIN", RecordType::WEIGHT, MetricKind::Min},
        {MetricId::WEIGHT_MAX, "WEIGHT_MAX", RecordType::WEIGHT, MetricKind::Max},
    };
    return kDescriptors;
}

} // namespace

const MetricDescriptor& describe_metric(MetricId id) {
    return descriptors().at(static_cast<size_t>(id));
}

const std::vector<MetricId>& all_metrics() {
    static const std::vector<MetricId> kMetrics = [] {
        std::vector<MetricId> ids;
        for (const auto& d : descriptors()) ids.push_back(d.id);
        return ids;
    }();
    return kMetrics;
}

std::optional<MetricId> metric_from_name(const std::string& name) {
    for (const auto& d : descriptors()) {
        if (name == d.name) return d.id;
    }
    return std::nullopt;
}

} // namespace chronicle
