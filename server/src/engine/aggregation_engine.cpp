#include "chronicle/aggregation_engine.hpp"
#include "chronicle/errors.hpp"
#include "chronicle/interval_math.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>

namespace chronicle {

namespace {

struct MetricAccumulator {
    double sum = 0.0;
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();
    int64_t count = 0;
    const Record* last = nullptr;
    std::set<DataOrigin> origins;

    void add(double value, const Record& record) {
        sum += value;
        min = std::min(min, value);
        max = std::max(max, value);
        ++count;
        last = &record;
        origins.insert(record.data_origin);
    }

    std::optional<double> result(MetricKind kind) const {
        if (count == 0) return std::nullopt;
        switch (kind) {
            case MetricKind::Sum: return sum;
            case MetricKind::Average: return sum / static_cast<double>(count);
            case MetricKind::Min: return min;
            case MetricKind::Max: return max;
            case MetricKind::Count: return static_cast<double>(count);
        }
        return std::nullopt;
    }
};

struct BucketState {
    std::map<MetricId, MetricAccumulator> metrics;
    std::vector<const Record*> contributors;    // scan order
};

double scalar_value(const RecordData& data) {
    if (const auto* steps = std::get_if<StepsData>(&data)) return static_cast<double>(steps->count);
    if (const auto* distance = std::get_if<DistanceData>(&data)) return distance->meters;
    if (const auto* calories = std::get_if<ActiveCaloriesBurnedData>(&data)) return calories->kilocalories;
    if (const auto* weight = std::get_if<WeightData>(&data)) return weight->kilograms;
    return 0.0;
}

nlohmann::json metric_values_json(const std::map<MetricId, std::optional<double>>& values) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [id, value] : values) {
        if (value) {
            j[describe_metric(id).name] = *value;
        } else {
            j[describe_metric(id).name] = nullptr;
        }
    }
    return j;
}

template <typename Map>
std::optional<double> lookup_value(const Map& values, MetricId id) {
    auto it = values.find(id);
    return it == values.end() ? std::nullopt : it->second;
}

} // namespace

std::optional<double> AggregationBucket::value(MetricId id) const {
    return lookup_value(values, id);
}

nlohmann::json AggregationBucket::to_json() const {
    nlohmann::json j = {
        {"startTime", format_instant(start_time)},
        {"endTime", format_instant(end_time)},
        {"zoneOffset", zone_offset.to_string()},
        {"values", metric_values_json(values)},
        {"dataOrigins", contributing_origins}
    };
    if (local_start && local_end) {
        j["localStartTime"] = local_start->to_string();
        j["localEndTime"] = local_end->to_string();
    }
    return j;
}

std::optional<double> AggregateResult::value(MetricId id) const {
    return lookup_value(values, id);
}

nlohmann::json AggregateResult::to_json() const {
    nlohmann::json offsets = nlohmann::json::object();
    for (const auto& [id, offset] : zone_offsets) {
        if (offset) {
            offsets[describe_metric(id).name] = offset->to_string();
        } else {
            offsets[describe_metric(id).name] = nullptr;
        }
    }
    return {
        {"values", metric_values_json(values)},
        {"zoneOffsets", offsets},
        {"dataOrigins", contributing_origins}
    };
}

AggregationEngine::AggregationEngine(const RecordStore& store, ZoneResolver zones, const AggregationConfig& config)
    : store_(store), zones_(zones), planner_(config.max_groups) {}

AggregateResult AggregationEngine::aggregate(const AggregateRequest& request, const AccessContext& access) const {
    auto buckets = compute(request, {BucketPlanner::plan_whole(request.time_range_filter)}, access);
    AggregationBucket& whole = buckets.front();

    AggregateResult result;
    result.values = std::move(whole.values);
    result.zone_offsets = std::move(whole.metric_zone_offsets);
    result.origins = std::move(whole.metric_origins);
    result.contributing_origins = std::move(whole.contributing_origins);
    result.zone_offset = whole.zone_offset;
    return result;
}

std::vector<AggregationBucket> AggregationEngine::aggregate_grouped(const AggregateRequest& request,
                                                                    const GroupUnit& unit,
                                                                    const AccessContext& access) const {
    if (request.metrics.empty()) {
        throw InvalidArgumentError("At least one of the aggregation types must be set");
    }
    return compute(request, planner_.plan(request.time_range_filter, unit), access);
}

std::vector<Record> AggregationEngine::scan(const AggregateRequest& request, const AccessContext& access) const {
    RecordScan scan;
    for (MetricId id : request.metrics) {
        RecordType type = describe_metric(id).record_type;
        if (access.can_read(type) &&
            std::find(scan.types.begin(), scan.types.end(), type) == scan.types.end()) {
            scan.types.push_back(type);
        }
    }
    if (scan.types.empty()) return {};

    scan.origins = request.origin_filters;
    if (!access.read_all_origins && scan.origins.empty()) {
        scan.origins.push_back(access.calling_origin);
    }

    // Local filters may match records written anywhere within +/-18h of the
    // wall-clock range. The extra millisecond keeps an instant at the end of an
    // empty range reachable.
    const TimeRangeFilter& filter = request.time_range_filter;
    const Millis pad = filter.is_local()
        ? Millis(static_cast<int64_t>(ZoneOffset::kMaxSeconds) * kMillisPerSecond)
        : Millis(0);
    scan.start = Instant(filter.timeline_start() - pad);
    scan.end = Instant(filter.timeline_end() + pad + Millis(1));

    std::vector<Record> records = store_.scan_records(scan);
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&access](const Record& r) { return !access.can_read_content(r); }),
                  records.end());
    return records;
}

std::vector<AggregationBucket> AggregationEngine::compute(const AggregateRequest& request,
                                                          const std::vector<TimelineInterval>& buckets,
                                                          const AccessContext& access) const {
    if (request.metrics.empty()) {
        throw InvalidArgumentError("At least one of the aggregation types must be set");
    }

    const TimeRangeFilter& filter = request.time_range_filter;
    const bool local = filter.is_local();

    std::map<RecordType, std::vector<MetricId>> metrics_by_type;
    for (MetricId id : request.metrics) {
        auto& ids = metrics_by_type[describe_metric(id).record_type];
        if (std::find(ids.begin(), ids.end(), id) == ids.end()) ids.push_back(id);
    }

    std::vector<Record> records = buckets.empty() ? std::vector<Record>{} : scan(request, access);

    spdlog::debug("Aggregating {} metrics over {} in {} buckets, {} candidate records",
                  request.metrics.size(), filter.to_string(), buckets.size(), records.size());

    std::vector<BucketState> states(buckets.size());

    for (const Record& record : records) {
        const Millis shift = local ? record.start_zone_offset.as_millis() : Millis(0);
        const Millis rs = record.start_time.time_since_epoch() + shift;
        const Millis re = record.end_time.time_since_epoch() + shift;
        const auto& metric_ids = metrics_by_type[record.type()];

        // Last bucket starting at or before the record start
        auto first = std::upper_bound(buckets.begin(), buckets.end(), rs,
                                      [](Millis t, const TimelineInterval& b) { return t < b.start; });
        size_t index = first == buckets.begin() ? 0 : static_cast<size_t>(first - buckets.begin()) - 1;

        for (; index < buckets.size() && buckets[index].start <= re; ++index) {
            const TimelineInterval& bucket = buckets[index];
            BucketState& state = states[index];
            bool contributed = false;

            if (const auto* hr = std::get_if<HeartRateData>(&record.data)) {
                for (const auto& sample : hr->samples) {
                    Millis t = sample.time.time_since_epoch() + shift;
                    if (!instant_in_bucket(t, bucket.start, bucket.end)) continue;
                    for (MetricId id : metric_ids) {
                        state.metrics[id].add(static_cast<double>(sample.beats_per_minute), record);
                    }
                    contributed = true;
                }
            } else if (contributes(rs, re, bucket.start, bucket.end)) {
                double value = contribution(scalar_value(record.data), rs, re, bucket.start, bucket.end);
                for (MetricId id : metric_ids) {
                    state.metrics[id].add(value, record);
                }
                contributed = true;
            }

            if (contributed && (state.contributors.empty() || state.contributors.back() != &record)) {
                state.contributors.push_back(&record);
            }
        }
    }

    const ZoneOffset fallback = zones_.default_offset();

    std::vector<AggregationBucket> result;
    result.reserve(buckets.size());
    for (size_t i = 0; i < buckets.size(); ++i) {
        const BucketState& state = states[i];
        AggregationBucket bucket;
        bucket.zone_offset = ZoneResolver::resolve_bucket_offset(state.contributors, fallback);

        if (local) {
            bucket.local_start = LocalDateTime::from_local_millis(buckets[i].start);
            bucket.local_end = LocalDateTime::from_local_millis(buckets[i].end);
            bucket.start_time = bucket.local_start->to_instant(bucket.zone_offset);
            bucket.end_time = bucket.local_end->to_instant(bucket.zone_offset);
        } else {
            bucket.start_time = Instant(buckets[i].start);
            bucket.end_time = Instant(buckets[i].end);
        }

        for (const Record* contributor : state.contributors) {
            bucket.contributing_origins.insert(contributor->data_origin);
        }

        for (MetricId id : request.metrics) {
            auto it = state.metrics.find(id);
            if (it == state.metrics.end()) {
                bucket.values[id] = std::nullopt;
                bucket.metric_zone_offsets[id] = std::nullopt;
                bucket.metric_origins[id] = {};
                continue;
            }
            const MetricAccumulator& acc = it->second;
            bucket.values[id] = acc.result(describe_metric(id).kind);
            bucket.metric_zone_offsets[id] = acc.last->start_zone_offset;
            bucket.metric_origins[id] = acc.origins;
        }
        result.push_back(std::move(bucket));
    }
    return result;
}

} // namespace chronicle
