#pragma once

#include "chronicle/access_context.hpp"
#include "chronicle/bucket_planner.hpp"
#include "chronicle/config.hpp"
#include "chronicle/metrics.hpp"
#include "chronicle/record_store.hpp"
#include "chronicle/zone_resolver.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace chronicle {

struct AggregateRequest {
    TimeRangeFilter time_range_filter;
    std::vector<MetricId> metrics;
    std::vector<DataOrigin> origin_filters;   // empty = every visible origin
};

/**
 * Totals for one bucket. A metric with no contributing data maps to nullopt,
 * as does its zone offset. zone_offset always carries either the attributed
 * offset or the fallback.
 */
struct AggregationBucket {
    Instant start_time;
    Instant end_time;
    std::optional<LocalDateTime> local_start;   // set for local filters
    std::optional<LocalDateTime> local_end;
    ZoneOffset zone_offset;
    std::map<MetricId, std::optional<double>> values;
    std::map<MetricId, std::optional<ZoneOffset>> metric_zone_offsets;
    std::map<MetricId, std::set<DataOrigin>> metric_origins;
    std::set<DataOrigin> contributing_origins;

    std::optional<double> value(MetricId id) const;
    nlohmann::json to_json() const;
};

struct AggregateResult {
    std::map<MetricId, std::optional<double>> values;
    std::map<MetricId, std::optional<ZoneOffset>> zone_offsets;
    std::map<MetricId, std::set<DataOrigin>> origins;
    std::set<DataOrigin> contributing_origins;
    ZoneOffset zone_offset;

    std::optional<double> value(MetricId id) const;
    nlohmann::json to_json() const;
};

/**
 * Computes aggregates over the records a caller may read.
 *
 * Records are projected onto the filter's timeline (their start offset is
 * added for local filters) and each bucket takes the rescaled share of every
 * record overlapping it.
 */
class AggregationEngine {
public:
    AggregationEngine(const RecordStore& store, ZoneResolver zones, const AggregationConfig& config);

    AggregateResult aggregate(const AggregateRequest& request, const AccessContext& access) const;

    std::vector<AggregationBucket> aggregate_grouped(const AggregateRequest& request,
                                                     const GroupUnit& unit,
                                                     const AccessContext& access) const;

private:
    std::vector<AggregationBucket> compute(const AggregateRequest& request,
                                           const std::vector<TimelineInterval>& buckets,
                                           const AccessContext& access) const;

    std::vector<Record> scan(const AggregateRequest& request, const AccessContext& access) const;

    const RecordStore& store_;
    ZoneResolver zones_;
    BucketPlanner planner_;
};

} // namespace chronicle
