#include "chronicle/record_reader.hpp"
#include "chronicle/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace chronicle {

ReadRecordsResponse RecordReader::read_records(const ReadRecordsRequest& request,
                                               const AccessContext& access) const {
    if (request.page_token != PageToken::kUnset && request.ascending.has_value()) {
        throw InvalidArgumentError("Cannot set both page token and sort order");
    }
    if (request.page_size > kMaxPageSize) {
        throw InvalidArgumentError("Maximum page size: " + std::to_string(kMaxPageSize) +
                                   ", requested: " + std::to_string(request.page_size));
    }
    if (request.page_size < kMinPageSize) {
        throw InvalidArgumentError("Minimum page size: " + std::to_string(kMinPageSize) +
                                   ", requested: " + std::to_string(request.page_size));
    }
    if (is_umbrella_type(request.record_type)) {
        throw InvalidArgumentError(std::string("Cannot read records of type ") +
                                   record_type_name(request.record_type));
    }

    const PageToken cursor = PageToken::from(request.page_token, request.ascending.value_or(true));
    const bool ascending = cursor.is_ascending();

    ReadRecordsResponse response;
    if (!access.can_read(request.record_type)) {
        return response;
    }

    const bool local = request.time_range_filter && request.time_range_filter->is_local();

    RecordScan scan;
    scan.types = {request.record_type};
    scan.origins = request.origin_filters;
    if (!access.read_all_origins && scan.origins.empty()) {
        scan.origins.push_back(access.calling_origin);
    }
    if (request.time_range_filter) {
        const Millis pad = local
            ? Millis(static_cast<int64_t>(ZoneOffset::kMaxSeconds) * kMillisPerSecond)
            : Millis(0);
        scan.start = Instant(request.time_range_filter->timeline_start() - pad);
        scan.end = Instant(request.time_range_filter->timeline_end() + pad);
    } else {
        scan.start = instant_from_millis(0);
        scan.end = instant_from_millis(PageToken::kMaxTimeMillis + 1);
    }

    struct Keyed {
        int64_t key;
        Record record;
    };
    std::vector<Keyed> rows;
    for (auto& record : store_.scan_records(scan)) {
        if (!access.can_read_content(record)) continue;
        Millis key = record.start_time.time_since_epoch() +
                     (local ? record.start_zone_offset.as_millis() : Millis(0));
        if (key.count() < 0 || key.count() > PageToken::kMaxTimeMillis) continue;
        if (request.time_range_filter &&
            (key < request.time_range_filter->timeline_start() ||
             key >= request.time_range_filter->timeline_end())) {
            continue;
        }
        rows.push_back(Keyed{key.count(), std::move(record)});
    }

    std::stable_sort(rows.begin(), rows.end(), [ascending](const Keyed& a, const Keyed& b) {
        return ascending ? a.key < b.key : a.key > b.key;
    });

    size_t pos = 0;
    if (cursor.is_timestamp_set()) {
        const int64_t t = cursor.time_millis();
        while (pos < rows.size() && (ascending ? rows[pos].key < t : rows[pos].key > t)) ++pos;
        int64_t skipped = 0;
        while (pos < rows.size() && rows[pos].key == t && skipped < cursor.offset()) {
            ++pos;
            ++skipped;
        }
    }

    const size_t end = std::min(rows.size(), pos + static_cast<size_t>(request.page_size));
    for (size_t i = pos; i < end; ++i) {
        response.records.push_back(std::move(rows[i].record));
    }

    if (end < rows.size()) {
        size_t first_same = end;
        while (first_same > 0 && rows[first_same - 1].key == rows[end].key) --first_same;
        response.next_page_token =
            PageToken::of(ascending, rows[end].key, static_cast<int64_t>(end - first_same)).encode();
    }

    spdlog::debug("Read {} {} records for {}, next_page_token={}",
                  response.records.size(), record_type_name(request.record_type),
                  access.calling_origin, response.next_page_token);
    return response;
}

} // namespace chronicle
