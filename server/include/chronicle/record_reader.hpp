#pragma once

#include "chronicle/access_context.hpp"
#include "chronicle/page_token.hpp"
#include "chronicle/record_store.hpp"
#include <optional>
#include <vector>

namespace chronicle {

struct ReadRecordsRequest {
    RecordType record_type = RecordType::STEPS;
    std::optional<TimeRangeFilter> time_range_filter;   // unset = all time
    std::vector<DataOrigin> origin_filters;
    int page_size = 1000;
    int64_t page_token = PageToken::kUnset;
    std::optional<bool> ascending;                       // only on the first page
};

struct ReadRecordsResponse {
    std::vector<Record> records;
    int64_t next_page_token = PageToken::kUnset;
};

/**
 * Paginated reads of one record type, ordered by start time (projected onto
 * the local timeline for local filters). Records sharing a start time keep
 * scan order, and the page token records how many of them were already
 * returned.
 *
 * Only start times in [0, PageToken::kMaxTimeMillis] on that timeline are
 * readable, since the page token cannot encode anything else. Records outside
 * that range are skipped.
 */
class RecordReader {
public:
    static constexpr int kMinPageSize = 1;
    static constexpr int kMaxPageSize = 5000;

    explicit RecordReader(const RecordStore& store) : store_(store) {}

    ReadRecordsResponse read_records(const ReadRecordsRequest& request, const AccessContext& access) const;

private:
    const RecordStore& store_;
};

} // namespace chronicle
