#pragma once

#include "chronicle/access_context.hpp"
#include "chronicle/change_log_token.hpp"
#include "chronicle/record_store.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace chronicle {

struct ChangeLogTokenRequest {
    std::vector<RecordType> record_types;
    std::vector<DataOrigin> origin_filters;   // empty = all origins
};

struct ChangeLogsRequest {
    std::string token;
    int page_size = 1000;
};

struct DeletedRecord {
    RecordId record_id;
    RecordType record_type = RecordType::STEPS;
};

struct ChangeLogsResponse {
    std::vector<Record> upserts;
    std::vector<DeletedRecord> deletes;
    bool has_more_pages = false;
    std::string next_token;

    nlohmann::json to_json() const;
};

/**
 * Incremental change feed over the store's change log.
 *
 * A page reads up to page_size raw log entries after the token watermark and
 * folds them per record into the net change: one upsert with the current
 * snapshot, one delete, or nothing for a record created and deleted unseen.
 */
class ChangeLogEngine {
public:
    static constexpr int kDefaultPageSize = 1000;
    static constexpr int kMinPageSize = 1;
    static constexpr int kMaxPageSize = 5000;

    explicit ChangeLogEngine(const RecordStore& store) : store_(store) {}

    std::string get_change_log_token(const ChangeLogTokenRequest& request, const AccessContext& access) const;

    ChangeLogsResponse get_change_logs(const ChangeLogsRequest& request, const AccessContext& access) const;

private:
    const RecordStore& store_;
};

} // namespace chronicle
