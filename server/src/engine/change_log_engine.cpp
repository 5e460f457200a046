#include "chronicle/change_log_engine.hpp"
#include "chronicle/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace chronicle {

namespace {

// Net effect of one record's entries within a page
struct RecordHistory {
    RecordType type = RecordType::STEPS;
    ChangeOperation first_op = ChangeOperation::Insert;
    ChangeOperation last_op = ChangeOperation::Insert;
    bool updated = false;
    int64_t last_sequence_id = 0;

    // A delete is reported only to a reader that could have seen the record:
    // it existed at the watermark, or an update exposed it in between
    bool delete_observable() const {
        return first_op != ChangeOperation::Insert || updated;
    }
};

template <typename T>
bool contains(const std::vector<T>& values, const T& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

void validate_page_size(int page_size) {
    if (page_size > ChangeLogEngine::kMaxPageSize) {
        throw InvalidArgumentError("Maximum page size: " + std::to_string(ChangeLogEngine::kMaxPageSize) +
                                   ", requested: " + std::to_string(page_size));
    }
    if (page_size < ChangeLogEngine::kMinPageSize) {
        throw InvalidArgumentError("Minimum page size: " + std::to_string(ChangeLogEngine::kMinPageSize) +
                                   ", requested: " + std::to_string(page_size));
    }
}

} // namespace

nlohmann::json ChangeLogsResponse::to_json() const {
    nlohmann::json upserts_json = nlohmann::json::array();
    for (const auto& record : upserts) {
        upserts_json.push_back(record_to_json(record));
    }
    nlohmann::json deletes_json = nlohmann::json::array();
    for (const auto& deleted : deletes) {
        deletes_json.push_back({{"recordId", deleted.record_id},
                                {"recordType", record_type_name(deleted.record_type)}});
    }
    return {
        {"upserts", upserts_json},
        {"deletes", deletes_json},
        {"hasMorePages", has_more_pages},
        {"nextChangesToken", next_token}
    };
}

std::string ChangeLogEngine::get_change_log_token(const ChangeLogTokenRequest& request,
                                                  const AccessContext& access) const {
    if (request.record_types.empty()) {
        throw InvalidArgumentError("Requested record types must not be empty");
    }

    std::vector<std::string> umbrella;
    for (RecordType type : request.record_types) {
        if (is_umbrella_type(type)) umbrella.push_back(record_type_name(type));
    }
    if (!umbrella.empty()) {
        std::string names;
        for (size_t i = 0; i < umbrella.size(); ++i) {
            if (i > 0) names += ", ";
            names += umbrella[i];
        }
        throw InvalidArgumentError("Requested record types must not contain any of [" + names + "]");
    }

    ChangeLogToken token;
    token.watermark = store_.latest_sequence_id();
    for (RecordType type : request.record_types) {
        if (!contains(token.record_types, type)) token.record_types.push_back(type);
    }
    for (const auto& origin : request.origin_filters) {
        if (!contains(token.data_origin_filters, origin)) token.data_origin_filters.push_back(origin);
    }

    spdlog::debug("Change log token for {}: watermark={}, types={}, origins={}",
                  access.calling_origin, token.watermark, token.record_types.size(),
                  token.data_origin_filters.size());
    return token.encode();
}

ChangeLogsResponse ChangeLogEngine::get_change_logs(const ChangeLogsRequest& request,
                                                    const AccessContext& access) const {
    validate_page_size(request.page_size);

    ChangeLogToken token;
    try {
        token = ChangeLogToken::decode(request.token);
    } catch (const InvalidTokenError& e) {
        spdlog::warn("Rejected change log token from {}: {}", access.calling_origin, e.what());
        throw;
    }

    ChangeLogsResponse response;
    response.next_token = request.token;

    ChangeLogScan scan;
    scan.after_sequence_id = token.watermark;
    scan.limit = request.page_size + 1;
    for (RecordType type : token.record_types) {
        if (access.can_read(type)) scan.types.push_back(type);
    }

    scan.origins = token.data_origin_filters;
    if (!access.read_all_origins) {
        if (!scan.origins.empty() && !contains(scan.origins, access.calling_origin)) {
            return response;
        }
        scan.origins = {access.calling_origin};
    }
    if (scan.types.empty()) {
        return response;
    }

    std::vector<ChangeLogEntry> entries = store_.read_change_logs(scan);
    if (static_cast<int>(entries.size()) > request.page_size) {
        response.has_more_pages = true;
        entries.resize(static_cast<size_t>(request.page_size));
    }
    if (entries.empty()) {
        return response;
    }

    std::unordered_map<RecordId, RecordHistory> histories;
    for (const auto& entry : entries) {
        auto inserted = histories.emplace(entry.record_id, RecordHistory{});
        RecordHistory& history = inserted.first->second;
        if (inserted.second) {
            history.type = entry.record_type;
            history.first_op = entry.operation;
        }
        if (entry.operation == ChangeOperation::Update) history.updated = true;
        history.last_op = entry.operation;
        history.last_sequence_id = entry.sequence_id;
    }

    std::unordered_set<RecordId> withheld(token.withheld_record_ids.begin(), token.withheld_record_ids.end());

    // Final state per record, ordered by its last sequence id
    std::map<int64_t, RecordId> upsert_ids;
    std::map<int64_t, DeletedRecord> deletes;
    for (const auto& [record_id, history] : histories) {
        bool was_withheld = withheld.erase(record_id) > 0;
        if (history.last_op == ChangeOperation::Delete) {
            if (history.delete_observable() && !(was_withheld && !history.updated)) {
                deletes.emplace(history.last_sequence_id, DeletedRecord{record_id, history.type});
            }
        } else {
            upsert_ids.emplace(history.last_sequence_id, record_id);
            // Still unobserved until an update shows up
            if (was_withheld && !history.updated) withheld.insert(record_id);
        }
    }

    if (!upsert_ids.empty()) {
        std::vector<RecordId> ids;
        ids.reserve(upsert_ids.size());
        for (const auto& [seq, id] : upsert_ids) ids.push_back(id);

        std::unordered_map<RecordId, Record> snapshots;
        for (auto& record : store_.get_records(ids)) {
            RecordId id = record.id;
            snapshots.emplace(std::move(id), std::move(record));
        }

        // A missing snapshot was deleted after this page; that delete comes later
        for (const auto& [seq, id] : upsert_ids) {
            auto it = snapshots.find(id);
            if (it == snapshots.end()) {
                const RecordHistory& history = histories.at(id);
                if (!history.delete_observable()) withheld.insert(id);
                continue;
            }
            if (!access.can_see_upsert(it->second)) continue;
            response.upserts.push_back(std::move(it->second));
        }
    }
    for (auto& [seq, deleted] : deletes) {
        response.deletes.push_back(std::move(deleted));
    }

    ChangeLogToken next = token;
    next.watermark = entries.back().sequence_id;
    next.withheld_record_ids.clear();
    // A drained feed has already passed every withheld record's delete
    if (response.has_more_pages) {
        for (const auto& id : token.withheld_record_ids) {
            if (withheld.count(id) > 0) next.withheld_record_ids.push_back(id);
        }
        for (const auto& [seq, id] : upsert_ids) {
            if (withheld.count(id) > 0 && !contains(next.withheld_record_ids, id)) {
                next.withheld_record_ids.push_back(id);
            }
        }
    }
    response.next_token = next.encode();

    spdlog::debug("Change logs for {}: {} entries after {}, {} upserts, {} deletes, has_more={}",
                  access.calling_origin, entries.size(), token.watermark,
                  response.upserts.size(), response.deletes.size(), response.has_more_pages);
    return response;
}

} // namespace chronicle
