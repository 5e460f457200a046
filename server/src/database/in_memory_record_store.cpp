#include "chronicle/in_memory_record_store.hpp"
#include "chronicle/errors.hpp"
#include "chronicle/uuid.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace chronicle {

namespace {

template <typename T>
bool contains(const std::vector<T>& values, const T& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

const char* change_operation_name(ChangeOperation op) {
    switch (op) {
        case ChangeOperation::Insert: return "insert";
        case ChangeOperation::Update: return "update";
        case ChangeOperation::Delete: return "delete";
    }
    return "unknown";
}

InMemoryRecordStore::InMemoryRecordStore(Clock clock) : clock_(std::move(clock)) {}

std::optional<int64_t> InMemoryRecordStore::find_row_locked(const RecordIdFilter& filter,
                                                            const DataOrigin& origin) const {
    if (filter.id) {
        auto it = row_by_id_.find(*filter.id);
        if (it == row_by_id_.end()) return std::nullopt;
        const Record& stored = rows_.at(it->second);
        if (stored.data_origin != origin || stored.type() != filter.type) return std::nullopt;
        return it->second;
    }
    if (filter.client_record_id) {
        for (const auto& [row_id, stored] : rows_) {
            if (stored.data_origin == origin && stored.type() == filter.type &&
                stored.client_record_id == filter.client_record_id) {
                return row_id;
            }
        }
    }
    return std::nullopt;
}

void InMemoryRecordStore::append_log_locked(const Record& record, ChangeOperation op, Instant now) {
    ChangeLogEntry entry;
    entry.sequence_id = ++last_sequence_id_;
    entry.record_id = record.id;
    entry.record_type = record.type();
    entry.data_origin = record.data_origin;
    entry.operation = op;
    entry.commit_time = now;
    spdlog::debug("Change log {} {} record {}", entry.sequence_id, change_operation_name(op), record.id);
    change_logs_.push_back(std::move(entry));
}

std::vector<Record> InMemoryRecordStore::insert_records(const std::vector<Record>& records) {
    for (const auto& record : records) {
        validate_record(record);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::unordered_set<RecordId> batch_ids;
    for (const auto& record : records) {
        if (record.id.empty()) continue;
        if (row_by_id_.count(record.id) > 0 || !batch_ids.insert(record.id).second) {
            throw InvalidArgumentError("Record id already exists: " + record.id);
        }
    }

    const Instant now = clock_();
    std::vector<Record> stored;
    stored.reserve(records.size());

    for (const auto& input : records) {
        if (input.client_record_id) {
            auto existing = find_row_locked(
                RecordIdFilter::from_client_record_id(input.type(), *input.client_record_id),
                input.data_origin);
            if (existing) {
                Record& current = rows_.at(*existing);
                if (input.client_record_version >= current.client_record_version) {
                    RecordId id = current.id;
                    current = input;
                    current.id = id;
                    current.last_modified_time = now;
                    append_log_locked(current, ChangeOperation::Update, now);
                } else {
                    spdlog::debug("Skipping stale write for client record id {} (version {} < {})",
                                  *input.client_record_id, input.client_record_version,
                                  current.client_record_version);
                }
                stored.push_back(current);
                continue;
            }
        }

        Record record = input;
        if (record.id.empty()) record.id = generate_uuid_v7(now);
        record.last_modified_time = now;

        int64_t row_id = next_row_id_++;
        row_by_id_[record.id] = row_id;
        rows_.emplace(row_id, record);
        append_log_locked(record, ChangeOperation::Insert, now);
        stored.push_back(std::move(record));
    }
    return stored;
}

void InMemoryRecordStore::update_records(const std::vector<Record>& records) {
    for (const auto& record : records) {
        validate_record(record);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::vector<int64_t> targets;
    targets.reserve(records.size());
    for (const auto& record : records) {
        RecordIdFilter filter = record.id.empty() && record.client_record_id
            ? RecordIdFilter::from_client_record_id(record.type(), *record.client_record_id)
            : RecordIdFilter::from_id(record.type(), record.id);
        auto row = find_row_locked(filter, record.data_origin);
        if (!row) {
            throw InvalidArgumentError("Record not found: " +
                                       (record.id.empty() ? record.client_record_id.value_or("") : record.id));
        }
        targets.push_back(*row);
    }

    const Instant now = clock_();
    for (size_t i = 0; i < records.size(); ++i) {
        Record& current = rows_.at(targets[i]);
        RecordId id = current.id;
        current = records[i];
        current.id = id;
        current.last_modified_time = now;
        append_log_locked(current, ChangeOperation::Update, now);
    }
}

int InMemoryRecordStore::delete_records(const std::vector<RecordIdFilter>& ids, const DataOrigin& origin) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    const Instant now = clock_();
    int deleted = 0;
    for (const auto& filter : ids) {
        auto row = find_row_locked(filter, origin);
        if (!row) continue;

        auto it = rows_.find(*row);
        append_log_locked(it->second, ChangeOperation::Delete, now);
        row_by_id_.erase(it->second.id);
        rows_.erase(it);
        ++deleted;
    }
    return deleted;
}

std::vector<Record> InMemoryRecordStore::scan_records(const RecordScan& scan) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<Record> result;
    for (const auto& [row_id, record] : rows_) {
        if (!contains(scan.types, record.type())) continue;
        if (!scan.origins.empty() && !contains(scan.origins, record.data_origin)) continue;
        if (record.start_time < scan.end && record.end_time >= scan.start) {
            result.push_back(record);
        }
    }
    return result;
}

std::vector<Record> InMemoryRecordStore::get_records(const std::vector<RecordId>& ids) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<Record> result;
    for (const auto& id : ids) {
        auto it = row_by_id_.find(id);
        if (it != row_by_id_.end()) {
            result.push_back(rows_.at(it->second));
        }
    }
    return result;
}

std::vector<ChangeLogEntry> InMemoryRecordStore::read_change_logs(const ChangeLogScan& scan) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = std::upper_bound(change_logs_.begin(), change_logs_.end(), scan.after_sequence_id,
                               [](int64_t seq, const ChangeLogEntry& e) { return seq < e.sequence_id; });

    std::vector<ChangeLogEntry> result;
    for (; it != change_logs_.end() && static_cast<int>(result.size()) < scan.limit; ++it) {
        if (!contains(scan.types, it->record_type)) continue;
        if (!scan.origins.empty() && !contains(scan.origins, it->data_origin)) continue;
        result.push_back(*it);
    }
    return result;
}

int64_t InMemoryRecordStore::latest_sequence_id() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_sequence_id_;
}

int InMemoryRecordStore::purge_change_logs_before(Instant cutoff) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto kept_end = std::remove_if(change_logs_.begin(), change_logs_.end(),
                                   [cutoff](const ChangeLogEntry& e) { return e.commit_time < cutoff; });
    int removed = static_cast<int>(std::distance(kept_end, change_logs_.end()));
    change_logs_.erase(kept_end, change_logs_.end());
    return removed;
}

size_t InMemoryRecordStore::record_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rows_.size();
}

size_t InMemoryRecordStore::change_log_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return change_logs_.size();
}

} // namespace chronicle
