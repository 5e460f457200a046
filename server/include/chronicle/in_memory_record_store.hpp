#pragma once

#include "chronicle/record_store.hpp"
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace chronicle {

/**
 * Process-local RecordStore. Every mutation and its change-log entries are
 * applied under one exclusive lock, so a reader never sees a sequence id
 * before the mutation it describes.
 */
class InMemoryRecordStore : public RecordStore {
public:
    using Clock = std::function<Instant()>;

    explicit InMemoryRecordStore(Clock clock = now_instant);

    std::vector<Record> insert_records(const std::vector<Record>& records) override;
    void update_records(const std::vector<Record>& records) override;
    int delete_records(const std::vector<RecordIdFilter>& ids, const DataOrigin& origin) override;

    std::vector<Record> scan_records(const RecordScan& scan) const override;
    std::vector<Record> get_records(const std::vector<RecordId>& ids) const override;
    std::vector<ChangeLogEntry> read_change_logs(const ChangeLogScan& scan) const override;
    int64_t latest_sequence_id() const override;
    int purge_change_logs_before(Instant cutoff) override;

    size_t record_count() const;
    size_t change_log_count() const;

private:
    std::optional<int64_t> find_row_locked(const RecordIdFilter& filter, const DataOrigin& origin) const;
    void append_log_locked(const Record& record, ChangeOperation op, Instant now);

    mutable std::shared_mutex mutex_;
    std::map<int64_t, Record> rows_;                       // row id -> record, in scan order
    std::unordered_map<RecordId, int64_t> row_by_id_;
    std::vector<ChangeLogEntry> change_logs_;              // ascending sequence id
    int64_t next_row_id_ = 1;
    int64_t last_sequence_id_ = 0;
    Clock clock_;
};

} // namespace chronicle
