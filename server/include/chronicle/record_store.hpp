#pragma once

#include "chronicle/record_types.hpp"
#include <cstdint>
#include <vector>

namespace chronicle {

enum class ChangeOperation : uint8_t {
    Insert = 1,
    Update = 2,
    Delete = 3,
};

const char* change_operation_name(ChangeOperation op);

/**
 * One row of the store's change log, written in the same transaction as the
 * mutation it describes. Sequence ids are unique and increase in commit order
 * across every record type and origin.
 */
struct ChangeLogEntry {
    int64_t sequence_id = 0;
    RecordId record_id;
    RecordType record_type = RecordType::STEPS;
    DataOrigin data_origin;
    ChangeOperation operation = ChangeOperation::Insert;
    Instant commit_time;
};

/**
 * Time-range scan. Matches records with start_time < end and end_time >= start,
 * returned in scan order (order of first insertion).
 */
struct RecordScan {
    std::vector<RecordType> types;        // concrete types, required
    std::vector<DataOrigin> origins;      // empty = all origins
    Instant start;
    Instant end;
};

struct ChangeLogScan {
    int64_t after_sequence_id = 0;
    std::vector<RecordType> types;        // concrete types, required
    std::vector<DataOrigin> origins;      // empty = all origins
    int limit = 1000;
};

/**
 * Persistent record store used by the engines.
 *
 * Writes validate the whole batch first and apply it atomically together with
 * its change-log entries. Reads observe committed state only.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    // Assigns ids and last-modified times. A record whose client record id
    // already exists for its origin and type updates that record when its
    // version is >= the stored one, and is dropped otherwise. Returns the
    // stored state of every input record, in input order.
    virtual std::vector<Record> insert_records(const std::vector<Record>& records) = 0;

    // Records are matched by id, or by client record id when id is empty.
    // Throws InvalidArgumentError if any record does not exist for its origin.
    virtual void update_records(const std::vector<Record>& records) = 0;

    // Deletes the caller's records. Missing ids are ignored. Returns the number deleted.
    virtual int delete_records(const std::vector<RecordIdFilter>& ids, const DataOrigin& origin) = 0;

    virtual std::vector<Record> scan_records(const RecordScan& scan) const = 0;

    // Current snapshots of the existing ids, in no particular order
    virtual std::vector<Record> get_records(const std::vector<RecordId>& ids) const = 0;

    // Entries with sequence id > after_sequence_id, ascending, at most `limit`
    virtual std::vector<ChangeLogEntry> read_change_logs(const ChangeLogScan& scan) const = 0;

    // 0 when nothing was ever written
    virtual int64_t latest_sequence_id() const = 0;

    // Removes change-log entries committed before `cutoff`. Returns the number removed.
    virtual int purge_change_logs_before(Instant cutoff) = 0;
};

} // namespace chronicle
