#pragma once

#include "chronicle/database.hpp"
#include "chronicle/record_store.hpp"
#include <functional>
#include <memory>
#include <string>

namespace chronicle {

/**
 * RecordStore on PostgreSQL.
 *
 * Every write transaction first takes a transaction-scoped advisory lock, so
 * change-log sequence ids (BIGSERIAL) become visible in the order they were
 * assigned. Times are stored as epoch milliseconds, payloads as JSONB.
 */
class PgRecordStore : public RecordStore {
public:
    using Clock = std::function<Instant()>;

    // Throws InvalidArgumentError for schema names other than [a-z0-9_]+
    PgRecordStore(std::shared_ptr<DatabasePool> pool, const std::string& schema, Clock clock = now_instant);

    // Creates the schema, tables and indexes if missing
    void initialize_schema();

    std::vector<Record> insert_records(const std::vector<Record>& records) override;
    void update_records(const std::vector<Record>& records) override;
    int delete_records(const std::vector<RecordIdFilter>& ids, const DataOrigin& origin) override;

    std::vector<Record> scan_records(const RecordScan& scan) const override;
    std::vector<Record> get_records(const std::vector<RecordId>& ids) const override;
    std::vector<ChangeLogEntry> read_change_logs(const ChangeLogScan& scan) const override;
    int64_t latest_sequence_id() const override;
    int purge_change_logs_before(Instant cutoff) override;

private:
    template <typename Fn>
    void with_write_transaction(Fn&& fn);

    std::string table(const char* name) const { return schema_ + "." + name; }

    std::shared_ptr<DatabasePool> pool_;
    std::string schema_;
    Clock clock_;
};

} // namespace chronicle
