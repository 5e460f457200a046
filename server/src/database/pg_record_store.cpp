#include "chronicle/pg_record_store.hpp"
#include "chronicle/errors.hpp"
#include "chronicle/uuid.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace chronicle {

namespace {

// Serializes writers so sequence ids commit in order
constexpr int64_t WRITE_LOCK_ID = 5190001;

const char* RECORD_COLUMNS =
    "id, record_type, data_origin, client_record_id, client_record_version, start_time, end_time, "
    "start_zone_offset, end_zone_offset, last_modified_time, payload::text";

std::string quote_array_element(const std::string& value) {
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string to_pg_text_array(const std::vector<std::string>& values) {
    std::string out = "{";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ",";
        out += quote_array_element(values[i]);
    }
    return out + "}";
}

std::string to_pg_type_array(const std::vector<RecordType>& types) {
    std::string out = "{";
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0) out += ",";
        out += std::to_string(static_cast<int>(types[i]));
    }
    return out + "}";
}

std::string millis_param(Instant t) {
    return std::to_string(to_epoch_millis(t));
}

RecordType parse_record_type(const std::string& value) {
    auto type = record_type_from_code(std::stoi(value));
    if (!type || is_umbrella_type(*type)) {
        throw std::runtime_error("Unknown record type code in store: " + value);
    }
    return *type;
}

Record record_from_row(const QueryResult& result, int row) {
    Record record;
    record.id = result.get_value(row, 0);
    RecordType type = parse_record_type(result.get_value(row, 1));
    record.data_origin = result.get_value(row, 2);
    if (!result.is_null(row, 3)) {
        record.client_record_id = result.get_value(row, 3);
    }
    record.client_record_version = std::stoll(result.get_value(row, 4));
    record.start_time = instant_from_millis(std::stoll(result.get_value(row, 5)));
    record.end_time = instant_from_millis(std::stoll(result.get_value(row, 6)));
    record.start_zone_offset = ZoneOffset::of_total_seconds(std::stoll(result.get_value(row, 7)));
    record.end_zone_offset = ZoneOffset::of_total_seconds(std::stoll(result.get_value(row, 8)));
    record.last_modified_time = instant_from_millis(std::stoll(result.get_value(row, 9)));
    record.data = record_data_from_json(type, nlohmann::json::parse(result.get_value(row, 10)));
    return record;
}

std::vector<Record> records_from_result(const QueryResult& result) {
    std::vector<Record> records;
    records.reserve(static_cast<size_t>(result.num_rows()));
    for (int row = 0; row < result.num_rows(); ++row) {
        records.push_back(record_from_row(result, row));
    }
    return records;
}

std::vector<std::string> record_params(const Record& record) {
    return {
        record.id,
        std::to_string(static_cast<int>(record.type())),
        record.data_origin,
        record.client_record_id.value_or(""),
        std::to_string(record.client_record_version),
        millis_param(record.start_time),
        millis_param(record.end_time),
        std::to_string(record.start_zone_offset.total_seconds),
        std::to_string(record.end_zone_offset.total_seconds),
        millis_param(record.last_modified_time),
        record_data_to_json(record.data).dump()
    };
}

} // namespace

PgRecordStore::PgRecordStore(std::shared_ptr<DatabasePool> pool, const std::string& schema, Clock clock)
    : pool_(std::move(pool)), schema_(schema), clock_(std::move(clock)) {
    if (schema_.empty() || schema_.find_first_not_of("abcdefghijklmnopqrstuvwxyz0123456789_") != std::string::npos) {
        throw InvalidArgumentError("Invalid schema name: " + schema_);
    }
    if (!pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
}

void PgRecordStore::initialize_schema() {
    const std::string records = table("records");
    const std::string change_logs = table("change_logs");

    const std::string ddl =
        "CREATE SCHEMA IF NOT EXISTS " + schema_ + ";"
        "CREATE TABLE IF NOT EXISTS " + records + " ("
        "  row_id BIGSERIAL PRIMARY KEY,"
        "  id TEXT NOT NULL UNIQUE,"
        "  record_type SMALLINT NOT NULL,"
        "  data_origin TEXT NOT NULL,"
        "  client_record_id TEXT,"
        "  client_record_version BIGINT NOT NULL DEFAULT 0,"
        "  start_time BIGINT NOT NULL,"
        "  end_time BIGINT NOT NULL,"
        "  start_zone_offset INTEGER NOT NULL,"
        "  end_zone_offset INTEGER NOT NULL,"
        "  last_modified_time BIGINT NOT NULL,"
        "  payload JSONB NOT NULL"
        ");"
        "CREATE UNIQUE INDEX IF NOT EXISTS records_client_id_idx ON " + records +
        "  (data_origin, record_type, client_record_id) WHERE client_record_id IS NOT NULL;"
        "CREATE INDEX IF NOT EXISTS records_type_time_idx ON " + records + " (record_type, start_time);"
        "CREATE TABLE IF NOT EXISTS " + change_logs + " ("
        "  sequence_id BIGSERIAL PRIMARY KEY,"
        "  record_id TEXT NOT NULL,"
        "  record_type SMALLINT NOT NULL,"
        "  data_origin TEXT NOT NULL,"
        "  operation SMALLINT NOT NULL,"
        "  commit_time BIGINT NOT NULL"
        ");"
        "CREATE INDEX IF NOT EXISTS change_logs_commit_time_idx ON " + change_logs + " (commit_time);";

    ScopedConnection conn(pool_.get());
    QueryResult(conn->exec(ddl)).check("Failed to initialize schema " + schema_);
    spdlog::info("Record store schema '{}' ready", schema_);
}

template <typename Fn>
void PgRecordStore::with_write_transaction(Fn&& fn) {
    ScopedConnection conn(pool_.get());
    if (!conn->begin_transaction()) {
        throw std::runtime_error("Failed to begin write transaction");
    }
    try {
        QueryResult(conn->exec_params("SELECT pg_advisory_xact_lock($1::bigint)",
                                      {std::to_string(WRITE_LOCK_ID)}))
            .check("Failed to acquire write lock");
        fn(*conn);
        if (!conn->commit_transaction()) {
            throw std::runtime_error("Failed to commit write transaction");
        }
    } catch (const std::exception& e) {
        if (!conn->rollback_transaction()) {
            spdlog::error("Rollback failed after write error: {}", e.what());
        }
        throw;
    }
}

namespace {

void append_change_log(DatabaseConnection& conn, const std::string& change_logs, const Record& record,
                       ChangeOperation op, Instant now) {
    QueryResult(conn.exec_params(
        "INSERT INTO " + change_logs + " (record_id, record_type, data_origin, operation, commit_time) "
        "VALUES ($1, $2::smallint, $3, $4::smallint, $5::bigint)",
        {record.id, std::to_string(static_cast<int>(record.type())), record.data_origin,
         std::to_string(static_cast<int>(op)), millis_param(now)}))
        .check("Failed to append change log");
    spdlog::debug("Change log {} record {}", change_operation_name(op), record.id);
}

void overwrite_record(DatabaseConnection& conn, const std::string& records, const Record& record) {
    QueryResult(conn.exec_params(
        "UPDATE " + records + " SET record_type = $2::smallint, data_origin = $3, "
        "client_record_id = NULLIF($4, ''), client_record_version = $5::bigint, "
        "start_time = $6::bigint, end_time = $7::bigint, start_zone_offset = $8::integer, "
        "end_zone_offset = $9::integer, last_modified_time = $10::bigint, payload = $11::jsonb "
        "WHERE id = $1",
        record_params(record)))
        .check("Failed to update record " + record.id);
}

std::optional<Record> find_for_update(DatabaseConnection& conn, const std::string& records,
                                      const RecordIdFilter& filter, const DataOrigin& origin) {
    std::string where;
    std::vector<std::string> params = {origin, std::to_string(static_cast<int>(filter.type))};
    if (filter.id) {
        where = "id = $3";
        params.push_back(*filter.id);
    } else if (filter.client_record_id) {
        where = "client_record_id = $3";
        params.push_back(*filter.client_record_id);
    } else {
        return std::nullopt;
    }

    QueryResult result(conn.exec_params(
        std::string("SELECT ") + RECORD_COLUMNS + " FROM " + records +
        " WHERE data_origin = $1 AND record_type = $2::smallint AND " + where + " FOR UPDATE",
        params));
    result.check("Failed to look up record");
    if (result.num_rows() == 0) return std::nullopt;
    return record_from_row(result, 0);
}

} // namespace

std::vector<Record> PgRecordStore::insert_records(const std::vector<Record>& records) {
    for (const auto& record : records) {
        validate_record(record);
    }

    const std::string records_table = table("records");
    const std::string change_logs = table("change_logs");
    std::vector<Record> stored;

    with_write_transaction([&](DatabaseConnection& conn) {
        const Instant now = clock_();
        stored.clear();

        for (const auto& input : records) {
            if (input.client_record_id) {
                auto existing = find_for_update(
                    conn, records_table,
                    RecordIdFilter::from_client_record_id(input.type(), *input.client_record_id),
                    input.data_origin);
                if (existing) {
                    if (input.client_record_version >= existing->client_record_version) {
                        Record updated = input;
                        updated.id = existing->id;
                        updated.last_modified_time = now;
                        overwrite_record(conn, records_table, updated);
                        append_change_log(conn, change_logs, updated, ChangeOperation::Update, now);
                        stored.push_back(std::move(updated));
                    } else {
                        spdlog::debug("Skipping stale write for client record id {}", *input.client_record_id);
                        stored.push_back(std::move(*existing));
                    }
                    continue;
                }
            }

            Record record = input;
            if (record.id.empty()) {
                record.id = generate_uuid_v7(now);
            } else {
                QueryResult dup(conn.exec_params("SELECT 1 FROM " + records_table + " WHERE id = $1", {record.id}));
                dup.check("Failed to check record id");
                if (dup.num_rows() > 0) {
                    throw InvalidArgumentError("Record id already exists: " + record.id);
                }
            }
            record.last_modified_time = now;

            QueryResult(conn.exec_params(
                "INSERT INTO " + records_table + " (id, record_type, data_origin, client_record_id, "
                "client_record_version, start_time, end_time, start_zone_offset, end_zone_offset, "
                "last_modified_time, payload) VALUES ($1, $2::smallint, $3, NULLIF($4, ''), $5::bigint, "
                "$6::bigint, $7::bigint, $8::integer, $9::integer, $10::bigint, $11::jsonb)",
                record_params(record)))
                .check("Failed to insert record");
            append_change_log(conn, change_logs, record, ChangeOperation::Insert, now);
            stored.push_back(std::move(record));
        }
    });
    return stored;
}

void PgRecordStore::update_records(const std::vector<Record>& records) {
    for (const auto& record : records) {
        validate_record(record);
    }

    const std::string records_table = table("records");
    const std::string change_logs = table("change_logs");

    with_write_transaction([&](DatabaseConnection& conn) {
        const Instant now = clock_();
        for (const auto& input : records) {
            RecordIdFilter filter = input.id.empty() && input.client_record_id
                ? RecordIdFilter::from_client_record_id(input.type(), *input.client_record_id)
                : RecordIdFilter::from_id(input.type(), input.id);
            auto existing = find_for_update(conn, records_table, filter, input.data_origin);
            if (!existing) {
                throw InvalidArgumentError("Record not found: " +
                                           (input.id.empty() ? input.client_record_id.value_or("") : input.id));
            }
            Record updated = input;
            updated.id = existing->id;
            updated.last_modified_time = now;
            overwrite_record(conn, records_table, updated);
            append_change_log(conn, change_logs, updated, ChangeOperation::Update, now);
        }
    });
}

int PgRecordStore::delete_records(const std::vector<RecordIdFilter>& ids, const DataOrigin& origin) {
    const std::string records_table = table("records");
    const std::string change_logs = table("change_logs");
    int deleted = 0;

    with_write_transaction([&](DatabaseConnection& conn) {
        const Instant now = clock_();
        deleted = 0;
        for (const auto& filter : ids) {
            auto existing = find_for_update(conn, records_table, filter, origin);
            if (!existing) continue;

            QueryResult(conn.exec_params("DELETE FROM " + records_table + " WHERE id = $1", {existing->id}))
                .check("Failed to delete record " + existing->id);
            append_change_log(conn, change_logs, *existing, ChangeOperation::Delete, now);
            ++deleted;
        }
    });
    return deleted;
}

std::vector<Record> PgRecordStore::scan_records(const RecordScan& scan) const {
    ScopedConnection conn(pool_.get());
    QueryResult result(conn->exec_params(
        std::string("SELECT ") + RECORD_COLUMNS + " FROM " + table("records") +
        " WHERE record_type = ANY($1::smallint[])"
        " AND (cardinality($2::text[]) = 0 OR data_origin = ANY($2::text[]))"
        " AND start_time < $3::bigint AND end_time >= $4::bigint"
        " ORDER BY row_id",
        {to_pg_type_array(scan.types), to_pg_text_array(scan.origins),
         millis_param(scan.end), millis_param(scan.start)}));
    result.check("Failed to scan records");
    return records_from_result(result);
}

std::vector<Record> PgRecordStore::get_records(const std::vector<RecordId>& ids) const {
    if (ids.empty()) return {};
    ScopedConnection conn(pool_.get());
    QueryResult result(conn->exec_params(
        std::string("SELECT ") + RECORD_COLUMNS + " FROM " + table("records") +
        " WHERE id = ANY($1::text[])",
        {to_pg_text_array(ids)}));
    result.check("Failed to read records");
    return records_from_result(result);
}

std::vector<ChangeLogEntry> PgRecordStore::read_change_logs(const ChangeLogScan& scan) const {
    ScopedConnection conn(pool_.get());
    QueryResult result(conn->exec_params(
        "SELECT sequence_id, record_id, record_type, data_origin, operation, commit_time FROM " +
        table("change_logs") +
        " WHERE sequence_id > $1::bigint AND record_type = ANY($2::smallint[])"
        " AND (cardinality($3::text[]) = 0 OR data_origin = ANY($3::text[]))"
        " ORDER BY sequence_id LIMIT $4::integer",
        {std::to_string(scan.after_sequence_id), to_pg_type_array(scan.types),
         to_pg_text_array(scan.origins), std::to_string(scan.limit)}));
    result.check("Failed to read change logs");

    std::vector<ChangeLogEntry> entries;
    entries.reserve(static_cast<size_t>(result.num_rows()));
    for (int row = 0; row < result.num_rows(); ++row) {
        ChangeLogEntry entry;
        entry.sequence_id = std::stoll(result.get_value(row, 0));
        entry.record_id = result.get_value(row, 1);
        entry.record_type = parse_record_type(result.get_value(row, 2));
        entry.data_origin = result.get_value(row, 3);
        int op = std::stoi(result.get_value(row, 4));
        if (op < 1 || op > 3) {
            throw std::runtime_error("Unknown change log operation in store: " + std::to_string(op));
        }
        entry.operation = static_cast<ChangeOperation>(op);
        entry.commit_time = instant_from_millis(std::stoll(result.get_value(row, 5)));
        entries.push_back(std::move(entry));
    }
    return entries;
}

int64_t PgRecordStore::latest_sequence_id() const {
    ScopedConnection conn(pool_.get());
    QueryResult result(conn->exec("SELECT COALESCE(MAX(sequence_id), 0) FROM " + table("change_logs")));
    result.check("Failed to read latest sequence id");
    return std::stoll(result.get_value(0, 0));
}

int PgRecordStore::purge_change_logs_before(Instant cutoff) {
    ScopedConnection conn(pool_.get());
    QueryResult result(conn->exec_params(
        "DELETE FROM " + table("change_logs") + " WHERE commit_time < $1::bigint",
        {millis_param(cutoff)}));
    result.check("Failed to purge change logs");
    return result.affected_rows();
}

} // namespace chronicle
