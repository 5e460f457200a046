/**
 * PostgreSQL Record Store Test
 *
 * This test validates that:
 * 1. The connection string carries the configured settings
 * 2. The connection pool keeps its size under concurrent use
 * 3. PgRecordStore honours the RecordStore contract
 * 4. The change log engine pages over the PostgreSQL change log
 *
 * Everything except test 1 is skipped unless PG_HOST is set. Tests run in
 * a throwaway schema, chronicle_test.
 */

#include "../include/chronicle/change_log_engine.hpp"
#include "../include/chronicle/database.hpp"
#include "../include/chronicle/pg_record_store.hpp"
#include "test_support.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <thread>

using namespace chronicle;
using namespace chronicle::testing;

namespace {

const char* kTestSchema = "chronicle_test";
const DataOrigin kApp = "com.example.fitness";
const DataOrigin kOtherApp = "com.example.watch";
const Instant kStart = at(2024, 3, 1, 8, 0);

bool pg_configured() {
    if (!std::getenv("PG_HOST")) {
        std::cout << "⚠️  Skipping test - PostgreSQL not configured (set PG_HOST env var)" << std::endl;
        return false;
    }
    return true;
}

DatabaseConfig test_config(int pool_size) {
    DatabaseConfig config = DatabaseConfig::from_env();
    config.schema = kTestSchema;
    config.pool_size = pool_size;
    config.pool_acquisition_timeout = 5000;
    return config;
}

std::shared_ptr<PgRecordStore> fresh_store(const std::shared_ptr<DatabasePool>& pool, TestClock& clock) {
    {
        ScopedConnection conn(pool.get());
        QueryResult dropped(conn->exec(std::string("DROP SCHEMA IF EXISTS ") + kTestSchema + " CASCADE"));
        dropped.check("drop test schema");
    }
    auto store = std::make_shared<PgRecordStore>(pool, kTestSchema, clock.clock());
    store->initialize_schema();
    return store;
}

} // namespace

// Test 1: Verify connection string contents
bool test_connection_string() {
    std::cout << "\n=== Test 1: Connection String ===" << std::endl;

    DatabaseConfig config;
    config.host = "localhost";
    config.port = "5433";
    config.database = "testdb";
    config.user = "testuser";
    config.password = "testpass";
    config.connection_timeout = 2000;
    config.use_ssl = false;

    std::string conn_str = config.connection_string();

    TEST_ASSERT(conn_str.find("host=localhost") != std::string::npos, "Connection string contains host");
    TEST_ASSERT(conn_str.find("port=5433") != std::string::npos, "Connection string contains port");
    TEST_ASSERT(conn_str.find("dbname=testdb") != std::string::npos, "Connection string contains dbname");
    TEST_ASSERT(conn_str.find("connect_timeout=2") != std::string::npos, "Connection string contains connect_timeout");
    TEST_ASSERT(conn_str.find("sslmode=disable") != std::string::npos, "Connection string contains sslmode");

    auto bad_schema = thrown_message<InvalidArgumentError>([] {
        PgRecordStore store(nullptr, "public; DROP TABLE x", now_instant);
    });
    TEST_ASSERT(starts_with(bad_schema, "Invalid schema name"), "Schema names outside [a-z0-9_] rejected");
    return true;
}

// Test 2: Concurrent access to pool
bool test_concurrent_pool_access() {
    std::cout << "\n=== Test 2: Concurrent Pool Access ===" << std::endl;
    if (!pg_configured()) return true;

    try {
        auto pool = std::make_shared<DatabasePool>(test_config(5));
        TEST_ASSERT(pool->size() == 5 && pool->available() == 5, "Pool initialized with all connections available");

        std::atomic<int> success_count{0};
        std::atomic<int> error_count{0};
        const int num_threads = 10;
        const int ops_per_thread = 10;

        std::vector<std::thread> threads;
        for (int t = 0; t < num_threads; t++) {
            threads.emplace_back([pool, &success_count, &error_count, ops_per_thread]() {
                for (int i = 0; i < ops_per_thread; i++) {
                    try {
                        ScopedConnection conn(pool.get());
                        QueryResult result(conn->exec("SELECT 1"));
                        if (result.is_success()) {
                            success_count++;
                        }
                    } catch (const std::exception& e) {
                        error_count++;
                        spdlog::error("Thread error: {}", e.what());
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        TEST_ASSERT(error_count == 0, "No errors during concurrent access");
        TEST_ASSERT(success_count == num_threads * ops_per_thread, "All operations succeeded");
        TEST_ASSERT(pool->available() == 5, "All connections returned to pool");
    } catch (const std::exception& e) {
        std::cerr << "❌ Exception: " << e.what() << std::endl;
        return false;
    }
    return true;
}

// Test 3: Store contract
bool test_store_round_trip() {
    std::cout << "\n=== Test 3: Store Round Trip ===" << std::endl;
    if (!pg_configured()) return true;

    try {
        TestClock clock(at(2024, 6, 1));
        auto pool = std::make_shared<DatabasePool>(test_config(2));
        auto store = fresh_store(pool, clock);

        TEST_ASSERT(store->latest_sequence_id() == 0, "Fresh schema starts at sequence 0");

        Record steps = steps_record(kApp, kStart, kStart + hours(1), 100, ZoneOffset::of_hours(2));
        steps.client_record_id = "walk-1";
        steps.client_record_version = 1;
        auto stored = store->insert_records({steps,
                                             heart_rate_record(kOtherApp, kStart, kStart + minutes(10),
                                                               {{kStart, 61}, {kStart + minutes(5), 72}}),
                                             weight_record(kApp, kStart + hours(2), 71.5)});
        TEST_ASSERT(stored.size() == 3 && !stored[0].id.empty(), "Ids assigned");

        auto fetched = store->get_records({stored[0].id, stored[1].id, stored[2].id, "missing"});
        TEST_ASSERT(fetched.size() == 3, "All inserted records fetched");
        for (const auto& record : fetched) {
            bool matches = false;
            for (const auto& original : stored) {
                matches |= record.id == original.id && record.same_content(original);
            }
            TEST_ASSERT(matches, "Fetched record equals stored " + std::string(record_type_name(record.type())));
        }

        Record newer = steps;
        newer.client_record_version = 2;
        newer.data = StepsData{150};
        store->insert_records({newer});
        auto updated = store->get_records({stored[0].id});
        TEST_ASSERT(std::get<StepsData>(updated.front().data).count == 150, "Client record id upsert updated in place");

        Record stale = steps;
        stale.data = StepsData{1};
        store->insert_records({stale});
        TEST_ASSERT(std::get<StepsData>(store->get_records({stored[0].id}).front().data).count == 150,
                    "Stale version dropped");

        RecordScan scan;
        scan.types = {RecordType::STEPS, RecordType::WEIGHT};
        scan.start = kStart + hours(1);
        scan.end = kStart + hours(2);
        auto in_window = store->scan_records(scan);
        TEST_ASSERT(in_window.size() == 1 && in_window[0].type() == RecordType::STEPS,
                    "Scan bounds match the in-memory store");

        Record missing = steps_record(kApp, kStart, kStart + hours(1), 1);
        missing.id = "00000000-0000-7000-8000-000000000000";
        auto not_found = thrown_message<InvalidArgumentError>([&] { store->update_records({missing}); });
        TEST_ASSERT(starts_with(not_found, "Record not found"), "Update of an unknown id rejected");

        TEST_ASSERT(store->delete_records({RecordIdFilter::from_id(RecordType::WEIGHT, stored[2].id)}, kOtherApp) == 0,
                    "Another origin cannot delete the record");
        TEST_ASSERT(store->delete_records({RecordIdFilter::from_client_record_id(RecordType::STEPS, "walk-1")},
                                          kApp) == 1,
                    "Delete by client record id");

        ChangeLogScan log_scan;
        log_scan.types = {RecordType::STEPS, RecordType::HEART_RATE, RecordType::WEIGHT};
        auto entries = store->read_change_logs(log_scan);
        TEST_ASSERT(entries.size() == 5, "Three inserts, one update and one delete logged");
        TEST_ASSERT(entries.back().operation == ChangeOperation::Delete, "Delete logged last");
        TEST_ASSERT(store->latest_sequence_id() == entries.back().sequence_id, "Latest sequence id matches");

        clock.advance(days(1));
        TEST_ASSERT(store->purge_change_logs_before(clock.now()) == 5, "Purge removes old entries");
        TEST_ASSERT(store->read_change_logs(log_scan).empty(), "Change log empty after purge");
    } catch (const std::exception& e) {
        std::cerr << "❌ Exception: " << e.what() << std::endl;
        return false;
    }
    return true;
}

// Test 4: Change log engine over PostgreSQL
bool test_change_logs_over_pg() {
    std::cout << "\n=== Test 4: Change Logs Over PostgreSQL ===" << std::endl;
    if (!pg_configured()) return true;

    try {
        TestClock clock(at(2024, 6, 1));
        auto pool = std::make_shared<DatabasePool>(test_config(2));
        auto store = fresh_store(pool, clock);
        ChangeLogEngine engine(*store);
        AccessContext access = AccessContext::unrestricted(kApp);

        std::string token = engine.get_change_log_token({{RecordType::STEPS}, {}}, access);
        Record gone = store->insert_records({steps_record(kApp, kStart, kStart + hours(1), 1)}).front();
        store->insert_records({steps_record(kApp, kStart, kStart + hours(1), 2)});
        store->delete_records({RecordIdFilter::from_id(RecordType::STEPS, gone.id)}, kApp);

        auto page1 = engine.get_change_logs({token, 2}, access);
        TEST_ASSERT(page1.upserts.size() == 1 && page1.has_more_pages, "First page holds the surviving insert");

        auto page2 = engine.get_change_logs({page1.next_token, 2}, access);
        TEST_ASSERT(page2.deletes.empty(), "Delete of the never-delivered record collapsed");
        TEST_ASSERT(!page2.has_more_pages, "Feed drained");

        Record shown = store->get_records({page1.upserts[0].id}).front();
        store->delete_records({RecordIdFilter::from_id(RecordType::STEPS, shown.id)}, kApp);
        auto page3 = engine.get_change_logs({page2.next_token, 2}, access);
        TEST_ASSERT(page3.deletes.size() == 1 && page3.deletes[0].record_id == shown.id,
                    "Delete of a delivered record reported");
    } catch (const std::exception& e) {
        std::cerr << "❌ Exception: " << e.what() << std::endl;
        return false;
    }
    return true;
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "=== PostgreSQL Record Store Tests ===" << std::endl;

    bool all_passed = true;
    all_passed &= test_connection_string();
    all_passed &= test_concurrent_pool_access();
    all_passed &= test_store_round_trip();
    all_passed &= test_change_logs_over_pg();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}
