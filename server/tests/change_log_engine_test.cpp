/**
 * Change Log Engine Tests
 *
 * Validates:
 * 1. Per-record coalescing of insert/update/delete within a page
 * 2. Token creation and page size errors
 * 3. Pagination over raw log entries
 * 4. Token and access filters
 * 5. Historical cutoff applied to upserts but never to deletes
 */

#include "../include/chronicle/change_log_engine.hpp"
#include "test_support.hpp"
#include <spdlog/spdlog.h>

using namespace chronicle;
using namespace chronicle::testing;

namespace {

const DataOrigin kApp = "com.example.fitness";
const DataOrigin kOtherApp = "com.example.watch";

struct Fixture {
    TestClock clock{at(2024, 6, 1)};
    InMemoryRecordStore store{clock.clock()};
    ChangeLogEngine engine{store};
    AccessContext access = AccessContext::unrestricted(kApp);

    std::string token(std::vector<RecordType> types, std::vector<DataOrigin> origins = {}) {
        return engine.get_change_log_token(ChangeLogTokenRequest{std::move(types), std::move(origins)}, access);
    }

    ChangeLogsResponse changes(const std::string& token, int page_size = ChangeLogEngine::kDefaultPageSize) {
        return engine.get_change_logs(ChangeLogsRequest{token, page_size}, access);
    }

    Record insert_steps(const DataOrigin& origin, int64_t count) {
        const Instant start = at(2024, 5, 30, 8, 0);
        return store.insert_records({steps_record(origin, start, start + hours(1), count)}).front();
    }

    void remove(const Record& record) {
        store.delete_records({RecordIdFilter::from_id(record.type(), record.id)}, record.data_origin);
    }
};

int64_t steps_of(const Record& record) {
    return std::get<StepsData>(record.data).count;
}

} // namespace

bool test_insert_then_delete_is_invisible() {
    std::cout << "\n=== Test 1: Insert Then Delete Is Invisible ===" << std::endl;

    Fixture f;
    std::string token = f.token({RecordType::STEPS});
    Record record = f.insert_steps(kApp, 100);
    f.remove(record);

    auto response = f.changes(token);
    TEST_ASSERT(response.upserts.empty(), "No upsert for a record that no longer exists");
    TEST_ASSERT(response.deletes.empty(), "No delete for a record the reader never saw");
    TEST_ASSERT(!response.has_more_pages, "Single page");
    TEST_ASSERT(response.next_token != token, "Token advances past the consumed entries");
    TEST_ASSERT(f.changes(response.next_token).deletes.empty(), "Nothing left after the advanced token");
    return true;
}

bool test_update_exposes_delete() {
    std::cout << "\n=== Test 2: Update Exposes Delete ===" << std::endl;

    Fixture f;
    std::string token = f.token({RecordType::STEPS});
    Record record = f.insert_steps(kApp, 100);
    Record updated = record;
    updated.data = StepsData{150};
    f.store.update_records({updated});
    f.remove(record);

    auto response = f.changes(token);
    TEST_ASSERT(response.upserts.empty(), "No upsert once the record is gone");
    TEST_ASSERT(response.deletes.size() == 1, "Insert, update, delete yields one delete");
    TEST_ASSERT(response.deletes[0].record_id == record.id, "Delete names the record");
    TEST_ASSERT(response.deletes[0].record_type == RecordType::STEPS, "Delete carries the record type");
    return true;
}

bool test_updates_fold_into_one_upsert() {
    std::cout << "\n=== Test 3: Updates Fold Into One Upsert ===" << std::endl;

    Fixture f;
    std::string token = f.token({RecordType::STEPS});
    Record record = f.insert_steps(kApp, 100);
    Record updated = record;
    updated.data = StepsData{150};
    f.store.update_records({updated});
    updated.data = StepsData{175};
    f.store.update_records({updated});

    auto response = f.changes(token);
    TEST_ASSERT(response.upserts.size() == 1, "Insert and two updates yield one upsert");
    TEST_ASSERT(steps_of(response.upserts[0]) == 175, "Upsert carries the latest snapshot");
    TEST_ASSERT(response.deletes.empty(), "No deletes");
    return true;
}

bool test_existing_record_deleted() {
    std::cout << "\n=== Test 4: Existing Record Deleted ===" << std::endl;

    Fixture f;
    Record record = f.insert_steps(kApp, 100);
    std::string token = f.token({RecordType::STEPS});
    f.remove(record);

    auto response = f.changes(token);
    TEST_ASSERT(response.deletes.size() == 1 && response.deletes[0].record_id == record.id,
                "Record present at the watermark is reported deleted");
    TEST_ASSERT(response.upserts.empty(), "No upserts");
    return true;
}

bool test_token_and_page_size_errors() {
    std::cout << "\n=== Test 5: Token And Page Size Errors ===" << std::endl;

    Fixture f;
    auto empty = thrown_message<InvalidArgumentError>([&] { f.token({}); });
    TEST_ASSERT(empty == "Requested record types must not be empty", "Empty type list rejected");

    auto umbrella = thrown_message<InvalidArgumentError>([&] {
        f.token({RecordType::STEPS, RecordType::RECORD, RecordType::INSTANT_RECORD});
    });
    TEST_ASSERT(umbrella == "Requested record types must not contain any of [Record, InstantRecord]",
                "Umbrella types rejected and listed");

    std::string token = f.token({RecordType::STEPS});
    auto too_big = thrown_message<InvalidArgumentError>([&] { f.changes(token, 5001); });
    TEST_ASSERT(too_big == "Maximum page size: 5000, requested: 5001", "Oversized page rejected");

    auto too_small = thrown_message<InvalidArgumentError>([&] { f.changes(token, 0); });
    TEST_ASSERT(too_small == "Minimum page size: 1, requested: 0", "Empty page rejected");

    auto garbage = thrown_message<InvalidTokenError>([&] { f.changes("not-a-token"); });
    TEST_ASSERT(starts_with(garbage, "Invalid token"), "Malformed token rejected");

    auto empty_token = thrown_message<InvalidTokenError>([&] { f.changes(""); });
    TEST_ASSERT(starts_with(empty_token, "Invalid token"), "Empty token rejected");

    TEST_ASSERT(f.changes(token, 5000).upserts.empty(), "Maximum page size accepted");
    return true;
}

bool test_pagination() {
    std::cout << "\n=== Test 6: Pagination ===" << std::endl;

    Fixture f;
    std::string token = f.token({RecordType::STEPS});
    for (int i = 1; i <= 5; ++i) {
        f.insert_steps(kApp, i * 10);
    }

    auto page1 = f.changes(token, 2);
    TEST_ASSERT(page1.upserts.size() == 2 && page1.has_more_pages, "First page has 2 upserts and more");
    TEST_ASSERT(steps_of(page1.upserts[0]) == 10 && steps_of(page1.upserts[1]) == 20,
                "Upserts in commit order");

    auto page2 = f.changes(page1.next_token, 2);
    TEST_ASSERT(page2.upserts.size() == 2 && page2.has_more_pages, "Second page has 2 upserts and more");

    auto page3 = f.changes(page2.next_token, 2);
    TEST_ASSERT(page3.upserts.size() == 1 && !page3.has_more_pages, "Last page has the remainder");
    TEST_ASSERT(steps_of(page3.upserts[0]) == 50, "Last page holds the newest record");

    auto exhausted = f.changes(page3.next_token, 2);
    TEST_ASSERT(exhausted.upserts.empty() && exhausted.deletes.empty(), "Exhausted token returns nothing");
    TEST_ASSERT(exhausted.next_token == page3.next_token, "Exhausted token is returned unchanged");
    TEST_ASSERT(!exhausted.has_more_pages, "No more pages");

    f.insert_steps(kApp, 60);
    auto resumed = f.changes(exhausted.next_token, 2);
    TEST_ASSERT(resumed.upserts.size() == 1 && steps_of(resumed.upserts[0]) == 60,
                "Exhausted token resumes with new changes");
    return true;
}

bool test_exact_page_boundary() {
    std::cout << "\n=== Test 7: Exact Page Boundary ===" << std::endl;

    Fixture f;
    std::string token = f.token({RecordType::STEPS});
    f.insert_steps(kApp, 1);
    f.insert_steps(kApp, 2);

    auto page = f.changes(token, 2);
    TEST_ASSERT(page.upserts.size() == 2, "Both entries fit");
    TEST_ASSERT(!page.has_more_pages, "Exactly page_size entries means no more pages");
    return true;
}

bool test_withheld_insert_collapses_across_pages() {
    std::cout << "\n=== Test 8: Withheld Insert Collapses Across Pages ===" << std::endl;

    Fixture f;
    std::string token = f.token({RecordType::STEPS});
    Record first = f.insert_steps(kApp, 1);
    f.insert_steps(kApp, 2);
    f.remove(first);

    auto page1 = f.changes(token, 1);
    TEST_ASSERT(page1.upserts.empty() && page1.has_more_pages, "Insert of a now-deleted record yields nothing");
    TEST_ASSERT(ChangeLogToken::decode(page1.next_token).withheld_record_ids == std::vector<RecordId>{first.id},
                "Next token remembers the skipped record");

    auto page2 = f.changes(page1.next_token, 1);
    TEST_ASSERT(page2.upserts.size() == 1 && steps_of(page2.upserts[0]) == 2, "Second record upserted");

    auto page3 = f.changes(page2.next_token, 1);
    TEST_ASSERT(page3.deletes.empty() && page3.upserts.empty(), "Delete of the skipped record not reported");
    TEST_ASSERT(!page3.has_more_pages, "Feed drained");
    TEST_ASSERT(ChangeLogToken::decode(page3.next_token).withheld_record_ids.empty(),
                "Drained token carries no skipped records");
    return true;
}

// Drains the feed and returns {upserts, deletes}
std::pair<size_t, size_t> drain(Fixture& f, std::string token, int page_size) {
    size_t upserts = 0;
    size_t deletes = 0;
    for (int i = 0; i < 100; ++i) {
        auto page = f.changes(token, page_size);
        upserts += page.upserts.size();
        deletes += page.deletes.size();
        token = page.next_token;
        if (!page.has_more_pages) break;
    }
    return {upserts, deletes};
}

bool test_coalescing_independent_of_page_size() {
    std::cout << "\n=== Test 9: Coalescing Independent Of Page Size ===" << std::endl;

    Fixture f;
    std::string token = f.token({RecordType::STEPS});
    Record gone = f.insert_steps(kApp, 1);
    f.remove(gone);

    TEST_ASSERT(drain(f, token, 1000) == std::make_pair(size_t{0}, size_t{0}), "Large page: nothing reported");
    TEST_ASSERT(drain(f, token, 1) == std::make_pair(size_t{0}, size_t{0}), "Single-entry pages: nothing reported");

    Fixture updated;
    std::string updated_token = updated.token({RecordType::STEPS});
    Record touched = updated.insert_steps(kApp, 1);
    Record changed = touched;
    changed.data = StepsData{5};
    updated.store.update_records({changed});
    updated.remove(touched);

    TEST_ASSERT(drain(updated, updated_token, 1000) == std::make_pair(size_t{0}, size_t{1}),
                "Large page: updated record reports its delete");
    TEST_ASSERT(drain(updated, updated_token, 1) == std::make_pair(size_t{0}, size_t{1}),
                "Single-entry pages: updated record reports its delete");
    return true;
}

bool test_delivered_upsert_reports_later_delete() {
    std::cout << "\n=== Test 10: Delivered Upsert Reports Later Delete ===" << std::endl;

    Fixture f;
    std::string token = f.token({RecordType::STEPS});
    Record first = f.insert_steps(kApp, 1);
    f.insert_steps(kApp, 2);

    auto page1 = f.changes(token, 1);
    TEST_ASSERT(page1.upserts.size() == 1 && page1.upserts[0].id == first.id, "Record delivered while present");
    TEST_ASSERT(ChangeLogToken::decode(page1.next_token).withheld_record_ids.empty(), "Nothing skipped");

    f.remove(first);
    auto page2 = f.changes(page1.next_token, 1);
    TEST_ASSERT(page2.upserts.size() == 1 && steps_of(page2.upserts[0]) == 2, "Second record upserted");

    auto page3 = f.changes(page2.next_token, 1);
    TEST_ASSERT(page3.deletes.size() == 1 && page3.deletes[0].record_id == first.id,
                "Delete of a delivered record reported");
    return true;
}

bool test_token_filters() {
    std::cout << "\n=== Test 11: Token Filters ===" << std::endl;

    Fixture f;
    std::string steps_token = f.token({RecordType::STEPS});
    std::string other_token = f.token({RecordType::STEPS}, {kOtherApp});

    const Instant start = at(2024, 5, 30, 8, 0);
    f.store.insert_records({distance_record(kApp, start, start + hours(1), 800.0)});
    f.insert_steps(kApp, 10);
    f.insert_steps(kOtherApp, 20);

    auto steps = f.changes(steps_token);
    TEST_ASSERT(steps.upserts.size() == 2, "Only subscribed types are returned");

    auto other = f.changes(other_token);
    TEST_ASSERT(other.upserts.size() == 1 && other.upserts[0].data_origin == kOtherApp,
                "Origin filter in the token restricts entries");

    auto decoded = ChangeLogToken::decode(other_token);
    TEST_ASSERT(decoded.data_origin_filters == std::vector<DataOrigin>{kOtherApp}, "Token carries the origin filter");
    TEST_ASSERT(decoded.watermark == 0, "Token taken on an empty store starts at 0");
    return true;
}

bool test_access_filters() {
    std::cout << "\n=== Test 12: Access Filters ===" << std::endl;

    Fixture f;
    std::string token = f.token({RecordType::STEPS, RecordType::DISTANCE});

    const Instant start = at(2024, 5, 30, 8, 0);
    f.store.insert_records({distance_record(kApp, start, start + hours(1), 800.0)});
    f.insert_steps(kApp, 10);
    f.insert_steps(kOtherApp, 20);

    AccessContext steps_only = AccessContext::unrestricted(kApp);
    steps_only.readable_types = {RecordType::STEPS};
    auto by_type = f.engine.get_change_logs(ChangeLogsRequest{token, 100}, steps_only);
    TEST_ASSERT(by_type.upserts.size() == 2, "Unreadable types are skipped");

    AccessContext own_only = AccessContext::unrestricted(kApp);
    own_only.read_all_origins = false;
    auto by_origin = f.engine.get_change_logs(ChangeLogsRequest{token, 100}, own_only);
    TEST_ASSERT(by_origin.upserts.size() == 2, "Own steps and distance only");
    for (const auto& record : by_origin.upserts) {
        TEST_ASSERT(record.data_origin == kApp, "Upsert written by the caller");
    }

    AccessContext nothing = AccessContext::unrestricted(kApp);
    nothing.readable_types = {RecordType::WEIGHT};
    auto none = f.engine.get_change_logs(ChangeLogsRequest{token, 100}, nothing);
    TEST_ASSERT(none.upserts.empty() && none.next_token == token, "No readable types leaves the token unchanged");
    return true;
}

bool test_historical_cutoff_hides_only_upserts() {
    std::cout << "\n=== Test 13: Historical Cutoff Hides Only Upserts ===" << std::endl;

    Fixture f;
    std::string token = f.token({RecordType::STEPS});
    Record old_record = f.insert_steps(kOtherApp, 10);

    f.access.has_historical_access = false;
    f.access.historical_boundary = f.clock.now() + days(1);

    auto page1 = f.changes(token);
    TEST_ASSERT(page1.upserts.empty(), "Upsert modified before the boundary is hidden");

    f.clock.advance(days(2));
    f.remove(old_record);
    Record recent = f.insert_steps(kOtherApp, 20);

    auto page2 = f.changes(page1.next_token);
    TEST_ASSERT(page2.deletes.size() == 1 && page2.deletes[0].record_id == old_record.id,
                "Delete of a hidden record is still reported");
    TEST_ASSERT(page2.upserts.size() == 1 && page2.upserts[0].id == recent.id,
                "Upsert modified after the boundary is visible");
    return true;
}

bool test_sequence_and_json() {
    std::cout << "\n=== Test 14: Sequence And JSON ===" << std::endl;

    Fixture f;
    TEST_ASSERT(f.store.latest_sequence_id() == 0, "Empty store has sequence 0");
    f.insert_steps(kApp, 10);
    std::string token = f.token({RecordType::STEPS});
    TEST_ASSERT(ChangeLogToken::decode(token).watermark == 1, "Token watermark is the latest sequence id");

    Record record = f.insert_steps(kApp, 20);
    f.remove(record);
    f.insert_steps(kApp, 30);

    auto response = f.changes(token);
    TEST_ASSERT(ChangeLogToken::decode(response.next_token).watermark == 4,
                "Next token watermark is the last consumed sequence id");

    auto j = response.to_json();
    TEST_ASSERT(j["upserts"].size() == 1, "JSON upserts");
    TEST_ASSERT(j["deletes"].is_array() && j["deletes"].empty(), "JSON deletes");
    TEST_ASSERT(j["hasMorePages"] == false, "JSON hasMorePages");
    TEST_ASSERT(j["nextChangesToken"] == response.next_token, "JSON next token");
    return true;
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "=== Change Log Engine Tests ===" << std::endl;

    bool all_passed = true;
    all_passed &= test_insert_then_delete_is_invisible();
    all_passed &= test_update_exposes_delete();
    all_passed &= test_updates_fold_into_one_upsert();
    all_passed &= test_existing_record_deleted();
    all_passed &= test_token_and_page_size_errors();
    all_passed &= test_pagination();
    all_passed &= test_exact_page_boundary();
    all_passed &= test_withheld_insert_collapses_across_pages();
    all_passed &= test_coalescing_independent_of_page_size();
    all_passed &= test_delivered_upsert_reports_later_delete();
    all_passed &= test_token_filters();
    all_passed &= test_access_filters();
    all_passed &= test_historical_cutoff_hides_only_upserts();
    all_passed &= test_sequence_and_json();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}
