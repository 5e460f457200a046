#pragma once

#include "chronicle/time_types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chronicle {

using RecordId = std::string;
using DataOrigin = std::string;   // package name of the writing application

// ============================================================================
// Record types
// The last three values are umbrella types covering several concrete types.
// They are accepted nowhere a concrete type is stored.
// ============================================================================

enum class RecordType : uint8_t {
    STEPS = 1,
    DISTANCE = 2,
    ACTIVE_CALORIES_BURNED = 3,
    HEART_RATE = 4,
    WEIGHT = 5,

    RECORD = 100,
    INTERVAL_RECORD = 101,
    INSTANT_RECORD = 102,
};

const char* record_type_name(RecordType type);
std::optional<RecordType> record_type_from_code(int code);
std::optional<RecordType> record_type_from_name(const std::string& name);

bool is_umbrella_type(RecordType type);
bool is_instant_type(RecordType type);

// Concrete types covered by `type` (itself when concrete)
std::vector<RecordType> concrete_types_of(RecordType type);
const std::vector<RecordType>& all_concrete_types();

// ============================================================================
// Payloads
// ============================================================================

struct StepsData {
    int64_t count = 0;
};

struct DistanceData {
    double meters = 0.0;
};

struct ActiveCaloriesBurnedData {
    double kilocalories = 0.0;
};

struct HeartRateSample {
    Instant time;
    int64_t beats_per_minute = 0;
};

struct HeartRateData {
    std::vector<HeartRateSample> samples;
};

struct WeightData {
    double kilograms = 0.0;
};

// Alternative order mirrors RecordType codes 1..5
using RecordData = std::variant<StepsData, DistanceData, ActiveCaloriesBurnedData, HeartRateData, WeightData>;

RecordType record_type_of(const RecordData& data);

// ============================================================================
// Record
// ============================================================================

struct Record {
    RecordId id;                                 // assigned by the store when empty
    std::optional<std::string> client_record_id;
    int64_t client_record_version = 0;
    DataOrigin data_origin;
    Instant start_time;
    Instant end_time;                            // == start_time for instant types
    ZoneOffset start_zone_offset;
    ZoneOffset end_zone_offset;
    Instant last_modified_time;                  // stamped by the store
    RecordData data;

    RecordType type() const { return record_type_of(data); }
    Millis duration() const { return end_time - start_time; }

    bool same_content(const Record& other) const;
};

// Throws InvalidArgumentError describing the first violated write-time rule
void validate_record(const Record& record);

// Identifies a record either by id or by (type, client record id)
struct RecordIdFilter {
    RecordType type = RecordType::STEPS;
    std::optional<RecordId> id;
    std::optional<std::string> client_record_id;

    static RecordIdFilter from_id(RecordType type, const RecordId& id) {
        RecordIdFilter f;
        f.type = type;
        f.id = id;
        return f;
    }

    static RecordIdFilter from_client_record_id(RecordType type, const std::string& client_id) {
        RecordIdFilter f;
        f.type = type;
        f.client_record_id = client_id;
        return f;
    }
};

// JSON (payload column, debug output)
nlohmann::json record_data_to_json(const RecordData& data);
RecordData record_data_from_json(RecordType type, const nlohmann::json& j);
nlohmann::json record_to_json(const Record& record);

} // namespace chronicle
