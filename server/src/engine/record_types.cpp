#include "chronicle/record_types.hpp"
#include "chronicle/errors.hpp"

namespace chronicle {

const char* record_type_name(RecordType type) {
    switch (type) {
        case RecordType::STEPS: return "StepsRecord";
        case RecordType::DISTANCE: return "DistanceRecord";
        case RecordType::ACTIVE_CALORIES_BURNED: return "ActiveCaloriesBurnedRecord";
        case RecordType::HEART_RATE: return "HeartRateRecord";
        case RecordType::WEIGHT: return "WeightRecord";
        case RecordType::RECORD: return "Record";
        case RecordType::INTERVAL_RECORD: return "IntervalRecord";
        case RecordType::INSTANT_RECORD: return "InstantRecord";
    }
    return "UnknownRecord";
}

std::optional<RecordType> record_type_from_code(int code) {
    switch (code) {
        case 1: return RecordType::STEPS;
        case 2: return RecordType::DISTANCE;
        case 3: return RecordType::ACTIVE_CALORIES_BURNED;
        case 4: return RecordType::HEART_RATE;
        case 5: return RecordType::WEIGHT;
        case 100: return RecordType::RECORD;
        case 101: return RecordType::INTERVAL_RECORD;
        case 102: return RecordType::INSTANT_RECORD;
        default: return std::nullopt;
    }
}

std::optional<RecordType> record_type_from_name(const std::string& name) {
    for (int code : {1, 2, 3, 4, 5, 100, 101, 102}) {
        auto type = record_type_from_code(code);
        if (type && name == record_type_name(*type)) return type;
    }
    return std::nullopt;
}

bool is_umbrella_type(RecordType type) {
    return type == RecordType::RECORD ||
           type == RecordType::INTERVAL_RECORD ||
           type == RecordType::INSTANT_RECORD;
}

bool is_instant_type(RecordType type) {
    return type == RecordType::WEIGHT;
}

const std::vector<RecordType>& all_concrete_types() {
    static const std::vector<RecordType> kTypes = {
        RecordType::STEPS,
        RecordType::DISTANCE,
        RecordType::ACTIVE_CALORIES_BURNED,
        RecordType::HEART_RATE,
        RecordType::WEIGHT,
    };
    return kTypes;
}

std::vector<RecordType> concrete_types_of(RecordType type) {
    if (!is_umbrella_type(type)) return {type};

    std::vector<RecordType> covered;
    for (RecordType concrete : all_concrete_types()) {
        bool instant = is_instant_type(concrete);
        if (type == RecordType::RECORD ||
            (type == RecordType::INSTANT_RECORD && instant) ||
            (type == RecordType::INTERVAL_RECORD && !instant)) {
            covered.push_back(concrete);
        }
    }
    return covered;
}

RecordType record_type_of(const RecordData& data) {
    switch (data.index()) {
        case 0: return RecordType::STEPS;
        case 1: return RecordType::DISTANCE;
        case 2: return RecordType::ACTIVE_CALORIES_BURNED;
        case 3: return RecordType::HEART_RATE;
        default: return RecordType::WEIGHT;
    }
}

bool Record::same_content(const Record& other) const {
    return record_data_to_json(data) == record_data_to_json(other.data) &&
           start_time == other.start_time &&
           end_time == other.end_time &&
           start_zone_offset == other.start_zone_offset &&
           end_zone_offset == other.end_zone_offset &&
           data_origin == other.data_origin &&
           client_record_id == other.client_record_id;
}

void validate_record(const Record& record) {
    if (record.data_origin.empty()) {
        throw InvalidArgumentError("Record data origin must be set");
    }
    if (record.client_record_id && record.client_record_id->empty()) {
        throw InvalidArgumentError("Client record id must not be empty");
    }
    if (record.end_time < record.start_time) {
        throw InvalidArgumentError("end time must not be before start time");
    }
    RecordType type = record.type();
    if (is_instant_type(type) && record.end_time != record.start_time) {
        throw InvalidArgumentError(std::string(record_type_name(type)) + " must have end time equal to start time");
    }
    // Offsets are range-checked again here since ZoneOffset is a plain struct
    for (const ZoneOffset& offset : {record.start_zone_offset, record.end_zone_offset}) {
        if (offset.total_seconds > ZoneOffset::kMaxSeconds || offset.total_seconds < -ZoneOffset::kMaxSeconds) {
            throw InvalidArgumentError("Zone offset not in valid range: -18:00 to +18:00");
        }
    }
    if (const auto* hr = std::get_if<HeartRateData>(&record.data)) {
        for (const auto& sample : hr->samples) {
            if (sample.time < record.start_time || sample.time > record.end_time) {
                throw InvalidArgumentError("Heart rate sample time must be within the record interval");
            }
            if (sample.beats_per_minute <= 0) {
                throw InvalidArgumentError("Heart rate must be positive");
            }
        }
    }
    if (const auto* steps = std::get_if<StepsData>(&record.data)) {
        if (steps->count < 0) {
            throw InvalidArgumentError("Steps count must not be negative");
        }
    }
}

// ============================================================================
// JSON
// ============================================================================

nlohmann::json record_data_to_json(const RecordData& data) {
    return std::visit([](const auto& payload) -> nlohmann::json {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, StepsData>) {
            return {{"count", payload.count}};
        } else if constexpr (std::is_same_v<T, DistanceData>) {
            return {{"meters", payload.meters}};
        } else if constexpr (std::is_same_v<T, ActiveCaloriesBurnedData>) {
            return {{"kilocalories", payload.kilocalories}};
        } else if constexpr (std::is_same_v<T, HeartRateData>) {
            nlohmann::json samples = nlohmann::json::array();
            for (const auto& s : payload.samples) {
                samples.push_back({{"time", to_epoch_millis(s.time)}, {"bpm", s.beats_per_minute}});
            }
            return {{"samples", samples}};
        } else {
            return {{"kilograms", payload.kilograms}};
        }
    }, data);
}

RecordData record_data_from_json(RecordType type, const nlohmann::json& j) {
    switch (type) {
        case RecordType::STEPS:
            return StepsData{j.at("count").get<int64_t>()};
        case RecordType::DISTANCE:
            return DistanceData{j.at("meters").get<double>()};
        case RecordType::ACTIVE_CALORIES_BURNED:
            return ActiveCaloriesBurnedData{j.at("kilocalories").get<double>()};
        case RecordType::HEART_RATE: {
            HeartRateData hr;
            for (const auto& s : j.at("samples")) {
                HeartRateSample sample;
                sample.time = instant_from_millis(s.at("time").get<int64_t>());
                sample.beats_per_minute = s.at("bpm").get<int64_t>();
                hr.samples.push_back(sample);
            }
            return hr;
        }
        case RecordType::WEIGHT:
            return WeightData{j.at("kilograms").get<double>()};
        default:
            throw InvalidArgumentError(std::string("No payload for umbrella type ") + record_type_name(type));
    }
}

nlohmann::json record_to_json(const Record& record) {
    nlohmann::json j = {
        {"id", record.id},
        {"recordType", record_type_name(record.type())},
        {"dataOrigin", record.data_origin},
        {"clientRecordVersion", record.client_record_version},
        {"startTime", format_instant(record.start_time)},
        {"endTime", format_instant(record.end_time)},
        {"startZoneOffset", record.start_zone_offset.to_string()},
        {"endZoneOffset", record.end_zone_offset.to_string()},
        {"lastModifiedTime", format_instant(record.last_modified_time)},
        {"data", record_data_to_json(record.data)}
    };
    if (record.client_record_id) {
        j["clientRecordId"] = *record.client_record_id;
    } else {
        j["clientRecordId"] = nullptr;
    }
    return j;
}

} // namespace chronicle
