#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <variant>
#include <nlohmann/json.hpp>

namespace logwindow {

using EntryId = int64_t;

// Sentinel for "no id assigned yet"
constexpr EntryId kNoEntry = -1;

// Field names consulted when classifying a structured record.
// Defaults match the JSON output of Python logging formatters.
struct RecordSchema {
    std::string level_field = "levelname";
    std::string module_field = "module";
    std::string name_field = "name";
};

constexpr const char* kUnknownLevel = "UNKNOWN";

class LogRecord {
public:
    // A line that decoded to a JSON object
    struct Structured {
        nlohmann::json fields;
    };

    // A line kept verbatim because it did not decode
    struct Raw {
        std::string text;
        double ingested_at = 0.0;
    };

    LogRecord() : value_(Raw{}) {}

    static LogRecord structured(nlohmann::json fields);
    static LogRecord raw(std::string text, double ingested_at);

    bool is_structured() const { return std::holds_alternative<Structured>(value_); }
    bool is_raw() const { return std::holds_alternative<Raw>(value_); }

    const Structured* as_structured() const { return std::get_if<Structured>(&value_); }
    const Raw* as_raw() const { return std::get_if<Raw>(&value_); }

    // Field lookup common to both shapes. Raw records expose "raw" and
    // "ingested_at". Returns null json when the field is absent.
    nlohmann::json field(const std::string& name) const;

    // String value of a field, empty when absent or not a string
    std::string string_field(const std::string& name) const;

    std::string level(const RecordSchema& schema) const;

    // Dotted category path ("module.name"), if the record carries one
    std::optional<std::string> category(const RecordSchema& schema) const;

    nlohmann::json to_json() const;

private:
    std::variant<Structured, Raw> value_;
};

// A record as resident in the cache
struct CachedEntry {
    EntryId id = kNoEntry;
    LogRecord record;

    nlohmann::json to_json() const {
        nlohmann::json j = record.to_json();
        j["_id"] = id;
        return j;
    }
};

} // namespace logwindow
