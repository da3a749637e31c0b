#include "log_record.hpp"

namespace logwindow {

LogRecord LogRecord::structured(nlohmann::json fields) {
    LogRecord record;
    record.value_ = Structured{std::move(fields)};
    return record;
}

LogRecord LogRecord::raw(std::string text, double ingested_at) {
    LogRecord record;
    record.value_ = Raw{std::move(text), ingested_at};
    return record;
}

nlohmann::json LogRecord::field(const std::string& name) const {
    if (const auto* s = as_structured()) {
        auto it = s->fields.find(name);
        if (it == s->fields.end()) return nullptr;
        return *it;
    }

    const auto& r = std::get<Raw>(value_);
    if (name == "raw") return r.text;
    if (name == "ingested_at") return r.ingested_at;
    return nullptr;
}

std::string LogRecord::string_field(const std::string& name) const {
    if (const auto* s = as_structured()) {
        auto it = s->fields.find(name);
        if (it != s->fields.end() && it->is_string()) {
            return it->get<std::string>();
        }
        return "";
    }
    if (name == "raw") return std::get<Raw>(value_).text;
    return "";
}

std::string LogRecord::level(const RecordSchema& schema) const {
    std::string level = string_field(schema.level_field);
    if (level.empty() || is_raw()) return kUnknownLevel;
    return level;
}

std::optional<std::string> LogRecord::category(const RecordSchema& schema) const {
    if (!is_structured()) return std::nullopt;

    std::string module = string_field(schema.module_field);
    if (module.empty()) return std::nullopt;

    std::string name = string_field(schema.name_field);
    if (name.empty()) return module;
    return module + "." + name;
}

nlohmann::json LogRecord::to_json() const {
    if (const auto* s = as_structured()) {
        return s->fields;
    }
    const auto& r = std::get<Raw>(value_);
    return {
        {"raw", r.text},
        {"ingested_at", r.ingested_at}
    };
}

} // namespace logwindow
