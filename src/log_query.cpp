#include "log_query.hpp"
#include <algorithm>
#include <charconv>
#include <chrono>
#include <initializer_list>
#include <thread>

namespace logwindow {

namespace {

nlohmann::json entries_to_json(const std::vector<CachedEntry>& entries) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& entry : entries) {
        array.push_back(entry.to_json());
    }
    return array;
}

std::vector<std::string> values_of(const QueryParams& params,
                                   std::initializer_list<const char*> keys) {
    std::vector<std::string> values;
    for (const char* key : keys) {
        auto range = params.equal_range(key);
        for (auto it = range.first; it != range.second; ++it) {
            values.push_back(it->second);
        }
    }
    return values;
}

int64_t parse_int(const std::string& key, const std::string& text) {
    int64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        throw InvalidRequest("Parameter '" + key + "' is not an integer: '" + text + "'");
    }
    return value;
}

void validate_category(const std::string& category) {
    bool bad = category.empty() || category.front() == '.' || category.back() == '.' ||
               category.find("..") != std::string::npos ||
               category.find_first_of(" \t\r\n") != std::string::npos;
    if (bad) {
        throw InvalidRequest("Invalid category filter: '" + category + "'");
    }
}

bool category_matches(const std::string& category, const std::set<std::string>& wanted) {
    for (const auto& prefix : wanted) {
        if (category.size() < prefix.size()) continue;
        if (category.compare(0, prefix.size(), prefix) != 0) continue;
        if (category.size() == prefix.size() || category[prefix.size()] == '.') {
            return true;
        }
    }
    return false;
}

} // namespace

nlohmann::json LogPage::to_json() const {
    return {
        {"logs", entries_to_json(logs)},
        {"total", total},
        {"start", start},
        {"limit", limit},
        {"hasMore", has_more}
    };
}

nlohmann::json LogStats::to_json() const {
    return {
        {"totalEntries", total_entries},
        {"levelCounts", level_counts},
        {"categoryCounts", category_counts}
    };
}

const std::set<std::string>& known_levels() {
    static const std::set<std::string> levels = {
        "NOTSET", "DEBUG", "INFO", "WARN", "WARNING", "ERROR", "CRITICAL", "FATAL", kUnknownLevel
    };
    return levels;
}

LogFilter parse_filter(const QueryParams& params) {
    LogFilter filter;

    for (const auto& level : values_of(params, {"level[]", "level"})) {
        if (known_levels().count(level) == 0) {
            throw InvalidRequest("Unknown level filter: '" + level + "'");
        }
        filter.levels.insert(level);
    }

    for (const auto& category : values_of(params, {"module[]", "module", "category[]", "category"})) {
        validate_category(category);
        filter.categories.insert(category);
    }

    return filter;
}

std::optional<EntryId> parse_optional_id(const QueryParams& params, const std::string& key) {
    auto it = params.find(key);
    if (it == params.end()) return std::nullopt;
    return parse_int(key, it->second);
}

size_t parse_count(const QueryParams& params, const std::string& key, size_t default_value) {
    auto it = params.find(key);
    if (it == params.end()) return default_value;

    int64_t value = parse_int(key, it->second);
    if (value <= 0) {
        throw InvalidRequest("Parameter '" + key + "' must be positive, got " + it->second);
    }
    return static_cast<size_t>(value);
}

LogsRequest parse_logs_request(const QueryParams& params) {
    LogsRequest request;
    request.start_id = parse_optional_id(params, "start_log_id");
    request.count = parse_count(params, "limit", request.count);
    request.filter = parse_filter(params);
    return request;
}

std::string StreamEvent::to_sse() const {
    if (kind == Kind::Heartbeat) {
        return ": heartbeat\n\n";
    }
    std::string payload = entries_to_json(records).dump(-1, ' ', false,
                                                        nlohmann::json::error_handler_t::replace);
    return "data: " + payload + "\n\n";
}

LogStream::LogStream(const EntryCache& cache, ReadCursor cursor, StreamConfig config)
    : cache_(cache)
    , cursor_(cursor)
    , config_(config)
{
}

std::vector<CachedEntry> LogStream::poll() {
    if (!cursor_.pending(cache_).has_updates) return {};
    return cursor_.read(cache_, config_.batch_limit);
}

void LogStream::run(const Emit& emit, const Cancelled& cancelled) {
    auto last_emit = std::chrono::steady_clock::now();

    while (!(cancelled && cancelled())) {
        auto batch = poll();
        auto now = std::chrono::steady_clock::now();

        if (!batch.empty()) {
            StreamEvent event;
            event.kind = StreamEvent::Kind::Records;
            event.records = std::move(batch);
            if (!emit(event)) return;
            last_emit = now;
        } else if (now - last_emit >= config_.heartbeat_interval) {
            if (!emit(StreamEvent{})) return;
            last_emit = now;
        }

        std::this_thread::sleep_for(config_.check_interval);
    }
}

LogQuery::LogQuery(const EntryCache& cache, StreamConfig stream_config)
    : cache_(cache)
    , stream_config_(stream_config)
{
}

RecordPredicate LogQuery::make_predicate(const LogFilter& filter) const {
    if (filter.empty()) return nullptr;

    const RecordSchema& schema = cache_.schema();
    return [filter, schema](const LogRecord& record) {
        if (!filter.levels.empty() && filter.levels.count(record.level(schema)) == 0) {
            return false;
        }
        if (!filter.categories.empty()) {
            auto category = record.category(schema);
            if (!category || !category_matches(*category, filter.categories)) {
                return false;
            }
        }
        return true;
    };
}

LogPage LogQuery::get_logs(const LogsRequest& request) const {
    auto predicate = make_predicate(request.filter);

    LogPage page;
    page.limit = request.count;

    std::optional<EntryId> start;
    if (request.start_id) {
        start = std::max<EntryId>(0, *request.start_id);
    }

    CachePage window = cache_.page(start, request.count, predicate);
    page.logs = std::move(window.entries);
    page.total = window.matching;

    if (start) {
        page.start = *start;
    } else {
        page.start = page.logs.empty() ? window.newest_id + 1 : page.logs.front().id;
    }

    page.has_more = !page.logs.empty() && window.max_resident_id &&
                    page.logs.back().id < *window.max_resident_id;
    return page;
}

HierarchyMap LogQuery::module_hierarchy() const {
    return cache_.hierarchy_snapshot();
}

LogStats LogQuery::stats(const LogFilter& filter) const {
    auto predicate = make_predicate(filter);
    const RecordSchema& schema = cache_.schema();

    LogStats stats;
    cache_.scan([&](const CachedEntry& entry) {
        if (predicate && !predicate(entry.record)) return;
        ++stats.total_entries;
        ++stats.level_counts[entry.record.level(schema)];
        if (auto category = entry.record.category(schema)) {
            ++stats.category_counts[*category];
        }
    });
    return stats;
}

ChangeSummary LogQuery::changes_since(EntryId last_known_id) const {
    return cache_.changes_since(last_known_id);
}

EntryId LogQuery::newest_id() const {
    return cache_.newest_id();
}

LogStream LogQuery::open_stream(std::optional<EntryId> last_known_id) const {
    EntryId start = 0;
    if (last_known_id && *last_known_id >= 0) {
        start = *last_known_id;
    } else {
        start = cache_.newest_id() - static_cast<EntryId>(stream_config_.batch_limit);
    }
    return LogStream(cache_, ReadCursor::open_at(cache_, start), stream_config_);
}

} // namespace logwindow
