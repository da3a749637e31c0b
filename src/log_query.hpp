#pragma once

#include "entry_cache.hpp"
#include "engine_config.hpp"
#include "read_cursor.hpp"
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace logwindow {

// Malformed caller input, rejected before it reaches the cache
class InvalidRequest : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Query-string style parameters; repeated keys allowed
using QueryParams = std::multimap<std::string, std::string>;

struct LogFilter {
    std::set<std::string> levels;        // empty matches every level
    std::set<std::string> categories;    // a category also matches its descendants

    bool empty() const { return levels.empty() && categories.empty(); }
};

struct LogsRequest {
    std::optional<EntryId> start_id;     // nullopt: the most recent `count`
    size_t count = 100;
    LogFilter filter;
};

struct LogPage {
    std::vector<CachedEntry> logs;
    size_t total = 0;                    // resident entries matching the filter
    EntryId start = 0;
    size_t limit = 0;
    bool has_more = false;

    nlohmann::json to_json() const;
};

struct LogStats {
    size_t total_entries = 0;
    std::map<std::string, size_t> level_counts;
    std::map<std::string, size_t> category_counts;

    nlohmann::json to_json() const;
};

// Level names accepted by filters
const std::set<std::string>& known_levels();

// Parsers for the request layer. Throw InvalidRequest.
LogFilter parse_filter(const QueryParams& params);
LogsRequest parse_logs_request(const QueryParams& params);
std::optional<EntryId> parse_optional_id(const QueryParams& params, const std::string& key);
size_t parse_count(const QueryParams& params, const std::string& key, size_t default_value);

struct StreamEvent {
    enum class Kind { Records, Heartbeat };

    Kind kind = Kind::Heartbeat;
    std::vector<CachedEntry> records;

    // Server-sent-events framing
    std::string to_sse() const;
};

// Incremental reader over the cache for one open connection. Not
// restartable; open a new stream to start over.
class LogStream {
public:
    using Emit = std::function<bool(const StreamEvent&)>;
    using Cancelled = std::function<bool()>;

    LogStream(const EntryCache& cache, ReadCursor cursor, StreamConfig config);

    // Next batch past the cursor, possibly empty. Never blocks.
    std::vector<CachedEntry> poll();

    // Checks for new records every check_interval and emits them, with a
    // heartbeat after heartbeat_interval of silence. Returns when emit
    // returns false or cancelled() returns true.
    void run(const Emit& emit, const Cancelled& cancelled = nullptr);

    const ReadCursor& cursor() const { return cursor_; }

private:
    const EntryCache& cache_;
    ReadCursor cursor_;
    StreamConfig config_;
};

// Read-only surface over the cache for the request layer
class LogQuery {
public:
    explicit LogQuery(const EntryCache& cache, StreamConfig stream_config = {});

    LogPage get_logs(const LogsRequest& request) const;
    HierarchyMap module_hierarchy() const;
    LogStats stats(const LogFilter& filter) const;
    ChangeSummary changes_since(EntryId last_known_id) const;
    EntryId newest_id() const;

    // nullopt or a negative id starts batch_limit records before the newest
    LogStream open_stream(std::optional<EntryId> last_known_id) const;

    // nullptr when the filter is empty
    RecordPredicate make_predicate(const LogFilter& filter) const;

private:
    const EntryCache& cache_;
    StreamConfig stream_config_;
};

} // namespace logwindow
