#pragma once

#include "log_record.hpp"
#include "module_hierarchy.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace logwindow {

// Optional record filter. Runs with the cache lock held, so it must not
// call back into the cache.
using RecordPredicate = std::function<bool(const LogRecord&)>;

struct ChangeSummary {
    bool has_updates = false;
    int64_t new_count = 0;
    EntryId min_id = 0;                      // 0 when the cache is empty
    EntryId max_id = 0;

    nlohmann::json to_json() const {
        return {
            {"has_updates", has_updates},
            {"new_count", new_count},
            {"min_id", min_id},
            {"max_id", max_id}
        };
    }
};

// What a cursor sees on one read: either new entries, or notice that the
// cache was reset under it.
struct CursorBatch {
    bool generation_changed = false;
    uint64_t generation = 0;
    EntryId newest_id = kNoEntry;
    std::vector<CachedEntry> entries;
};

// One paginated read taken under a single lock, so the entries, the match
// count and the window bounds all describe the same state of the cache.
struct CachePage {
    std::vector<CachedEntry> entries;
    size_t matching = 0;                     // resident entries satisfying the predicate
    std::optional<EntryId> max_resident_id;  // nullopt when the cache is empty
    EntryId newest_id = kNoEntry;
};

// Bounded window of the most recent records, keyed by a monotonically
// increasing id. Ids are never reused: numbering continues across evictions
// and resets. All public members are thread-safe.
class EntryCache {
public:
    // capacity 0 keeps every record
    explicit EntryCache(size_t capacity, RecordSchema schema = {});

    // Non-copyable
    EntryCache(const EntryCache&) = delete;
    EntryCache& operator=(const EntryCache&) = delete;

    // Assigns the next id, evicting the oldest entry when full
    EntryId admit(LogRecord record);

    // Admits a batch under one lock acquisition. Returns the last id
    // assigned, or kNoEntry for an empty batch.
    EntryId admit_batch(std::vector<LogRecord> records);

    // Drops every entry and the hierarchy and starts a new generation.
    // Returns the new generation.
    uint64_t reset();

    // reset() followed by admit_batch(), atomically for readers
    uint64_t reload(std::vector<LogRecord> records);

    // Up to max_count entries with id >= start_id that satisfy predicate,
    // ascending. A start_id below the window starts at the oldest resident.
    std::vector<CachedEntry> get(EntryId start_id, size_t max_count,
                                 const RecordPredicate& predicate = nullptr) const;

    // The newest max_count entries that satisfy predicate, ascending
    std::vector<CachedEntry> latest(size_t max_count,
                                    const RecordPredicate& predicate = nullptr) const;

    size_t count(const RecordPredicate& predicate = nullptr) const;

    // get() from start_id, or latest() when start_id is nullopt, together
    // with count() and the window bounds
    CachePage page(std::optional<EntryId> start_id, size_t max_count,
                   const RecordPredicate& predicate = nullptr) const;

    ChangeSummary changes_since(EntryId last_known_id) const;

    // Entries after `position` if `generation` is still current
    CursorBatch read_after(EntryId position, uint64_t generation, size_t max_count) const;

    // Copy of the hierarchy; later admissions do not affect it
    HierarchyMap hierarchy_snapshot() const;

    // Visits every resident entry in id order with the lock held
    void scan(const std::function<void(const CachedEntry&)>& visitor) const;

    uint64_t generation() const;

    // Newest id and generation, read together
    std::pair<EntryId, uint64_t> tail_state() const;

    // Last id ever assigned, resident or not. kNoEntry before the first admission.
    EntryId newest_id() const;

    // [min_id, max_id] of the resident window
    std::optional<std::pair<EntryId, EntryId>> resident_range() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    const RecordSchema& schema() const { return schema_; }

private:
    void admit_locked(LogRecord record);
    void clear_locked();

    std::vector<CachedEntry> get_locked(EntryId start_id, size_t max_count,
                                        const RecordPredicate& predicate) const;
    std::vector<CachedEntry> latest_locked(size_t max_count,
                                           const RecordPredicate& predicate) const;
    size_t count_locked(const RecordPredicate& predicate) const;

    // Position in entries_ of the first entry with id >= start_id
    size_t lower_index_locked(EntryId start_id) const;

    mutable std::mutex mutex_;
    const size_t capacity_;
    const RecordSchema schema_;
    std::deque<CachedEntry> entries_;
    EntryId next_id_ = 0;
    uint64_t generation_ = 0;
    ModuleHierarchy hierarchy_;
};

} // namespace logwindow
