#include "entry_cache.hpp"
#include <algorithm>

namespace logwindow {

EntryCache::EntryCache(size_t capacity, RecordSchema schema)
    : capacity_(capacity)
    , schema_(std::move(schema))
{
}

void EntryCache::admit_locked(LogRecord record) {
    if (auto path = record.category(schema_)) {
        hierarchy_.observe(*path);
    }

    entries_.push_back(CachedEntry{next_id_++, std::move(record)});

    if (capacity_ > 0 && entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

void EntryCache::clear_locked() {
    entries_.clear();
    hierarchy_.clear();
    ++generation_;
}

EntryId EntryCache::admit(LogRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    admit_locked(std::move(record));
    return next_id_ - 1;
}

EntryId EntryCache::admit_batch(std::vector<LogRecord> records) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records.empty()) return kNoEntry;

    for (auto& record : records) {
        admit_locked(std::move(record));
    }
    return next_id_ - 1;
}

uint64_t EntryCache::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    clear_locked();
    return generation_;
}

uint64_t EntryCache::reload(std::vector<LogRecord> records) {
    std::lock_guard<std::mutex> lock(mutex_);
    clear_locked();
    for (auto& record : records) {
        admit_locked(std::move(record));
    }
    return generation_;
}

size_t EntryCache::lower_index_locked(EntryId start_id) const {
    // Resident ids are contiguous: entries_[i].id == front().id + i
    EntryId min_id = entries_.front().id;
    if (start_id <= min_id) return 0;
    return static_cast<size_t>(start_id - min_id);
}

std::vector<CachedEntry> EntryCache::get_locked(EntryId start_id, size_t max_count,
                                                const RecordPredicate& predicate) const {
    std::vector<CachedEntry> result;
    if (entries_.empty() || max_count == 0) return result;
    if (start_id > entries_.back().id) return result;

    for (size_t i = lower_index_locked(start_id); i < entries_.size(); ++i) {
        const auto& entry = entries_[i];
        if (predicate && !predicate(entry.record)) continue;
        result.push_back(entry);
        if (result.size() >= max_count) break;
    }
    return result;
}

std::vector<CachedEntry> EntryCache::latest_locked(size_t max_count,
                                                   const RecordPredicate& predicate) const {
    std::vector<CachedEntry> result;
    if (max_count == 0) return result;

    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (predicate && !predicate(it->record)) continue;
        result.push_back(*it);
        if (result.size() >= max_count) break;
    }
    std::reverse(result.begin(), result.end());
    return result;
}

size_t EntryCache::count_locked(const RecordPredicate& predicate) const {
    if (!predicate) return entries_.size();

    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [&predicate](const CachedEntry& entry) { return predicate(entry.record); }));
}

std::vector<CachedEntry> EntryCache::get(EntryId start_id, size_t max_count,
                                         const RecordPredicate& predicate) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_locked(start_id, max_count, predicate);
}

std::vector<CachedEntry> EntryCache::latest(size_t max_count,
                                            const RecordPredicate& predicate) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_locked(max_count, predicate);
}

size_t EntryCache::count(const RecordPredicate& predicate) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_locked(predicate);
}

CachePage EntryCache::page(std::optional<EntryId> start_id, size_t max_count,
                           const RecordPredicate& predicate) const {
    std::lock_guard<std::mutex> lock(mutex_);

    CachePage page;
    page.entries = start_id ? get_locked(*start_id, max_count, predicate)
                            : latest_locked(max_count, predicate);
    page.matching = count_locked(predicate);
    if (!entries_.empty()) {
        page.max_resident_id = entries_.back().id;
    }
    page.newest_id = next_id_ - 1;
    return page;
}

ChangeSummary EntryCache::changes_since(EntryId last_known_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    ChangeSummary summary;
    if (entries_.empty()) return summary;

    summary.min_id = entries_.front().id;
    summary.max_id = entries_.back().id;
    summary.new_count = std::max<int64_t>(0,
        summary.max_id - std::max(summary.min_id - 1, last_known_id));
    summary.has_updates = summary.new_count > 0;
    return summary;
}

CursorBatch EntryCache::read_after(EntryId position, uint64_t generation, size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    CursorBatch batch;
    batch.generation = generation_;
    batch.newest_id = next_id_ - 1;

    if (generation != generation_) {
        batch.generation_changed = true;
        return batch;
    }

    if (entries_.empty() || max_count == 0 || position >= entries_.back().id) {
        return batch;
    }

    size_t end = entries_.size();
    for (size_t i = lower_index_locked(position + 1); i < end; ++i) {
        batch.entries.push_back(entries_[i]);
        if (batch.entries.size() >= max_count) break;
    }
    return batch;
}

HierarchyMap EntryCache::hierarchy_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hierarchy_.snapshot();
}

void EntryCache::scan(const std::function<void(const CachedEntry&)>& visitor) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        visitor(entry);
    }
}

uint64_t EntryCache::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

std::pair<EntryId, uint64_t> EntryCache::tail_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {next_id_ - 1, generation_};
}

EntryId EntryCache::newest_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

std::optional<std::pair<EntryId, EntryId>> EntryCache::resident_range() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) return std::nullopt;
    return std::make_pair(entries_.front().id, entries_.back().id);
}

size_t EntryCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace logwindow
