#pragma once

#include "entry_cache.hpp"
#include <cstdint>
#include <vector>

namespace logwindow {

// A reader's bookmark into the record stream. Owned by the caller that
// opened it; the cache keeps no reference to it.
//
// The cursor anchors at the newest id when opened and remembers the cache
// generation. If the cache is reset (rotation, truncation, disappearance)
// the next read rebases it onto the new tail; records from before the
// reset are not delivered.
class ReadCursor {
public:
    // Anchored at the cache's newest id
    static ReadCursor open(const EntryCache& cache);

    // Anchored so that the first read delivers records after `last_delivered_id`
    static ReadCursor open_at(const EntryCache& cache, EntryId last_delivered_id);

    // Records after the current position, at most max_count. Rebases first
    // if the cache generation moved, in which case the result is empty.
    std::vector<CachedEntry> read(const EntryCache& cache, size_t max_count);

    // Rebases if stale, then reports what is waiting past the position
    ChangeSummary pending(const EntryCache& cache);

    // Id of the last record delivered (or the anchor if none yet)
    EntryId position() const { return anchor_id_ + offset_; }

    EntryId anchor_id() const { return anchor_id_; }
    int64_t offset() const { return offset_; }
    uint64_t generation() const { return generation_; }

    // True once at least one record has been delivered since the last (re)anchor
    bool advanced() const { return offset_ > 0; }

    uint64_t rebase_count() const { return rebase_count_; }

private:
    ReadCursor(EntryId anchor_id, uint64_t generation)
        : anchor_id_(anchor_id), generation_(generation) {}

    void rebase(EntryId newest_id, uint64_t generation);
    bool recover(const EntryCache& cache);

    EntryId anchor_id_ = kNoEntry;
    int64_t offset_ = 0;
    uint64_t generation_ = 0;
    uint64_t rebase_count_ = 0;
};

} // namespace logwindow
