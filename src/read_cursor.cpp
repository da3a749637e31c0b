#include "read_cursor.hpp"
#include "engine_log.hpp"
#include <algorithm>

namespace logwindow {

ReadCursor ReadCursor::open(const EntryCache& cache) {
    auto [newest_id, generation] = cache.tail_state();
    return ReadCursor(newest_id, generation);
}

ReadCursor ReadCursor::open_at(const EntryCache& cache, EntryId last_delivered_id) {
    auto [newest_id, generation] = cache.tail_state();
    EntryId anchor = std::min(last_delivered_id, newest_id);
    return ReadCursor(std::max(anchor, kNoEntry), generation);
}

void ReadCursor::rebase(EntryId newest_id, uint64_t generation) {
    EngineLog::debug("Cursor", "Generation " + std::to_string(generation_) + " -> " +
                     std::to_string(generation) + ", rebasing at id " + std::to_string(newest_id));
    anchor_id_ = newest_id;
    offset_ = 0;
    generation_ = generation;
    ++rebase_count_;
}

bool ReadCursor::recover(const EntryCache& cache) {
    CursorBatch state = cache.read_after(position(), generation_, 0);
    if (!state.generation_changed) return false;
    rebase(state.newest_id, state.generation);
    return true;
}

std::vector<CachedEntry> ReadCursor::read(const EntryCache& cache, size_t max_count) {
    CursorBatch batch = cache.read_after(position(), generation_, max_count);

    if (batch.generation_changed) {
        rebase(batch.newest_id, batch.generation);
        return {};
    }

    if (!batch.entries.empty()) {
        // Jump to the last delivered id; ids skipped by eviction are not owed
        offset_ = batch.entries.back().id - anchor_id_;
    }
    return std::move(batch.entries);
}

ChangeSummary ReadCursor::pending(const EntryCache& cache) {
    recover(cache);
    return cache.changes_since(position());
}

} // namespace logwindow
