#pragma once

#include "entry_cache.hpp"
#include "engine_config.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace logwindow {

// Identity of a file independent of its path
struct FileFingerprint {
    uint64_t device = 0;
    uint64_t inode = 0;

    bool operator==(const FileFingerprint& other) const {
        return device == other.device && inode == other.inode;
    }
    bool operator!=(const FileFingerprint& other) const { return !(*this == other); }
};

struct FileStat {
    FileFingerprint fingerprint;
    uint64_t size = 0;
};

struct FileState {
    std::string path;
    uint64_t offset = 0;                         // bytes consumed so far
    std::optional<FileFingerprint> fingerprint;  // nullopt while the file is absent
    uint64_t generation = 0;
};

// Complete lines read from a file, and how many bytes they covered.
// An unterminated trailing fragment is left unread.
struct LineChunk {
    std::vector<std::string> lines;
    uint64_t consumed = 0;
};

// Thrown out of a read or reload abandoned because stop() was requested
class ReadInterrupted : public std::runtime_error {
public:
    ReadInterrupted() : std::runtime_error("read interrupted by stop request") {}
};

// A file opened once per poll. Fingerprint, size and content all come from
// the same descriptor, so a rename in between cannot mix two files.
class OpenFile {
public:
    // nullopt if the path does not exist; throws std::system_error on other failures
    static std::optional<OpenFile> open(const std::string& path);

    ~OpenFile();
    OpenFile(OpenFile&& other) noexcept;
    OpenFile(const OpenFile&) = delete;
    OpenFile& operator=(const OpenFile&) = delete;
    OpenFile& operator=(OpenFile&&) = delete;

    const FileStat& stat() const { return stat_; }
    const std::string& path() const { return path_; }

    // Complete lines from offset to end of file. When stop_requested is
    // given it is checked between blocks, and a set flag throws ReadInterrupted.
    LineChunk read_lines(uint64_t offset, const std::atomic<bool>* stop_requested = nullptr) const;

private:
    OpenFile(std::string path, int fd, FileStat stat);

    std::string path_;
    int fd_ = -1;
    FileStat stat_;
};

enum class PollResult {
    Missing,
    Rotated,
    Truncated,
    Grew,
    Idle
};

const char* poll_result_name(PollResult result);

// Idle poll interval: multiplied by `factor` on each idle poll up to `max`,
// back to `min` on activity.
class Backoff {
public:
    Backoff(std::chrono::milliseconds min, std::chrono::milliseconds max, double factor);

    std::chrono::milliseconds current() const { return current_; }
    uint64_t idle_polls() const { return idle_polls_; }

    void grow();
    void reset();

private:
    std::chrono::milliseconds min_;
    std::chrono::milliseconds max_;
    double factor_;
    std::chrono::milliseconds current_;
    uint64_t idle_polls_ = 0;
};

// Follows one file and feeds its lines into the cache. Detects rotation by
// fingerprint, truncation by size, and disappearance; each of those resets
// the cache and starts a new generation.
class FileTailer {
public:
    FileTailer(EntryCache& cache, TailerConfig config);
    ~FileTailer();

    // Non-copyable
    FileTailer(const FileTailer&) = delete;
    FileTailer& operator=(const FileTailer&) = delete;

    // Initial load followed by the background poll loop
    void start();

    // Cooperative stop. An in-flight read or reload is abandoned without
    // touching the cache; a thread still busy after stop_timeout is logged
    // and then joined.
    void stop();

    bool is_running() const { return running_; }

    // Reads the current content of the file into the cache, bounded to the
    // cache capacity. A missing file leaves the cache empty.
    void load();

    // One poll step. Throws on I/O errors; the background loop contains them.
    PollResult poll_once();

    FileState state() const;
    std::chrono::milliseconds current_interval() const;
    const std::string& path() const { return config_.path; }

private:
    void monitor_loop();
    void reload(const OpenFile& file, const char* reason);
    std::vector<LogRecord> load_records(const OpenFile& file, uint64_t& end_offset);

    // Decodes lines[first..], throwing ReadInterrupted once stop() is requested
    std::vector<LogRecord> decode_lines(const std::vector<std::string>& lines, size_t first) const;

    // Sleeps unless stop() is called first; returns false if stopping
    bool wait_for(std::chrono::milliseconds interval);

    EntryCache& cache_;
    TailerConfig config_;

    mutable std::mutex state_mutex_;
    FileState state_;
    Backoff backoff_;

    std::thread thread_;
    std::future<void> finished_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
};

} // namespace logwindow
