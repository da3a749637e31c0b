#include "file_tailer.hpp"
#include "line_decoder.hpp"
#include "engine_log.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <string_view>
#include <system_error>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace logwindow {

namespace {

constexpr size_t kReadBlockSize = 64 * 1024;
constexpr size_t kDecodeBatch = 4096;

} // namespace

std::optional<OpenFile> OpenFile::open(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT || errno == ENOTDIR) return std::nullopt;
        throw std::system_error(errno, std::generic_category(), "open " + path);
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        int error = errno;
        ::close(fd);
        throw std::system_error(error, std::generic_category(), "fstat " + path);
    }

    FileStat stat;
    stat.fingerprint.device = static_cast<uint64_t>(st.st_dev);
    stat.fingerprint.inode = static_cast<uint64_t>(st.st_ino);
    stat.size = static_cast<uint64_t>(st.st_size);
    return OpenFile(path, fd, stat);
}

OpenFile::OpenFile(std::string path, int fd, FileStat stat)
    : path_(std::move(path))
    , fd_(fd)
    , stat_(stat)
{
}

OpenFile::OpenFile(OpenFile&& other) noexcept
    : path_(std::move(other.path_))
    , fd_(other.fd_)
    , stat_(other.stat_)
{
    other.fd_ = -1;
}

OpenFile::~OpenFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

LineChunk OpenFile::read_lines(uint64_t offset, const std::atomic<bool>* stop_requested) const {
    std::string data;
    char block[kReadBlockSize];
    uint64_t position = offset;

    while (true) {
        if (stop_requested && *stop_requested) {
            throw ReadInterrupted();
        }

        ssize_t n = ::pread(fd_, block, sizeof(block), static_cast<off_t>(position));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "read " + path_);
        }
        if (n == 0) break;

        data.append(block, static_cast<size_t>(n));
        position += static_cast<uint64_t>(n);
    }

    LineChunk chunk;
    auto last_newline = data.rfind('\n');
    if (last_newline == std::string::npos) return chunk;

    chunk.consumed = last_newline + 1;

    size_t pos = 0;
    while (pos < chunk.consumed) {
        size_t end = data.find('\n', pos);
        std::string_view line(data.data() + pos, end - pos);
        if (!trim_line(line).empty()) {
            chunk.lines.emplace_back(line);
        }
        pos = end + 1;
    }
    return chunk;
}

const char* poll_result_name(PollResult result) {
    switch (result) {
        case PollResult::Missing: return "missing";
        case PollResult::Rotated: return "rotated";
        case PollResult::Truncated: return "truncated";
        case PollResult::Grew: return "grew";
        case PollResult::Idle: return "idle";
    }
    return "unknown";
}

Backoff::Backoff(std::chrono::milliseconds min, std::chrono::milliseconds max, double factor)
    : min_(min)
    , max_(max)
    , factor_(factor)
    , current_(min)
{
}

void Backoff::grow() {
    ++idle_polls_;
    auto next = std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(std::ceil(static_cast<double>(current_.count()) * factor_)));
    current_ = std::min(std::max(next, current_), max_);
}

void Backoff::reset() {
    idle_polls_ = 0;
    current_ = min_;
}

FileTailer::FileTailer(EntryCache& cache, TailerConfig config)
    : cache_(cache)
    , config_(std::move(config))
    , backoff_(config_.min_poll_interval, config_.max_poll_interval, config_.backoff_factor)
{
    state_.path = config_.path;
    state_.generation = cache_.generation();
}

FileTailer::~FileTailer() {
    stop();
}

std::vector<LogRecord> FileTailer::decode_lines(const std::vector<std::string>& lines,
                                                size_t first) const {
    std::vector<LogRecord> records;
    records.reserve(lines.size() - first);
    double now = wall_clock_now();
    for (size_t i = first; i < lines.size(); ++i) {
        if ((i - first) % kDecodeBatch == 0 && stop_requested_) {
            throw ReadInterrupted();
        }
        records.push_back(decode_line(lines[i], now));
    }
    return records;
}

std::vector<LogRecord> FileTailer::load_records(const OpenFile& file, uint64_t& end_offset) {
    LineChunk chunk = file.read_lines(0, &stop_requested_);
    end_offset = chunk.consumed;

    size_t keep = chunk.lines.size();
    if (cache_.capacity() > 0) {
        keep = std::min(keep, cache_.capacity());
    }
    return decode_lines(chunk.lines, chunk.lines.size() - keep);
}

void FileTailer::load() {
    std::lock_guard<std::mutex> lock(state_mutex_);

    auto file = OpenFile::open(config_.path);
    if (!file) {
        state_.fingerprint.reset();
        state_.offset = 0;
        EngineLog::warning("FileTailer", "File not found, waiting for it: " + config_.path);
        return;
    }

    uint64_t end_offset = 0;
    auto records = load_records(*file, end_offset);
    size_t loaded = records.size();
    cache_.admit_batch(std::move(records));

    state_.fingerprint = file->stat().fingerprint;
    state_.offset = end_offset;
    state_.generation = cache_.generation();

    EngineLog::info("FileTailer", "Loaded " + std::to_string(loaded) + " entries from " + config_.path);
}

void FileTailer::reload(const OpenFile& file, const char* reason) {
    uint64_t end_offset = 0;
    auto records = load_records(file, end_offset);
    size_t loaded = records.size();

    state_.generation = cache_.reload(std::move(records));
    state_.fingerprint = file.stat().fingerprint;
    state_.offset = end_offset;
    backoff_.reset();

    EngineLog::info("FileTailer", std::string("File ") + reason + ", reloaded " +
                    std::to_string(loaded) + " entries (generation " +
                    std::to_string(state_.generation) + "): " + config_.path);
}

PollResult FileTailer::poll_once() {
    std::lock_guard<std::mutex> lock(state_mutex_);

    auto file = OpenFile::open(config_.path);
    if (!file) {
        // Reset once per disappearance, not on every poll while absent
        if (state_.fingerprint || state_.offset > 0) {
            state_.generation = cache_.reset();
            state_.fingerprint.reset();
            state_.offset = 0;
            EngineLog::warning("FileTailer", "File disappeared, cache cleared (generation " +
                               std::to_string(state_.generation) + "): " + config_.path);
        }
        return PollResult::Missing;
    }

    const FileStat& stat = file->stat();
    if (!state_.fingerprint || *state_.fingerprint != stat.fingerprint) {
        reload(*file, "rotated");
        return PollResult::Rotated;
    }

    if (stat.size < state_.offset) {
        reload(*file, "truncated");
        return PollResult::Truncated;
    }

    if (stat.size > state_.offset) {
        LineChunk chunk = file->read_lines(state_.offset, &stop_requested_);
        if (chunk.consumed > 0) {
            cache_.admit_batch(decode_lines(chunk.lines, 0));
            state_.offset += chunk.consumed;
            backoff_.reset();
            return PollResult::Grew;
        }
        // Only a partial line so far
    }

    backoff_.grow();
    return PollResult::Idle;
}

FileState FileTailer::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::chrono::milliseconds FileTailer::current_interval() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return backoff_.current();
}

void FileTailer::start() {
    if (running_) return;
    stop_requested_ = false;

    try {
        load();
    } catch (const std::exception& e) {
        EngineLog::error("FileTailer", std::string("Initial load failed: ") + e.what());
    }

    running_ = true;

    std::promise<void> finished;
    finished_ = finished.get_future();
    thread_ = std::thread([this, finished = std::move(finished)]() mutable {
        monitor_loop();
        finished.set_value();
    });

    EngineLog::info("FileTailer", "Started tailing: " + config_.path);
}

void FileTailer::stop() {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = true;
        running_ = false;
    }
    wake_.notify_all();

    // The thread uses this object and the cache, so it is always joined
    if (finished_.valid() &&
        finished_.wait_for(config_.stop_timeout) == std::future_status::timeout) {
        EngineLog::error("FileTailer", "Monitor thread did not stop within " +
                         std::to_string(config_.stop_timeout.count()) + " ms, waiting: " +
                         config_.path);
    }

    if (thread_.joinable()) {
        thread_.join();
    }
    EngineLog::info("FileTailer", "Stopped tailing: " + config_.path);
}

bool FileTailer::wait_for(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_.wait_for(lock, interval, [this]() { return !running_; });
    return running_;
}

void FileTailer::monitor_loop() {
    while (running_) {
        std::chrono::milliseconds interval = config_.min_poll_interval;

        try {
            PollResult result = poll_once();
            if (result == PollResult::Missing) {
                interval = config_.missing_file_wait;
            } else {
                interval = current_interval();
            }
            if (result != PollResult::Idle) {
                EngineLog::debug("FileTailer", std::string("Poll: ") + poll_result_name(result));
            }
        } catch (const ReadInterrupted&) {
            EngineLog::debug("FileTailer", "Poll abandoned on stop: " + config_.path);
            break;
        } catch (const std::exception& e) {
            EngineLog::error("FileTailer", std::string("Error reading file: ") + e.what());
            interval = config_.error_cooldown;
        }

        if (!wait_for(interval)) break;
    }
}

} // namespace logwindow
