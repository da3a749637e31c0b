#include "engine_config.hpp"
#include <stdexcept>

namespace logwindow {

void EngineConfig::validate() const {
    if (capacity < 0) {
        throw std::invalid_argument("cache capacity must be >= 0, got " + std::to_string(capacity));
    }
    if (tailer.path.empty()) {
        throw std::invalid_argument("monitored file path is empty");
    }
    if (tailer.min_poll_interval.count() <= 0) {
        throw std::invalid_argument("minimum poll interval must be positive");
    }
    if (tailer.max_poll_interval < tailer.min_poll_interval) {
        throw std::invalid_argument("maximum poll interval is below the minimum");
    }
    if (!(tailer.backoff_factor > 1.0)) {
        throw std::invalid_argument("backoff factor must be greater than 1");
    }
    if (tailer.missing_file_wait.count() <= 0 || tailer.error_cooldown.count() <= 0) {
        throw std::invalid_argument("retry intervals must be positive");
    }
    if (stream.check_interval.count() <= 0 || stream.heartbeat_interval.count() <= 0) {
        throw std::invalid_argument("stream intervals must be positive");
    }
    if (stream.batch_limit == 0) {
        throw std::invalid_argument("stream batch limit must be positive");
    }
}

} // namespace logwindow
