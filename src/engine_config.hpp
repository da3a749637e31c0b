#pragma once

#include "log_record.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace logwindow {

struct TailerConfig {
    std::string path = "application.log";
    std::chrono::milliseconds min_poll_interval{100};
    std::chrono::milliseconds max_poll_interval{10000};
    double backoff_factor = 1.5;
    std::chrono::milliseconds missing_file_wait{5000};
    std::chrono::milliseconds error_cooldown{5000};
    std::chrono::milliseconds stop_timeout{5000};
};

struct StreamConfig {
    std::chrono::milliseconds check_interval{500};
    std::chrono::milliseconds heartbeat_interval{15000};
    size_t batch_limit = 100;
};

struct EngineConfig {
    int64_t capacity = 10000;              // 0 keeps every record
    TailerConfig tailer;
    StreamConfig stream;
    RecordSchema schema;
    uint16_t http_port = 5000;
    bool verbose = false;

    // Throws std::invalid_argument describing the first bad setting
    void validate() const;
};

} // namespace logwindow
