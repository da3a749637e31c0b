#pragma once

#include "log_record.hpp"
#include <string>
#include <string_view>

namespace logwindow {

// Drops bytes that do not form valid UTF-8 sequences
std::string sanitize_utf8(std::string_view bytes);

// Strips surrounding whitespace, including the line terminator
std::string_view trim_line(std::string_view line);

// Seconds since the epoch, as a double
double wall_clock_now();

// Turns one line of the monitored file into a record. A line that is not a
// JSON object becomes a raw record stamped with `now`. Never throws on
// malformed input.
LogRecord decode_line(std::string_view line, double now);
LogRecord decode_line(std::string_view line);

} // namespace logwindow
