#include "line_decoder.hpp"
#include <chrono>

namespace logwindow {

namespace {

// Length of the UTF-8 sequence starting at bytes[i], or 0 if it is invalid
size_t utf8_sequence_length(std::string_view bytes, size_t i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(bytes[k]); };
    auto continuation = [&](size_t k) {
        return k < bytes.size() && (byte(k) & 0xC0) == 0x80;
    };

    unsigned char lead = byte(i);
    if (lead < 0x80) return 1;

    if (lead >= 0xC2 && lead <= 0xDF) {
        return continuation(i + 1) ? 2 : 0;
    }

    if (lead >= 0xE0 && lead <= 0xEF) {
        if (!continuation(i + 1) || !continuation(i + 2)) return 0;
        unsigned char second = byte(i + 1);
        if (lead == 0xE0 && second < 0xA0) return 0;   // overlong
        if (lead == 0xED && second > 0x9F) return 0;   // surrogates
        return 3;
    }

    if (lead >= 0xF0 && lead <= 0xF4) {
        if (!continuation(i + 1) || !continuation(i + 2) || !continuation(i + 3)) return 0;
        unsigned char second = byte(i + 1);
        if (lead == 0xF0 && second < 0x90) return 0;   // overlong
        if (lead == 0xF4 && second > 0x8F) return 0;   // > U+10FFFF
        return 4;
    }

    return 0;
}

} // namespace

std::string sanitize_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        size_t len = utf8_sequence_length(bytes, i);
        if (len == 0) {
            ++i;
            continue;
        }
        out.append(bytes.data() + i, len);
        i += len;
    }
    return out;
}

std::string_view trim_line(std::string_view line) {
    const char* whitespace = " \t\r\n\f\v";
    auto first = line.find_first_not_of(whitespace);
    if (first == std::string_view::npos) return {};
    auto last = line.find_last_not_of(whitespace);
    return line.substr(first, last - first + 1);
}

double wall_clock_now() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration<double>(now.time_since_epoch()).count();
}

LogRecord decode_line(std::string_view line, double now) {
    std::string text = sanitize_utf8(trim_line(line));

    // parse() without exceptions: a discarded value marks a syntax error
    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        return LogRecord::structured(std::move(parsed));
    }

    return LogRecord::raw(std::move(text), now);
}

LogRecord decode_line(std::string_view line) {
    return decode_line(line, wall_clock_now());
}

} // namespace logwindow
