#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace app_retrieval {

std::string to_lower_ascii(std::string s);
std::string trim(const std::string& s);

// Splits on any run of whitespace, dropping empty pieces.
std::vector<std::string> split_whitespace(const std::string& s);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Truncates to at most `length` bytes without cutting a UTF-8 sequence in half.
std::string utf8_safe_substr(const std::string& str, size_t length);

// Replaces each byte that is not part of a well-formed UTF-8 sequence
// (stray continuation, truncated or overlong sequence, surrogate) with '?'.
std::string sanitize_utf8(const std::string& str);

// Code point count and prefix of at most `max_chars` code points.
size_t utf8_length(const std::string& str);
std::string utf8_prefix(const std::string& str, size_t max_chars);

using TimePoint = std::chrono::system_clock::time_point;

// ISO-8601 UTC timestamp with microseconds, e.g. 2026-02-19T10:04:11.123456+00:00
std::string format_iso_utc(TimePoint tp);
std::string utc_now_iso();

// Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS[.ffffff]]" with an optional
// "Z" or "+HH:MM" suffix. Naive timestamps are taken as UTC.
std::optional<TimePoint> parse_iso_utc(const std::string& ts);

} // namespace app_retrieval
