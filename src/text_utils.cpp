#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>

namespace app_retrieval {

std::string to_lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream stream(s);
    std::string tok;
    while (stream >> tok) out.push_back(tok);
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    while (!sub.empty()) {
        unsigned char c = static_cast<unsigned char>(sub.back());
        if (c < 0x80) break;
        if (c >= 0xC0) { sub.pop_back(); break; }
        sub.pop_back();
    }
    return sub;
}

std::string sanitize_utf8(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    auto cont = [&str](size_t i) {
        return i < str.size() && (static_cast<unsigned char>(str[i]) & 0xC0) == 0x80;
    };

    size_t i = 0;
    while (i < str.size()) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        size_t need = 0;
        unsigned char lo = 0x80, hi = 0xBF;  // bounds for the second byte
        if (c < 0x80) {
            out += static_cast<char>(c);
            ++i;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            need = 1;
        } else if (c >= 0xE0 && c <= 0xEF) {
            need = 2;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            need = 3;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        }

        bool valid = need > 0 && i + need < str.size();
        if (valid) {
            unsigned char second = static_cast<unsigned char>(str[i + 1]);
            valid = second >= lo && second <= hi;
            for (size_t k = 2; valid && k <= need; ++k) valid = cont(i + k);
        }

        if (valid) {
            out.append(str, i, need + 1);
            i += need + 1;
        } else {
            out += '?';
            ++i;
        }
    }
    return out;
}

size_t utf8_length(const std::string& str) {
    size_t n = 0;
    for (char ch : str) {
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string utf8_prefix(const std::string& str, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        if ((static_cast<unsigned char>(str[i]) & 0xC0) != 0x80) {
            if (chars == max_chars) return str.substr(0, i);
            ++chars;
        }
    }
    return str;
}

std::string format_iso_utc(TimePoint tp) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch());
    int64_t total_us = since_epoch.count();
    int64_t secs = total_us / 1000000;
    int64_t micros = total_us % 1000000;
    if (micros < 0) {
        micros += 1000000;
        secs -= 1;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                  tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                  tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec,
                  static_cast<long long>(micros));
    return buf;
}

std::string utc_now_iso() {
    return format_iso_utc(std::chrono::system_clock::now());
}

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

int days_in_month(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return kDays[month - 1];
}

class IsoCursor {
public:
    explicit IsoCursor(const std::string& s) : s_(s) {}

    bool digits(size_t n, int& out) {
        if (pos_ + n > s_.size()) return false;
        int v = 0;
        for (size_t i = 0; i < n; ++i) {
            char c = s_[pos_ + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            v = v * 10 + (c - '0');
        }
        out = v;
        pos_ += n;
        return true;
    }

    bool accept(char c) {
        if (pos_ < s_.size() && s_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool at_end() const { return pos_ >= s_.size(); }
    char peek() const { return at_end() ? '\0' : s_[pos_]; }
    void advance() { ++pos_; }

private:
    const std::string& s_;
    size_t pos_ = 0;
};

} // namespace

std::optional<TimePoint> parse_iso_utc(const std::string& ts) {
    const std::string raw = trim(ts);
    if (raw.empty()) return std::nullopt;

    IsoCursor cur(raw);
    int year = 0, month = 0, day = 0;
    int hour = 0, minute = 0, second = 0;
    int64_t micros = 0;
    int64_t offset_sec = 0;

    if (!cur.digits(4, year) || !cur.accept('-') || !cur.digits(2, month) ||
        !cur.accept('-') || !cur.digits(2, day)) {
        return std::nullopt;
    }

    if (!cur.at_end()) {
        if (!cur.accept('T') && !cur.accept(' ')) return std::nullopt;
        if (!cur.digits(2, hour) || !cur.accept(':') || !cur.digits(2, minute)) return std::nullopt;

        if (cur.accept(':')) {
            if (!cur.digits(2, second)) return std::nullopt;
            if (cur.accept('.')) {
                int n = 0;
                int64_t frac = 0;
                while (std::isdigit(static_cast<unsigned char>(cur.peek()))) {
                    if (n < 6) {
                        frac = frac * 10 + (cur.peek() - '0');
                    }
                    ++n;
                    cur.advance();
                }
                if (n == 0) return std::nullopt;
                for (int i = n; i < 6; ++i) frac *= 10;
                micros = frac;
            }
        }

        if (!cur.at_end()) {
            if (cur.accept('Z') || cur.accept('z')) {
                // UTC
            } else if (cur.peek() == '+' || cur.peek() == '-') {
                int sign = cur.peek() == '-' ? -1 : 1;
                cur.advance();
                int oh = 0, om = 0;
                if (!cur.digits(2, oh)) return std::nullopt;
                cur.accept(':');
                if (!cur.digits(2, om)) return std::nullopt;
                offset_sec = sign * (oh * 3600 + om * 60);
            } else {
                return std::nullopt;
            }
        }
        if (!cur.at_end()) return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_sec;

    auto since_epoch = std::chrono::seconds(secs) + std::chrono::microseconds(micros);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(since_epoch));
}

} // namespace app_retrieval
