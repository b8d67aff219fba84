#include "hillmaker/core/timestamp.hpp"
#include <cctype>
#include <cstdio>

namespace hillmaker {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n\"");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n\"");
    return s.substr(first, last - first + 1);
}

std::optional<Timestamp> make_timestamp(int y, int mo, int d, int h, int mi, int s) {
    using namespace std::chrono;

    const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                             day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    if (h < 0 || h > 23 || mi < 0 || mi > 59 || s < 0 || s > 59) {
        return std::nullopt;
    }
    return Timestamp(sys_days{ymd}) + hours{h} + minutes{mi} + seconds{s};
}

// Parse "HH:MM[:SS[.fff]]" starting at pos; empty remainder means midnight
bool parse_time_part(const std::string& text, size_t pos, int& h, int& mi, int& s) {
    h = mi = s = 0;
    if (pos >= text.size()) {
        return true;
    }
    int consumed = 0;
    const char* p = text.c_str() + pos;
    if (std::sscanf(p, "%d:%d:%d%n", &h, &mi, &s, &consumed) == 3) {
        // Allow truncated fractional seconds
        const char* rest = p + consumed;
        if (*rest == '.') {
            ++rest;
            while (std::isdigit(static_cast<unsigned char>(*rest))) ++rest;
        }
        return *rest == '\0';
    }
    s = 0;
    consumed = 0;
    if (std::sscanf(p, "%d:%d%n", &h, &mi, &consumed) == 2) {
        return p[consumed] == '\0';
    }
    return false;
}

} // namespace

std::optional<Timestamp> parse_timestamp(const std::string& raw) {
    const std::string text = trim(raw);
    if (text.empty()) {
        return std::nullopt;
    }

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    int consumed = 0;

    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &y, &mo, &d, &consumed) == 3) {
        size_t pos = static_cast<size_t>(consumed);
        if (pos < text.size()) {
            if (text[pos] != ' ' && text[pos] != 'T') {
                return std::nullopt;
            }
            ++pos;
        }
        if (!parse_time_part(text, pos, h, mi, s)) {
            return std::nullopt;
        }
        return make_timestamp(y, mo, d, h, mi, s);
    }

    consumed = 0;
    if (std::sscanf(text.c_str(), "%d/%d/%4d%n", &mo, &d, &y, &consumed) == 3) {
        size_t pos = static_cast<size_t>(consumed);
        if (pos < text.size()) {
            if (text[pos] != ' ') {
                return std::nullopt;
            }
            ++pos;
        }
        if (!parse_time_part(text, pos, h, mi, s)) {
            return std::nullopt;
        }
        return make_timestamp(y, mo, d, h, mi, s);
    }

    return std::nullopt;
}

Timestamp parse_timestamp_or_throw(const std::string& text) {
    auto ts = parse_timestamp(text);
    if (!ts) {
        throw ValidationError("Cannot convert '" + text + "' to a timestamp");
    }
    return *ts;
}

std::string format_timestamp(Timestamp t) {
    using namespace std::chrono;
    const auto day_start = floor<days>(t);
    const year_month_day ymd{day_start};
    const hh_mm_ss<seconds> tod{t - day_start};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02d:%02d:%02d",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(tod.hours().count()),
                  static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()));
    return buf;
}

std::string format_date(Timestamp t) {
    return format_timestamp(t).substr(0, 10);
}

std::string format_time_of_day(Timestamp t) {
    return format_timestamp(t).substr(11, 5);
}

} // namespace hillmaker
