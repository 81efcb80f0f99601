#pragma once

// Text-to-value helpers for bar and config input.

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tdchart::ParseUtils {

inline char asciiToLower(unsigned char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c + ('a' - 'A'));
    }
    return static_cast<char>(c);
}

inline std::string toLower(std::string_view str) {
    std::string out;
    out.reserve(str.size());
    for (char c : str) out.push_back(asciiToLower(static_cast<unsigned char>(c)));
    return out;
}

inline bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (asciiToLower(static_cast<unsigned char>(lhs[i])) != asciiToLower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

inline std::string_view trim(std::string_view str) {
    const auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!str.empty() && isSpace(str.front())) str.remove_prefix(1);
    while (!str.empty() && isSpace(str.back())) str.remove_suffix(1);
    return str;
}

/**
 * Parse a decimal number occupying the whole (trimmed) string.
 * Locale independent: '.' is always the decimal separator.
 * @return nullopt for empty input, trailing garbage or a non-finite result
 */
inline std::optional<double> parseDouble(std::string_view str) {
    str = trim(str);
    if (!str.empty() && str.front() == '+') str.remove_prefix(1);
    if (str.empty()) return std::nullopt;
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

inline std::optional<int64_t> parseInt64(std::string_view str) {
    str = trim(str);
    if (str.empty()) return std::nullopt;
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) return std::nullopt;
    return value;
}

inline int fastStringToInt(std::string_view str) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec == std::errc()) {
        return value;
    }
    return -1;
}

// Fixed-width unsigned field; -1 unless every character is a digit.
inline int parseDigits(std::string_view str) {
    if (str.empty()) return -1;
    for (char c : str) {
        if (c < '0' || c > '9') return -1;
    }
    return fastStringToInt(str);
}

/**
 * Parse an ISO8601 date or date-time into milliseconds since epoch (UTC).
 * Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DDTHH:MM:SS[.ffffff][Z|+HH:MM|-HH:MM]".
 * A bare integer is taken as an epoch-millisecond timestamp.
 */
inline std::optional<int64_t> parseTimestampMs(std::string_view text) {
    text = trim(text);
    if (text.empty()) return std::nullopt;

    if (text.find('-', 1) == std::string_view::npos) {
        return parseInt64(text);
    }
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    const int yearValue = parseDigits(text.substr(0, 4));
    const int monthValue = parseDigits(text.substr(5, 2));
    const int dayValue = parseDigits(text.substr(8, 2));
    int hourValue = 0;
    int minuteValue = 0;
    int secondValue = 0;
    int64_t fractional_microseconds = 0;
    int tzOffsetMinutes = 0;

    size_t pos = 10;
    if (pos < text.size()) {
        if ((text[pos] != 'T' && text[pos] != ' ') || text.size() < 19 || text[13] != ':' || text[16] != ':') {
            return std::nullopt;
        }
        hourValue = parseDigits(text.substr(11, 2));
        minuteValue = parseDigits(text.substr(14, 2));
        secondValue = parseDigits(text.substr(17, 2));
        if (hourValue < 0 || hourValue > 23 || minuteValue < 0 || minuteValue > 59 ||
            secondValue < 0 || secondValue > 60) {
            return std::nullopt;
        }
        pos = 19;

        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            int fractional_digits = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                if (fractional_digits < 6) {
                    fractional_microseconds = fractional_microseconds * 10 + (text[pos] - '0');
                    ++fractional_digits;
                }
                ++pos;
            }
            while (fractional_digits > 0 && fractional_digits < 6) {
                fractional_microseconds *= 10;
                ++fractional_digits;
            }
        }

        if (pos < text.size()) {
            const char tzChar = text[pos];
            if (tzChar == 'Z' || tzChar == 'z') {
                ++pos;
            } else if ((tzChar == '+' || tzChar == '-') && pos + 3 <= text.size()) {
                const int sign = (tzChar == '+') ? 1 : -1;
                int tzHours = parseDigits(text.substr(pos + 1, 2));
                int tzMinutes = 0;
                pos += 3;
                if (pos < text.size() && text[pos] == ':') ++pos;
                if (pos + 2 <= text.size()) {
                    tzMinutes = parseDigits(text.substr(pos, 2));
                    pos += 2;
                }
                if (tzHours < 0 || tzHours > 23 || tzMinutes < 0 || tzMinutes > 59) return std::nullopt;
                tzOffsetMinutes = sign * (tzHours * 60 + tzMinutes);
            }
            if (pos != text.size()) return std::nullopt;
        }
    }

    using namespace std::chrono;

    if (yearValue < 0 || monthValue < 0 || dayValue < 0) return std::nullopt;
    const auto ymd = year{yearValue} / month{static_cast<unsigned>(monthValue)} / day{static_cast<unsigned>(dayValue)};
    if (!ymd.ok()) return std::nullopt;

    auto time_point = sys_time<microseconds>(sys_days{ymd});
    time_point += hours(hourValue) + minutes(minuteValue) + seconds(secondValue);
    time_point += microseconds(fractional_microseconds);
    time_point -= minutes(tzOffsetMinutes);

    return duration_cast<milliseconds>(time_point.time_since_epoch()).count();
}

} // namespace tdchart::ParseUtils
