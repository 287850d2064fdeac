/*
 * time.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "time.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <ctime>

namespace clipvault::utils {

auto toEpochSeconds(Timestamp tp) noexcept -> double {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

auto fromEpochSeconds(double seconds) noexcept -> Timestamp {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(seconds)));
}

namespace {
auto readInt(std::string_view text, std::size_t pos, std::size_t len,
             int& out) -> bool {
    if (pos + len > text.size()) {
        return false;
    }
    const char* first = text.data() + pos;
    auto [ptr, ec] = std::from_chars(first, first + len, out);
    return ec == std::errc() && ptr == first + len;
}

auto expect(std::string_view text, std::size_t pos, char c) -> bool {
    return pos < text.size() && text[pos] == c;
}
}  // namespace

auto parseIso8601(std::string_view text) -> std::optional<Timestamp> {
    std::tm tm{};
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;

    if (!readInt(text, 0, 4, year) || !expect(text, 4, '-') ||
        !readInt(text, 5, 2, month) || !expect(text, 7, '-') ||
        !readInt(text, 8, 2, day) ||
        !(expect(text, 10, 'T') || expect(text, 10, ' ')) ||
        !readInt(text, 11, 2, hour) || !expect(text, 13, ':') ||
        !readInt(text, 14, 2, minute) || !expect(text, 16, ':') ||
        !readInt(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
        minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    double fraction = 0.0;
    if (expect(text, pos, '.')) {
        ++pos;
        double scale = 0.1;
        const std::size_t start = pos;
        while (pos < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[pos]))) {
            fraction += (text[pos] - '0') * scale;
            scale /= 10.0;
            ++pos;
        }
        if (pos == start) {
            return std::nullopt;
        }
    }

    int offsetSeconds = 0;
    if (expect(text, pos, 'Z') || expect(text, pos, 'z')) {
        ++pos;
    } else if (expect(text, pos, '+') || expect(text, pos, '-')) {
        const int sign = text[pos] == '-' ? -1 : 1;
        int offHour = 0;
        int offMinute = 0;
        if (!readInt(text, pos + 1, 2, offHour)) {
            return std::nullopt;
        }
        pos += 3;
        if (expect(text, pos, ':')) {
            ++pos;
        }
        if (!readInt(text, pos, 2, offMinute)) {
            return std::nullopt;
        }
        pos += 2;
        offsetSeconds = sign * (offHour * 3600 + offMinute * 60);
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const std::time_t utc = timegm(&tm);
    if (utc == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return fromEpochSeconds(static_cast<double>(utc - offsetSeconds) +
                            fraction);
}

auto formatTimestamp(Timestamp tp) -> std::string {
    const std::time_t t = Clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);

    std::array<char, 32> buffer{};
    const auto len =
        std::strftime(buffer.data(), buffer.size(), "%Y-%m-%d %H:%M", &local);
    return std::string(buffer.data(), len);
}

}  // namespace clipvault::utils
