#pragma once

#include <chrono>
#include <cstdio>
#include <datapod/datapod.hpp>
#include <didwebvh/common/error.hpp>
#include <string>

namespace didwebvh {

    using Timestamp = std::chrono::system_clock::time_point;

    namespace detail {

        inline bool parseDigits(const std::string &s, size_t pos, size_t count, int &out) {
            if (pos + count > s.size()) {
                return false;
            }
            int value = 0;
            for (size_t i = pos; i < pos + count; ++i) {
                if (s[i] < '0' || s[i] > '9') {
                    return false;
                }
                value = value * 10 + (s[i] - '0');
            }
            out = value;
            return true;
        }

    } // namespace detail

    /// Current wall-clock time truncated to whole seconds
    inline Timestamp now() { return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()); }

    /// Parse an RFC 3339 / ISO 8601 timestamp
    /// Accepts "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)"
    inline dp::Result<Timestamp, dp::Error> parseTimestamp(const std::string &text) {
        auto fail = [&text]() {
            return dp::Result<Timestamp, dp::Error>::err(
                dp::Error::invalid_argument(dp::String(("Invalid timestamp: '" + text + "'").c_str())));
        };

        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (text.size() < 20 || !detail::parseDigits(text, 0, 4, year) || text[4] != '-' ||
            !detail::parseDigits(text, 5, 2, month) || text[7] != '-' || !detail::parseDigits(text, 8, 2, day) ||
            (text[10] != 'T' && text[10] != 't') || !detail::parseDigits(text, 11, 2, hour) || text[13] != ':' ||
            !detail::parseDigits(text, 14, 2, minute) || text[16] != ':' || !detail::parseDigits(text, 17, 2, second)) {
            return fail();
        }

        if (hour > 23 || minute > 59 || second > 60) {
            return fail();
        }

        std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
        if (!ymd.ok()) {
            return fail();
        }

        size_t pos = 19;
        std::chrono::nanoseconds fraction{0};
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            size_t digits = 0;
            long long value = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                if (digits < 9) {
                    value = value * 10 + (text[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) {
                return fail();
            }
            for (size_t i = digits; i < 9; ++i) {
                value *= 10;
            }
            fraction = std::chrono::nanoseconds(value);
        }

        if (pos >= text.size()) {
            return fail();
        }

        std::chrono::minutes offset{0};
        if (text[pos] == 'Z' || text[pos] == 'z') {
            ++pos;
        } else if (text[pos] == '+' || text[pos] == '-') {
            int off_hour = 0, off_minute = 0;
            if (!detail::parseDigits(text, pos + 1, 2, off_hour) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
                !detail::parseDigits(text, pos + 4, 2, off_minute) || off_hour > 23 || off_minute > 59) {
                return fail();
            }
            offset = std::chrono::hours(off_hour) + std::chrono::minutes(off_minute);
            if (text[pos] == '-') {
                offset = -offset;
            }
            pos += 6;
        } else {
            return fail();
        }

        if (pos != text.size()) {
            return fail();
        }

        auto tp = std::chrono::sys_days{ymd} + std::chrono::hours(hour) + std::chrono::minutes(minute) +
                  std::chrono::seconds(second) - offset;
        return dp::Result<Timestamp, dp::Error>::ok(
            std::chrono::time_point_cast<Timestamp::duration>(tp + fraction));
    }

    /// Format as "YYYY-MM-DDTHH:MM:SSZ" (UTC, second precision)
    inline std::string formatTimestamp(Timestamp tp) {
        auto secs = std::chrono::floor<std::chrono::seconds>(tp);
        auto days = std::chrono::floor<std::chrono::days>(secs);
        std::chrono::year_month_day ymd{days};
        std::chrono::hh_mm_ss<std::chrono::seconds> hms{secs - days};

        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02dZ", static_cast<int>(ymd.year()),
                      static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                      static_cast<int>(hms.hours().count()), static_cast<int>(hms.minutes().count()),
                      static_cast<int>(hms.seconds().count()));
        return std::string(buffer);
    }

} // namespace didwebvh
