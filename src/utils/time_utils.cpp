#include "time_utils.hpp"

#include <cctype>
#include <ctime>
#include <string>

namespace time_utils {
    namespace {
        bool read_int(const std::string& s, size_t pos, size_t len, int& out) {
            if (pos + len > s.size()) {
                return false;
            }
            int value = 0;
            for (size_t i = pos; i < pos + len; ++i) {
                if (std::isdigit(static_cast<unsigned char>(s[i])) == 0) {
                    return false;
                }
                value = value * 10 + (s[i] - '0');
            }
            out = value;
            return true;
        }
    }  // namespace

    std::optional<TimePoint> parse_iso8601(const std::string& s) {
        std::tm tm{};
        int year = 0;
        int month = 0;
        int day = 0;
        if (!read_int(s, 0, 4, year) || s.size() < 10 || s[4] != '-' || !read_int(s, 5, 2, month) || s[7] != '-' || !read_int(s, 8, 2, day)) {
            return std::nullopt;
        }
        if (month < 1 || month > 12 || day < 1 || day > 31) {
            return std::nullopt;
        }
        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;

        size_t pos = 10;
        if (pos < s.size() && (s[pos] == 'T' || s[pos] == ' ')) {
            int hour = 0;
            int minute = 0;
            int second = 0;
            if (!read_int(s, 11, 2, hour) || s.size() < 19 || s[13] != ':' || !read_int(s, 14, 2, minute) || s[16] != ':' || !read_int(s, 17, 2, second)) {
                return std::nullopt;
            }
            tm.tm_hour = hour;
            tm.tm_min = minute;
            tm.tm_sec = second;
            pos = 19;

            if (pos < s.size() && s[pos] == '.') {
                ++pos;
                while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])) != 0) {
                    ++pos;
                }
            }
        }

        if (pos < s.size() && s[pos] == 'Z') {
            ++pos;
        }
        if (pos != s.size()) {
            return std::nullopt;
        }

        const time_t epoch = timegm(&tm);  // GNU extension
        if (epoch == static_cast<time_t>(-1)) {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(epoch);
    }

    std::string format_iso8601(TimePoint tp) {
        const time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
        return buf;
    }

    long long to_unix_seconds(TimePoint tp) { return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count(); }

    TimePoint from_unix_seconds(long long s) { return TimePoint{std::chrono::seconds{s}}; }
}  // namespace time_utils
