#ifndef WAVE_ENGINE_TIME_UTILS_HPP
#define WAVE_ENGINE_TIME_UTILS_HPP

#include <chrono>
#include <optional>
#include <string>

namespace time_utils {
    using TimePoint = std::chrono::system_clock::time_point;

    // Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" with an optional ".fff" fraction and an
    // optional "Z". Values are taken as UTC.
    [[nodiscard]] std::optional<TimePoint> parse_iso8601(const std::string& s);

    // "YYYY-MM-DDTHH:MM:SSZ"
    [[nodiscard]] std::string format_iso8601(TimePoint tp);

    [[nodiscard]] long long to_unix_seconds(TimePoint tp);

    [[nodiscard]] TimePoint from_unix_seconds(long long s);
}  // namespace time_utils

#endif
