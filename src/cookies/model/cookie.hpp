#ifndef WAVE_ENGINE_COOKIE_HPP
#define WAVE_ENGINE_COOKIE_HPP

#include <chrono>
#include <optional>
#include <string>

namespace cookies {
    using TimePoint = std::chrono::system_clock::time_point;

    // Keyed by (domain, path, name) for merging.
    struct Cookie {
        std::string id_;
        std::string domain_;
        std::string path_ = "/";
        std::string name_;
        std::string value_;
        std::optional<TimePoint> expires_;  // std::nullopt = session cookie
        bool secure_ = false;
        bool http_only_ = false;
        bool enabled_ = true;

        [[nodiscard]] bool is_expired(TimePoint now) const { return expires_.has_value() && *expires_ < now; }
        [[nodiscard]] bool same_key(const Cookie& other) const {
            return name_ == other.name_ && domain_ == other.domain_ && path_ == other.path_;
        }
    };
}  // namespace cookies

#endif
