#include "cookie_jar.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string_view>

#include "../../credentials/domain_matcher/domain_matcher.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/encoding.hpp"
#include "../../utils/string_utils.hpp"
#include "../../utils/url.hpp"

namespace cookies {
    namespace {
        struct AttributeKeys {
            static constexpr const char* DOMAIN = "domain=";
            static constexpr const char* PATH = "path=";
            static constexpr const char* EXPIRES = "expires=";
            static constexpr const char* MAX_AGE = "max-age=";
            static constexpr const char* SECURE = "secure";
            static constexpr const char* HTTP_ONLY = "httponly";
        };

        std::string value_after(const std::string& attr, std::string_view key) { return string_utils::trim(attr.substr(key.size())); }
    }  // namespace

    std::optional<Cookie> parse_set_cookie(const std::string& header, const std::string& default_domain, TimePoint now) {
        const auto parts = string_utils::split(header, ';');
        const std::string name_value = string_utils::trim(parts.front());

        const auto separator = name_value.find('=');
        if (separator == std::string::npos) {
            return std::nullopt;
        }

        Cookie cookie{
            .id_ = encoding::random_hex(constants::RECORD_ID_BYTES),
            .domain_ = default_domain,
            .name_ = string_utils::trim(name_value.substr(0, separator)),
            .value_ = string_utils::trim(name_value.substr(separator + 1)),
        };

        std::optional<TimePoint> from_expires;
        std::optional<TimePoint> from_max_age;

        for (size_t i = 1; i < parts.size(); ++i) {
            const std::string attr = string_utils::trim(parts[i]);

            if (string_utils::ieq_prefix(attr, AttributeKeys::DOMAIN)) {
                const std::string domain = string_utils::to_lower(value_after(attr, AttributeKeys::DOMAIN));
                if (!domain.empty()) {
                    cookie.domain_ = domain;
                }
            } else if (string_utils::ieq_prefix(attr, AttributeKeys::PATH)) {
                const std::string path = value_after(attr, AttributeKeys::PATH);
                if (!path.empty()) {
                    cookie.path_ = path;
                }
            } else if (string_utils::ieq_prefix(attr, AttributeKeys::EXPIRES)) {
                const std::string date = value_after(attr, AttributeKeys::EXPIRES);
                const time_t parsed = curl_getdate(date.c_str(), nullptr);
                if (parsed != -1) {
                    from_expires = std::chrono::system_clock::from_time_t(parsed);
                }
            } else if (string_utils::ieq_prefix(attr, AttributeKeys::MAX_AGE)) {
                const std::string seconds = value_after(attr, AttributeKeys::MAX_AGE);
                char* end = nullptr;
                const long long max_age = std::strtoll(seconds.c_str(), &end, constants::BASE_10);
                if (end != seconds.c_str()) {
                    // Max-Age <= 0 expires immediately
                    from_max_age = max_age <= 0 ? now - std::chrono::seconds(1) : now + std::chrono::seconds(max_age);
                }
            } else if (string_utils::iequals(attr, AttributeKeys::SECURE)) {
                cookie.secure_ = true;
            } else if (string_utils::iequals(attr, AttributeKeys::HTTP_ONLY)) {
                cookie.http_only_ = true;
            }
        }

        cookie.expires_ = from_max_age ? from_max_age : from_expires;
        return cookie;
    }

    std::vector<Cookie> merge(std::vector<Cookie> existing, const std::vector<Cookie>& incoming) {
        for (const auto& next : incoming) {
            auto it = std::ranges::find_if(existing, [&](const Cookie& c) { return c.same_key(next); });

            if (it == existing.end()) {
                existing.push_back(next);
                continue;
            }

            Cookie replacement = next;
            replacement.id_ = it->id_;
            replacement.enabled_ = it->enabled_;
            *it = std::move(replacement);
        }
        return existing;
    }

    bool domain_matches(const std::string& cookie_domain, const std::string& host) {
        std::string domain = string_utils::to_lower(string_utils::trim(cookie_domain));
        if (domain.empty()) {
            return false;
        }
        if (domain.find('*') != std::string::npos) {
            return credentials::domain_matcher::CompiledPatterns({domain}).matches_host(host);
        }
        if (domain.front() == '.') {
            domain.erase(0, 1);
        }
        if (host == domain) {
            return true;
        }
        return host.size() > domain.size() && host.ends_with(domain) && host[host.size() - domain.size() - 1] == '.';
    }

    std::string cookie_header_for(const std::vector<Cookie>& cookies, const std::string& target_url, TimePoint now) {
        const auto parts = url::parse(target_url);
        if (!parts) {
            spdlog::warn("Cannot select cookies for malformed URL: {}", target_url);
            return "";
        }

        std::vector<std::string> pairs;
        for (const auto& c : cookies) {
            if (!c.enabled_ || c.is_expired(now)) {
                continue;
            }
            if (!domain_matches(c.domain_, parts->host_)) {
                continue;
            }
            if (!c.path_.empty() && c.path_ != "/" && !parts->path_.starts_with(c.path_)) {
                continue;
            }
            if (c.secure_ && !parts->is_https()) {
                continue;
            }
            pairs.push_back(c.name_ + "=" + c.value_);
        }
        return string_utils::join(pairs, "; ");
    }

    CookieJar::CookieJar(std::unique_ptr<ICookieStorage> storage) : storage_(std::move(storage)) {
        if (!storage_) {
            throw std::runtime_error("CookieJar requires a storage backend");
        }
        try {
            cookies_ = storage_->load();
        } catch (const std::exception& e) {
            spdlog::error("Failed to load cookie jar, starting empty: {}", e.what());
        }
    }

    std::string CookieJar::header_for(const std::string& target_url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cookie_header_for(cookies_, target_url, std::chrono::system_clock::now());
    }

    std::vector<Cookie> CookieJar::store_from_response(const std::vector<std::string>& set_cookie_headers, const std::string& request_url) {
        std::vector<Cookie> parsed;
        if (set_cookie_headers.empty()) {
            return parsed;
        }

        const std::string host = url::host_of(request_url).value_or("");
        const auto now = std::chrono::system_clock::now();

        for (const auto& header : set_cookie_headers) {
            if (auto cookie = parse_set_cookie(header, host, now)) {
                parsed.push_back(std::move(*cookie));
            }
        }
        if (parsed.empty()) {
            return parsed;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        cookies_ = merge(std::move(cookies_), parsed);
        persist_locked();
        return parsed;
    }

    std::vector<Cookie> CookieJar::all() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cookies_;
    }

    void CookieJar::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        cookies_.clear();
        persist_locked();
    }

    void CookieJar::persist_locked() {
        try {
            storage_->save(cookies_);
        } catch (const std::exception& e) {
            spdlog::error("Failed to persist cookie jar: {}", e.what());
        }
    }
}  // namespace cookies
