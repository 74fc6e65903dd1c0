#ifndef WAVE_ENGINE_COOKIE_JAR_HPP
#define WAVE_ENGINE_COOKIE_JAR_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../model/cookie.hpp"
#include "../storage/cookie_storage.hpp"

namespace cookies {
    // Parses one Set-Cookie header. `default_domain` is used when no Domain attribute is given.
    // Returns std::nullopt when the leading name=value pair has no '='.
    [[nodiscard]] std::optional<Cookie> parse_set_cookie(const std::string& header, const std::string& default_domain, TimePoint now);

    // Upserts `incoming` into `existing` by (domain, path, name). A replaced cookie keeps its id
    // and enabled flag. Expired cookies are kept; expiry only filters the Cookie header.
    [[nodiscard]] std::vector<Cookie> merge(std::vector<Cookie> existing, const std::vector<Cookie>& incoming);

    // True when `host` falls under the cookie domain: exact, subdomain (leading dot ignored), or a
    // wildcard pattern.
    [[nodiscard]] bool domain_matches(const std::string& cookie_domain, const std::string& host);

    // "a=1; b=2" for the cookies that apply to `target_url`. Empty when none apply.
    [[nodiscard]] std::string cookie_header_for(const std::vector<Cookie>& cookies, const std::string& target_url, TimePoint now);

    // Process-wide jar. Mutations are serialized and merged into the current contents, so
    // concurrent executions never lose each other's cookies.
    class CookieJar {
       public:
        explicit CookieJar(std::unique_ptr<ICookieStorage> storage);

        ~CookieJar() = default;
        CookieJar(const CookieJar&) = delete;
        CookieJar& operator=(const CookieJar&) = delete;
        CookieJar(CookieJar&&) = delete;
        CookieJar& operator=(CookieJar&&) = delete;

        [[nodiscard]] std::string header_for(const std::string& target_url) const;

        // Parses the Set-Cookie values received from `request_url`, merges and persists them.
        // Returns the cookies that were parsed.
        std::vector<Cookie> store_from_response(const std::vector<std::string>& set_cookie_headers, const std::string& request_url);

        [[nodiscard]] std::vector<Cookie> all() const;
        void clear();

       private:
        void persist_locked();

        mutable std::mutex mutex_;
        std::vector<Cookie> cookies_;
        std::unique_ptr<ICookieStorage> storage_;
    };
}  // namespace cookies

#endif
