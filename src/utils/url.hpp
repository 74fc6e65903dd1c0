#ifndef WAVE_ENGINE_URL_HPP
#define WAVE_ENGINE_URL_HPP

#include <optional>
#include <string>

namespace url {
    struct UrlParts {
        std::string scheme_;
        std::string host_;
        long port_ = 0;
        std::string path_ = "/";
        std::string query_;

        // path plus "?query" when a query is present
        [[nodiscard]] std::string request_target() const { return query_.empty() ? path_ : path_ + "?" + query_; }
        [[nodiscard]] bool is_https() const { return scheme_ == "https"; }
    };

    // Parses an absolute URL or a bare host ("api.example.com", "api.example.com:8443/x").
    // Bare input is given the https scheme. Returns std::nullopt for anything curl rejects.
    [[nodiscard]] std::optional<UrlParts> parse(const std::string& raw);

    // Lowercase host of `raw`, or std::nullopt when it cannot be parsed.
    [[nodiscard]] std::optional<std::string> host_of(const std::string& raw);

    // Appends an already encoded query string with '?' or '&'.
    [[nodiscard]] std::string append_query(const std::string& raw, const std::string& encoded_query);
}  // namespace url

#endif
