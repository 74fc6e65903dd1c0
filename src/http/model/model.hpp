#ifndef WAVE_ENGINE_MODEL_HPP
#define WAVE_ENGINE_MODEL_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace http::model {
    // Ordered, case-preserving header list. Lookups are case-insensitive.
    using Headers = std::vector<std::pair<std::string, std::string>>;

    [[nodiscard]] std::optional<std::string> find_header(const Headers& headers, std::string_view name);
    [[nodiscard]] std::vector<std::string> find_all_headers(const Headers& headers, std::string_view name);
    [[nodiscard]] bool has_header(const Headers& headers, std::string_view name);

    // Replaces the first header with the same name (case-insensitive) or appends.
    void set_header(Headers& headers, const std::string& name, const std::string& value);

    struct ProxyEndpoint {
        std::string scheme_ = "http";
        std::string host_;
        long port_ = 0;
        std::string username_;
        std::string password_;

        // scheme://host:port
        [[nodiscard]] std::string to_url() const { return scheme_ + "://" + host_ + ":" + std::to_string(port_); }
    };

    enum class TlsMaterialKind { TRUST_ANCHOR, CLIENT_IDENTITY };

    struct TlsMaterial {
        TlsMaterialKind kind_ = TlsMaterialKind::TRUST_ANCHOR;
        std::string ca_file_;
        std::string cert_file_;
        std::string key_file_;
        std::string pfx_file_;
        std::string passphrase_;
    };

    // Per-dispatch transport options.
    struct DispatchOptions {
        std::optional<ProxyEndpoint> proxy_;
        std::optional<TlsMaterial> tls_;
        bool ignore_certificate_validation_ = false;
        long max_redirects_ = 5;
        long timeout_ms_ = 0;  // 0 = unlimited
    };

    struct Request {
        std::string url_;
        std::string method_ = "GET";
        std::string body_;

        Headers headers_;
    };

    struct Response {
        long status_ = 0;

        std::string status_text_;
        std::string body_;
        std::string effective_url_;

        // headers of the final response, in arrival order
        Headers headers_;
    };
}  // namespace http::model

#endif
