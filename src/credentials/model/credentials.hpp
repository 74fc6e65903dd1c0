#ifndef WAVE_ENGINE_CREDENTIALS_HPP
#define WAVE_ENGINE_CREDENTIALS_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace credentials {
    using TimePoint = std::chrono::system_clock::time_point;
    using Clock = std::function<TimePoint()>;

    enum class AuthType { API_KEY, BASIC, DIGEST, OAUTH2_REFRESH };

    enum class ApiKeyLocation { HEADER, QUERY };

    struct ApiKeyAuth {
        std::string key_;
        std::string value_;
        ApiKeyLocation send_in_ = ApiKeyLocation::HEADER;
        std::string prefix_;  // e.g. "Bearer ", "Token "
    };

    struct BasicAuth {
        std::string username_;
        std::string password_;
    };

    // Optional fields pre-populate the challenge when the server omits them.
    struct DigestAuth {
        std::string username_;
        std::string password_;
        std::string realm_;
        std::string nonce_;
        std::string algorithm_;  // MD5, MD5-sess, SHA-256, SHA-256-sess
        std::string qop_;        // auth, auth-int
        std::string nc_;
        std::string cnonce_;
        std::string opaque_;
    };

    struct OAuth2RefreshAuth {
        std::string token_url_;
        std::string client_id_;
        std::string client_secret_;
        std::string refresh_token_;
        std::string scope_;
    };

    using AuthDetails = std::variant<ApiKeyAuth, BasicAuth, DigestAuth, OAuth2RefreshAuth>;

    struct AuthEntry {
        std::string id_;
        std::string name_;
        bool enabled_ = true;
        std::vector<std::string> domain_filters_;
        std::optional<TimePoint> expiry_date_;
        bool base64_encode_ = false;

        AuthDetails details_;

        [[nodiscard]] AuthType type() const { return static_cast<AuthType>(details_.index()); }
        [[nodiscard]] bool is_expired(TimePoint now) const { return expiry_date_.has_value() && *expiry_date_ < now; }
    };

    struct ProxyConfig {
        std::string id_;
        std::string name_;
        bool enabled_ = true;
        std::vector<std::string> domain_filters_;
        std::vector<std::string> exclude_domains_;
        std::string url_;
        std::string username_;
        std::string password_;
        std::optional<TimePoint> expiry_date_;

        [[nodiscard]] bool is_expired(TimePoint now) const { return expiry_date_.has_value() && *expiry_date_ < now; }
    };

    enum class CertType { CA, SELF_SIGNED };

    struct CertConfig {
        std::string id_;
        std::string name_;
        bool enabled_ = true;
        std::vector<std::string> domain_filters_;
        std::optional<TimePoint> expiry_date_;

        CertType type_ = CertType::CA;
        std::string cert_file_;  // CA file for CertType::CA
        std::string key_file_;
        std::string pfx_file_;
        std::string passphrase_;

        [[nodiscard]] bool is_expired(TimePoint now) const { return expiry_date_.has_value() && *expiry_date_ < now; }
    };

    [[nodiscard]] const char* to_string(AuthType type);
}  // namespace credentials

#endif
