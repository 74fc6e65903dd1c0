#ifndef WAVE_ENGINE_OAUTH2_REFRESH_AUTH_HPP
#define WAVE_ENGINE_OAUTH2_REFRESH_AUTH_HPP

#include <string>

#include "../cache/ttl_cache.hpp"
#include "../service/auth_service.hpp"

namespace auth::strategies {
    struct AccessToken {
        std::string access_token_;
        std::string token_type_ = "Bearer";
        credentials::TimePoint expires_at_;
    };

    // Parses a token endpoint response body. Throws std::runtime_error when the body is not JSON
    // or carries no access_token.
    [[nodiscard]] AccessToken parse_token_response(const std::string& body, credentials::TimePoint now);

    // Message for a non-2xx token endpoint response, taken from error_description or error when
    // the body is JSON.
    [[nodiscard]] std::string token_error_message(const http::model::Response& resp);

    // Exchanges a refresh token for an access token and sends it as `Authorization: <type> <token>`.
    // With token caching off (the default) every execution refreshes.
    class OAuth2RefreshService : public service::AuthServiceBase {
       public:
        explicit OAuth2RefreshService(credentials::Clock clock, bool cache_tokens = false);

        AuthOutcome apply_auth(const AuthRequestConfig& config, const credentials::AuthEntry& auth, const placeholders::EnvVars& env_vars,
                               IRequestSender& sender) override;

        [[nodiscard]] credentials::AuthType auth_type() const override { return credentials::AuthType::OAUTH2_REFRESH; }

        void clear_cache(const std::optional<std::string>& auth_id) override;

       private:
        [[nodiscard]] bool is_token_valid(const AccessToken& token) const;

        AccessToken refresh_access_token(const std::string& token_url, const std::string& client_id, const std::string& client_secret,
                                         const std::string& refresh_token, const std::string& scope, IRequestSender& sender);

        bool cache_tokens_;
        cache::TtlCache<AccessToken> cache_;
    };
}  // namespace auth::strategies

#endif
