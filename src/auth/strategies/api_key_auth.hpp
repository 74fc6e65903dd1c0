#ifndef WAVE_ENGINE_API_KEY_AUTH_HPP
#define WAVE_ENGINE_API_KEY_AUTH_HPP

#include "../service/auth_service.hpp"

namespace auth::strategies {
    // Sends a key/value pair as a header or a query parameter. An existing header of the same
    // name is never overwritten.
    class ApiKeyAuthService : public service::AuthServiceBase {
       public:
        explicit ApiKeyAuthService(credentials::Clock clock);

        AuthOutcome apply_auth(const AuthRequestConfig& config, const credentials::AuthEntry& auth, const placeholders::EnvVars& env_vars,
                               IRequestSender& sender) override;

        [[nodiscard]] credentials::AuthType auth_type() const override { return credentials::AuthType::API_KEY; }
    };
}  // namespace auth::strategies

#endif
