#ifndef WAVE_ENGINE_BASIC_AUTH_HPP
#define WAVE_ENGINE_BASIC_AUTH_HPP

#include "../service/auth_service.hpp"

namespace auth::strategies {
    class BasicAuthService : public service::AuthServiceBase {
       public:
        explicit BasicAuthService(credentials::Clock clock);

        AuthOutcome apply_auth(const AuthRequestConfig& config, const credentials::AuthEntry& auth, const placeholders::EnvVars& env_vars,
                               IRequestSender& sender) override;

        [[nodiscard]] credentials::AuthType auth_type() const override { return credentials::AuthType::BASIC; }
    };
}  // namespace auth::strategies

#endif
