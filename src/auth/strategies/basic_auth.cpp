#include "basic_auth.hpp"

#include "../../utils/encoding.hpp"

namespace auth::strategies {
    BasicAuthService::BasicAuthService(credentials::Clock clock) : AuthServiceBase(std::move(clock)) {}

    AuthOutcome BasicAuthService::apply_auth(const AuthRequestConfig& config, const credentials::AuthEntry& auth, const placeholders::EnvVars& env_vars,
                                             IRequestSender & /*sender*/) {
        const auto* basic = std::get_if<credentials::BasicAuth>(&auth.details_);
        if (basic == nullptr) {
            return AuthFailure{.message_ = wrong_type_message("BasicAuthService")};
        }

        if (auto error = validate_auth(auth, config.url_)) {
            return AuthFailure{.message_ = *error};
        }

        // an explicit Authorization header wins
        if (has_authorization_header(config.headers_)) {
            return HeaderContribution{};
        }

        auto values = resolve_values({basic->username_, basic->password_}, env_vars);
        if (!values.unresolved_.empty()) {
            return AuthFailure{.message_ = unresolved_message(values.unresolved_)};
        }

        const std::string user_pass = values.resolved_[0] + ":" + values.resolved_[1];
        return HeaderContribution{.headers_ = {{"Authorization", "Basic " + encoding::base64_encode(user_pass)}}};
    }
}  // namespace auth::strategies
