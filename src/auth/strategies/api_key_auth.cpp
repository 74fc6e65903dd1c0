#include "api_key_auth.hpp"

#include "../../utils/encoding.hpp"
#include "../../utils/string_utils.hpp"

namespace auth::strategies {
    ApiKeyAuthService::ApiKeyAuthService(credentials::Clock clock) : AuthServiceBase(std::move(clock)) {}

    AuthOutcome ApiKeyAuthService::apply_auth(const AuthRequestConfig& config, const credentials::AuthEntry& auth, const placeholders::EnvVars& env_vars,
                                              IRequestSender & /*sender*/) {
        const auto* api_key = std::get_if<credentials::ApiKeyAuth>(&auth.details_);
        if (api_key == nullptr) {
            return AuthFailure{.message_ = wrong_type_message("ApiKeyAuthService")};
        }

        if (auto error = validate_auth(auth, config.url_)) {
            return AuthFailure{.message_ = *error};
        }

        auto values = resolve_values({api_key->key_, api_key->value_}, env_vars);
        if (!values.unresolved_.empty()) {
            return AuthFailure{.message_ = unresolved_message(values.unresolved_)};
        }

        const std::string key = string_utils::trim(values.resolved_[0]);
        std::string value = auth.base64_encode_ ? encoding::base64_encode(values.resolved_[1]) : values.resolved_[1];
        if (!api_key->prefix_.empty()) {
            value = api_key->prefix_ + value;
        }

        if (api_key->send_in_ == credentials::ApiKeyLocation::QUERY) {
            return HeaderContribution{.query_params_ = {{key, value}}};
        }

        if (http::model::has_header(config.headers_, key)) {
            return HeaderContribution{};
        }
        return HeaderContribution{.headers_ = {{key, value}}};
    }
}  // namespace auth::strategies
