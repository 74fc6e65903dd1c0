#include "auth_service.hpp"

#include "../../credentials/domain_matcher/domain_matcher.hpp"
#include "../../utils/string_utils.hpp"

namespace auth::service {
    AuthServiceBase::AuthServiceBase(credentials::Clock clock) : clock_(std::move(clock)) {}

    std::optional<std::string> AuthServiceBase::validate_auth(const credentials::AuthEntry& auth, const std::string& url) const {
        if (!auth.enabled_) {
            return "Auth is disabled";
        }

        if (auth.expiry_date_.has_value() && now() >= *auth.expiry_date_) {
            return "Auth \"" + auth.name_ + "\" is expired";
        }

        if (!credentials::domain_matcher::matches(url, auth.domain_filters_)) {
            return "Auth \"" + auth.name_ + "\" does not match domain";
        }

        return std::nullopt;
    }

    ResolvedValues AuthServiceBase::resolve_values(std::initializer_list<std::string> values, const placeholders::EnvVars& env_vars) {
        ResolvedValues out;
        for (const auto& value : values) {
            auto resolution = placeholders::resolve(value, env_vars);
            out.resolved_.push_back(std::move(resolution.resolved_));
            out.unresolved_.insert(out.unresolved_.end(), resolution.unresolved_.begin(), resolution.unresolved_.end());
        }
        return out;
    }

    std::string AuthServiceBase::unresolved_message(const std::vector<std::string>& unresolved) {
        return "Unresolved placeholders: " + string_utils::join(unresolved, ", ");
    }

    bool AuthServiceBase::has_authorization_header(const http::model::Headers& headers) { return http::model::has_header(headers, "Authorization"); }

    std::string AuthServiceBase::wrong_type_message(const char* service_name) { return std::string("Invalid auth type for ") + service_name; }
}  // namespace auth::service
