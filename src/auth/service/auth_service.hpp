#ifndef WAVE_ENGINE_AUTH_SERVICE_HPP
#define WAVE_ENGINE_AUTH_SERVICE_HPP

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "../../credentials/model/credentials.hpp"
#include "../../utils/placeholders.hpp"
#include "../model/types.hpp"

namespace auth::service {
    struct ResolvedValues {
        std::vector<std::string> resolved_;
        std::vector<std::string> unresolved_;
    };

    // Shared behaviour of every strategy: validation, placeholder resolution and caching hooks.
    class AuthServiceBase {
       public:
        explicit AuthServiceBase(credentials::Clock clock);

        virtual ~AuthServiceBase() = default;
        AuthServiceBase(const AuthServiceBase&) = delete;
        AuthServiceBase& operator=(const AuthServiceBase&) = delete;
        AuthServiceBase(AuthServiceBase&&) = delete;
        AuthServiceBase& operator=(AuthServiceBase&&) = delete;

        virtual AuthOutcome apply_auth(const AuthRequestConfig& config, const credentials::AuthEntry& auth, const placeholders::EnvVars& env_vars,
                                       IRequestSender& sender) = 0;

        [[nodiscard]] virtual credentials::AuthType auth_type() const = 0;

        [[nodiscard]] virtual bool handles_request_internally() const { return false; }

        // Drops cached state for one auth id, or for all of them.
        virtual void clear_cache(const std::optional<std::string>& /*auth_id*/) {}

       protected:
        // Error message when the auth must not be applied to `url`, std::nullopt otherwise.
        [[nodiscard]] std::optional<std::string> validate_auth(const credentials::AuthEntry& auth, const std::string& url) const;

        [[nodiscard]] static ResolvedValues resolve_values(std::initializer_list<std::string> values, const placeholders::EnvVars& env_vars);

        [[nodiscard]] static std::string unresolved_message(const std::vector<std::string>& unresolved);

        [[nodiscard]] static bool has_authorization_header(const http::model::Headers& headers);

        [[nodiscard]] static std::string wrong_type_message(const char* service_name);

        [[nodiscard]] credentials::TimePoint now() const { return clock_(); }

       private:
        credentials::Clock clock_;
    };
}  // namespace auth::service

#endif
