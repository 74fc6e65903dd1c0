#ifndef WAVE_ENGINE_AUTH_FACTORY_HPP
#define WAVE_ENGINE_AUTH_FACTORY_HPP

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../service/auth_service.hpp"
#include "../strategies/digest_auth.hpp"

namespace auth::factory {
    struct AuthServiceOptions {
        credentials::Clock clock_ = [] { return std::chrono::system_clock::now(); };
        strategies::CnonceGenerator cnonce_generator_;
        bool cache_oauth2_tokens_ = false;
    };

    // One lazily created strategy per auth type, shared by every execution.
    class AuthServiceFactory {
       public:
        explicit AuthServiceFactory(AuthServiceOptions options = {});

        ~AuthServiceFactory() = default;
        AuthServiceFactory(const AuthServiceFactory&) = delete;
        AuthServiceFactory& operator=(const AuthServiceFactory&) = delete;
        AuthServiceFactory(AuthServiceFactory&&) = delete;
        AuthServiceFactory& operator=(AuthServiceFactory&&) = delete;

        [[nodiscard]] service::AuthServiceBase& get_service(credentials::AuthType type);

        [[nodiscard]] bool handles_request_internally(credentials::AuthType type);

        // Runs the strategy matching `auth`'s type.
        AuthOutcome apply(const AuthRequestConfig& config, const credentials::AuthEntry& auth, const placeholders::EnvVars& env_vars, IRequestSender& sender);

        void clear_all_caches(const std::optional<std::string>& auth_id = std::nullopt);
        void clear_cache(credentials::AuthType type, const std::optional<std::string>& auth_id = std::nullopt);

       private:
        std::unique_ptr<service::AuthServiceBase> create(credentials::AuthType type) const;

        AuthServiceOptions options_;
        std::mutex mutex_;
        std::map<credentials::AuthType, std::unique_ptr<service::AuthServiceBase>> services_;
    };
}  // namespace auth::factory

#endif
