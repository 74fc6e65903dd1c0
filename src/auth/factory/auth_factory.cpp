#include "auth_factory.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "../strategies/api_key_auth.hpp"
#include "../strategies/basic_auth.hpp"
#include "../strategies/digest_auth.hpp"
#include "../strategies/oauth2_refresh_auth.hpp"

namespace auth::factory {
    AuthServiceFactory::AuthServiceFactory(AuthServiceOptions options) : options_(std::move(options)) {}

    std::unique_ptr<service::AuthServiceBase> AuthServiceFactory::create(credentials::AuthType type) const {
        switch (type) {
            case credentials::AuthType::API_KEY:
                return std::make_unique<strategies::ApiKeyAuthService>(options_.clock_);
            case credentials::AuthType::BASIC:
                return std::make_unique<strategies::BasicAuthService>(options_.clock_);
            case credentials::AuthType::DIGEST:
                return std::make_unique<strategies::DigestAuthService>(options_.clock_, options_.cnonce_generator_);
            case credentials::AuthType::OAUTH2_REFRESH:
                return std::make_unique<strategies::OAuth2RefreshService>(options_.clock_, options_.cache_oauth2_tokens_);
        }
        throw std::invalid_argument("Unsupported auth type");
    }

    service::AuthServiceBase& AuthServiceFactory::get_service(credentials::AuthType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = services_.find(type);
        if (it == services_.end()) {
            it = services_.emplace(type, create(type)).first;
        }
        return *it->second;
    }

    bool AuthServiceFactory::handles_request_internally(credentials::AuthType type) { return get_service(type).handles_request_internally(); }

    AuthOutcome AuthServiceFactory::apply(const AuthRequestConfig& config, const credentials::AuthEntry& auth, const placeholders::EnvVars& env_vars,
                                          IRequestSender& sender) {
        auto outcome = get_service(auth.type()).apply_auth(config, auth, env_vars, sender);
        if (const auto* failure = std::get_if<AuthFailure>(&outcome)) {
            spdlog::warn("Auth \"{}\" ({}) failed: {}", auth.name_, credentials::to_string(auth.type()), failure->message_);
        }
        return outcome;
    }

    void AuthServiceFactory::clear_all_caches(const std::optional<std::string>& auth_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [type, service] : services_) {
            service->clear_cache(auth_id);
        }
    }

    void AuthServiceFactory::clear_cache(credentials::AuthType type, const std::optional<std::string>& auth_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = services_.find(type); it != services_.end()) {
            it->second->clear_cache(auth_id);
        }
    }
}  // namespace auth::factory
