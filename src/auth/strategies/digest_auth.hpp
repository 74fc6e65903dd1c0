#ifndef WAVE_ENGINE_DIGEST_AUTH_HPP
#define WAVE_ENGINE_DIGEST_AUTH_HPP

#include <functional>
#include <optional>
#include <string>

#include "../cache/ttl_cache.hpp"
#include "../service/auth_service.hpp"

namespace auth::strategies {
    using CnonceGenerator = std::function<std::string()>;

    struct DigestChallenge {
        std::string realm_;
        std::string nonce_;
        std::string qop_;
        std::string opaque_;
        std::string algorithm_;
        bool stale_ = false;
    };

    struct DigestState {
        DigestChallenge challenge_;
        unsigned long nc_ = 1;
    };

    // Parses a `WWW-Authenticate: Digest ...` value. Returns std::nullopt for other schemes.
    // realm and nonce may be empty here; callers fill them from configured defaults.
    [[nodiscard]] std::optional<DigestChallenge> parse_www_authenticate(const std::string& header);

    // Picks one qop from an offered list, preferring "auth" over "auth-int".
    [[nodiscard]] std::string select_qop(const std::string& offered);

    // `Digest username="..", realm="..", nonce="..", uri="..", response=".."` plus algorithm, qop,
    // nc, cnonce and opaque when they apply.
    [[nodiscard]] std::string build_authorization_header(const std::string& method, const std::string& uri, const std::string& body,
                                                         const std::string& username, const std::string& password, const DigestChallenge& challenge,
                                                         unsigned long nc, const std::string& cnonce);

    // Two round trips: an unauthenticated request to collect the 401 challenge, then the
    // authenticated one. The last challenge is cached per auth id and tried first next time.
    // Transport errors propagate to the caller unchanged.
    class DigestAuthService : public service::AuthServiceBase {
       public:
        explicit DigestAuthService(credentials::Clock clock, CnonceGenerator cnonce_generator = {});

        AuthOutcome apply_auth(const AuthRequestConfig& config, const credentials::AuthEntry& auth, const placeholders::EnvVars& env_vars,
                               IRequestSender& sender) override;

        [[nodiscard]] credentials::AuthType auth_type() const override { return credentials::AuthType::DIGEST; }

        [[nodiscard]] bool handles_request_internally() const override { return true; }

        void clear_cache(const std::optional<std::string>& auth_id) override;

       private:
        struct Exchange {
            http::model::Request request_;
            std::string uri_;
            std::string username_;
            std::string password_;
            std::string fixed_cnonce_;
        };

        http::model::Response send_authenticated(const Exchange& exchange, const DigestChallenge& challenge, unsigned long nc, IRequestSender& sender);
        CompletedResponse respond_to_challenge(const Exchange& exchange, const DigestChallenge& challenge, unsigned long nc, const std::string& auth_id,
                                               IRequestSender& sender);
        std::string next_cnonce(const Exchange& exchange) const;

        cache::TtlCache<DigestState> cache_;
        CnonceGenerator cnonce_generator_;
    };
}  // namespace auth::strategies

#endif
