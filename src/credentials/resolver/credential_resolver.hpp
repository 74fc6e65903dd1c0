#ifndef WAVE_ENGINE_CREDENTIAL_RESOLVER_HPP
#define WAVE_ENGINE_CREDENTIAL_RESOLVER_HPP

#include <optional>
#include <string>

#include "../../http/model/model.hpp"
#include "../model/credentials.hpp"
#include "../store/credential_store.hpp"

namespace credentials {
    // Selects the credentials that apply to a target URL. The first enabled, unexpired,
    // domain-matching record in stored order wins. Never throws: any failure yields std::nullopt
    // and a log line.
    class CredentialResolver {
       public:
        explicit CredentialResolver(const ICredentialSource& source, Clock clock = [] { return std::chrono::system_clock::now(); });

        [[nodiscard]] std::optional<http::model::ProxyEndpoint> resolve_proxy(const std::string& target_url) const;
        [[nodiscard]] std::optional<http::model::TlsMaterial> resolve_cert(const std::string& target_url) const;
        [[nodiscard]] std::optional<AuthEntry> resolve_auth(const std::string& name) const;

        // Proxy URL -> endpoint. Bare "host:port" is read as http. Returns std::nullopt for an
        // unparseable URL or an unsupported scheme.
        [[nodiscard]] static std::optional<http::model::ProxyEndpoint> to_endpoint(const ProxyConfig& proxy);

       private:
        const ICredentialSource& source_;
        Clock clock_;
    };
}  // namespace credentials

#endif
