#include "credential_resolver.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <exception>
#include <string_view>

#include "../../utils/url.hpp"
#include "../domain_matcher/domain_matcher.hpp"

namespace credentials {
    namespace {
        struct ProxyScheme {
            std::string_view scheme_;
            long default_port_;
        };

        constexpr std::array<ProxyScheme, 6> PROXY_SCHEMES{{
            {.scheme_ = "http", .default_port_ = 80},
            {.scheme_ = "https", .default_port_ = 443},
            {.scheme_ = "socks4", .default_port_ = 1080},
            {.scheme_ = "socks4a", .default_port_ = 1080},
            {.scheme_ = "socks5", .default_port_ = 1080},
            {.scheme_ = "socks5h", .default_port_ = 1080},
        }};

        std::optional<long> default_port_for(std::string_view scheme) {
            for (const auto& entry : PROXY_SCHEMES) {
                if (entry.scheme_ == scheme) {
                    return entry.default_port_;
                }
            }
            return std::nullopt;
        }
    }  // namespace

    CredentialResolver::CredentialResolver(const ICredentialSource& source, Clock clock) : source_(source), clock_(std::move(clock)) {}

    std::optional<http::model::ProxyEndpoint> CredentialResolver::to_endpoint(const ProxyConfig& proxy) {
        const std::string raw = proxy.url_.find("://") == std::string::npos ? "http://" + proxy.url_ : proxy.url_;

        const auto parts = url::parse(raw);
        if (!parts) {
            spdlog::warn("Proxy \"{}\" has a malformed URL: {}", proxy.name_, proxy.url_);
            return std::nullopt;
        }

        const auto default_port = default_port_for(parts->scheme_);
        if (!default_port) {
            spdlog::warn("Proxy \"{}\" uses unsupported scheme \"{}\"", proxy.name_, parts->scheme_);
            return std::nullopt;
        }

        http::model::ProxyEndpoint endpoint{
            .scheme_ = parts->scheme_,
            .host_ = parts->host_,
            .port_ = parts->port_ > 0 ? parts->port_ : *default_port,
        };

        if (!proxy.username_.empty() && !proxy.password_.empty()) {
            endpoint.username_ = proxy.username_;
            endpoint.password_ = proxy.password_;
        }
        return endpoint;
    }

    std::optional<http::model::ProxyEndpoint> CredentialResolver::resolve_proxy(const std::string& target_url) const {
        try {
            const auto host = url::host_of(target_url);
            if (!host) {
                spdlog::warn("Cannot resolve proxy for malformed URL: {}", target_url);
                return std::nullopt;
            }

            const auto now = clock_();
            for (const auto& proxy : source_.proxies()) {
                if (!proxy.enabled_ || proxy.is_expired(now)) {
                    continue;
                }
                if (!proxy.exclude_domains_.empty() && domain_matcher::CompiledPatterns(proxy.exclude_domains_).matches_host(*host)) {
                    continue;
                }
                if (domain_matcher::CompiledPatterns(proxy.domain_filters_).matches_host(*host)) {
                    return to_endpoint(proxy);
                }
            }
        } catch (const std::exception& e) {
            spdlog::warn("Proxy resolution failed for {}: {}", target_url, e.what());
        }
        return std::nullopt;
    }

    std::optional<http::model::TlsMaterial> CredentialResolver::resolve_cert(const std::string& target_url) const {
        try {
            const auto parts = url::parse(target_url);
            if (!parts) {
                spdlog::warn("Cannot resolve certificate for malformed URL: {}", target_url);
                return std::nullopt;
            }
            if (!parts->is_https()) {
                return std::nullopt;
            }

            const auto now = clock_();
            for (const auto& cert : source_.certs()) {
                if (!cert.enabled_ || cert.is_expired(now)) {
                    continue;
                }
                if (!domain_matcher::CompiledPatterns(cert.domain_filters_).matches_host(parts->host_)) {
                    continue;
                }

                if (cert.type_ == CertType::CA) {
                    return http::model::TlsMaterial{.kind_ = http::model::TlsMaterialKind::TRUST_ANCHOR, .ca_file_ = cert.cert_file_};
                }
                return http::model::TlsMaterial{
                    .kind_ = http::model::TlsMaterialKind::CLIENT_IDENTITY,
                    .cert_file_ = cert.cert_file_,
                    .key_file_ = cert.key_file_,
                    .pfx_file_ = cert.pfx_file_,
                    .passphrase_ = cert.passphrase_,
                };
            }
        } catch (const std::exception& e) {
            spdlog::warn("Certificate resolution failed for {}: {}", target_url, e.what());
        }
        return std::nullopt;
    }

    std::optional<AuthEntry> CredentialResolver::resolve_auth(const std::string& name) const {
        for (const auto& auth : source_.auths()) {
            if (auth.name_ == name) {
                return auth;
            }
        }
        spdlog::warn("No auth named \"{}\"", name);
        return std::nullopt;
    }
}  // namespace credentials
