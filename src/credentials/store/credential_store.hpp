#ifndef WAVE_ENGINE_CREDENTIAL_STORE_HPP
#define WAVE_ENGINE_CREDENTIAL_STORE_HPP

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../model/credentials.hpp"

namespace credentials {
    struct DuplicateNameError : public std::runtime_error {
        std::string kind_;
        std::string name_;

        DuplicateNameError(std::string kind, std::string name);
    };

    struct DuplicateIdError : public std::runtime_error {
        std::string kind_;
        std::string id_;

        DuplicateIdError(std::string kind, std::string id);
    };

    // Read side consumed by the resolver. Each accessor returns a snapshot in stored order.
    class ICredentialSource {
       public:
        ICredentialSource() = default;
        virtual ~ICredentialSource() = default;
        ICredentialSource(const ICredentialSource&) = delete;
        ICredentialSource& operator=(const ICredentialSource&) = delete;
        ICredentialSource(ICredentialSource&&) = delete;
        ICredentialSource& operator=(ICredentialSource&&) = delete;

        [[nodiscard]] virtual std::vector<AuthEntry> auths() const = 0;
        [[nodiscard]] virtual std::vector<ProxyConfig> proxies() const = 0;
        [[nodiscard]] virtual std::vector<CertConfig> certs() const = 0;
    };

    // In-memory, thread-safe credential records. Names are unique per kind (case-sensitive).
    class CredentialStore : public ICredentialSource {
       public:
        CredentialStore() = default;

        ~CredentialStore() override = default;
        CredentialStore(const CredentialStore&) = delete;
        CredentialStore& operator=(const CredentialStore&) = delete;
        CredentialStore(CredentialStore&&) = delete;
        CredentialStore& operator=(CredentialStore&&) = delete;

        [[nodiscard]] std::vector<AuthEntry> auths() const override;
        [[nodiscard]] std::vector<ProxyConfig> proxies() const override;
        [[nodiscard]] std::vector<CertConfig> certs() const override;

        // add_* throws DuplicateNameError when the name is taken and DuplicateIdError when a
        // caller-supplied id is. An empty id is replaced by a generated one; the stored id is returned.
        std::string add_auth(AuthEntry auth);
        std::string add_proxy(ProxyConfig proxy);
        std::string add_cert(CertConfig cert);

        // update_* replaces the record with the same id. Returns false when no such record exists.
        bool update_auth(const AuthEntry& auth);
        bool update_proxy(const ProxyConfig& proxy);
        bool update_cert(const CertConfig& cert);

        bool remove_auth(const std::string& id);
        bool remove_proxy(const std::string& id);
        bool remove_cert(const std::string& id);

        [[nodiscard]] std::optional<AuthEntry> find_auth_by_id(const std::string& id) const;
        [[nodiscard]] std::optional<AuthEntry> find_auth_by_name(const std::string& name) const;
        [[nodiscard]] std::optional<ProxyConfig> find_proxy_by_name(const std::string& name) const;
        [[nodiscard]] std::optional<CertConfig> find_cert_by_name(const std::string& name) const;

        // Deletes certificates whose expiry date is before `now`; returns how many were removed.
        size_t sweep_expired_certs(TimePoint now);

       private:
        mutable std::mutex mutex_;

        std::vector<AuthEntry> auths_;
        std::vector<ProxyConfig> proxies_;
        std::vector<CertConfig> certs_;
    };
}  // namespace credentials

#endif
