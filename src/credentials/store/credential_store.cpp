#include "credential_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/encoding.hpp"

namespace credentials {
    namespace {
        template <typename T>
        bool name_taken(const std::vector<T>& records, const std::string& name, const std::string& except_id) {
            return std::ranges::any_of(records, [&](const T& r) { return r.name_ == name && r.id_ != except_id; });
        }

        template <typename T>
        std::string insert(std::vector<T>& records, T record, const char* kind) {
            if (name_taken(records, record.name_, "")) {
                throw DuplicateNameError(kind, record.name_);
            }
            if (record.id_.empty()) {
                record.id_ = encoding::random_hex(constants::RECORD_ID_BYTES);
            } else if (std::ranges::any_of(records, [&](const T& r) { return r.id_ == record.id_; })) {
                throw DuplicateIdError(kind, record.id_);
            }
            std::string id = record.id_;
            records.push_back(std::move(record));
            return id;
        }

        template <typename T>
        bool replace(std::vector<T>& records, const T& record, const char* kind) {
            auto it = std::ranges::find_if(records, [&](const T& r) { return r.id_ == record.id_; });
            if (it == records.end()) {
                return false;
            }
            if (name_taken(records, record.name_, record.id_)) {
                throw DuplicateNameError(kind, record.name_);
            }
            *it = record;
            return true;
        }

        template <typename T>
        bool erase_by_id(std::vector<T>& records, const std::string& id) {
            return std::erase_if(records, [&](const T& r) { return r.id_ == id; }) > 0;
        }

        template <typename T>
        std::optional<T> find_by_name(const std::vector<T>& records, const std::string& name) {
            auto it = std::ranges::find_if(records, [&](const T& r) { return r.name_ == name; });
            if (it == records.end()) {
                return std::nullopt;
            }
            return *it;
        }
    }  // namespace

    DuplicateNameError::DuplicateNameError(std::string kind, std::string name)
        : std::runtime_error("Duplicate " + kind + " name \"" + name + "\""), kind_(std::move(kind)), name_(std::move(name)) {}

    DuplicateIdError::DuplicateIdError(std::string kind, std::string id)
        : std::runtime_error("Duplicate " + kind + " id \"" + id + "\""), kind_(std::move(kind)), id_(std::move(id)) {}

    std::vector<AuthEntry> CredentialStore::auths() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return auths_;
    }

    std::vector<ProxyConfig> CredentialStore::proxies() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return proxies_;
    }

    std::vector<CertConfig> CredentialStore::certs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return certs_;
    }

    std::string CredentialStore::add_auth(AuthEntry auth) {
        std::lock_guard<std::mutex> lock(mutex_);
        return insert(auths_, std::move(auth), "auth");
    }

    std::string CredentialStore::add_proxy(ProxyConfig proxy) {
        std::lock_guard<std::mutex> lock(mutex_);
        return insert(proxies_, std::move(proxy), "proxy");
    }

    std::string CredentialStore::add_cert(CertConfig cert) {
        std::lock_guard<std::mutex> lock(mutex_);
        return insert(certs_, std::move(cert), "certificate");
    }

    bool CredentialStore::update_auth(const AuthEntry& auth) {
        std::lock_guard<std::mutex> lock(mutex_);
        return replace(auths_, auth, "auth");
    }

    bool CredentialStore::update_proxy(const ProxyConfig& proxy) {
        std::lock_guard<std::mutex> lock(mutex_);
        return replace(proxies_, proxy, "proxy");
    }

    bool CredentialStore::update_cert(const CertConfig& cert) {
        std::lock_guard<std::mutex> lock(mutex_);
        return replace(certs_, cert, "certificate");
    }

    bool CredentialStore::remove_auth(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return erase_by_id(auths_, id);
    }

    bool CredentialStore::remove_proxy(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return erase_by_id(proxies_, id);
    }

    bool CredentialStore::remove_cert(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return erase_by_id(certs_, id);
    }

    std::optional<AuthEntry> CredentialStore::find_auth_by_id(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::ranges::find_if(auths_, [&](const AuthEntry& a) { return a.id_ == id; });
        if (it == auths_.end()) {
            return std::nullopt;
        }
        return *it;
    }

    std::optional<AuthEntry> CredentialStore::find_auth_by_name(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return find_by_name(auths_, name);
    }

    std::optional<ProxyConfig> CredentialStore::find_proxy_by_name(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return find_by_name(proxies_, name);
    }

    std::optional<CertConfig> CredentialStore::find_cert_by_name(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return find_by_name(certs_, name);
    }

    size_t CredentialStore::sweep_expired_certs(TimePoint now) {
        std::lock_guard<std::mutex> lock(mutex_);
        const size_t removed = std::erase_if(certs_, [&](const CertConfig& c) { return c.is_expired(now); });
        if (removed > 0) {
            spdlog::info("Removed {} expired certificate(s)", removed);
        }
        return removed;
    }
}  // namespace credentials
