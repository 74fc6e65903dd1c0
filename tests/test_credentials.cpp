#include <gtest/gtest.h>

#include <chrono>

#include "../src/credentials/model/credentials.hpp"
#include "../src/credentials/resolver/credential_resolver.hpp"
#include "../src/credentials/store/credential_store.hpp"

using credentials::AuthEntry;
using credentials::CertConfig;
using credentials::CertType;
using credentials::CredentialResolver;
using credentials::CredentialStore;
using credentials::DuplicateNameError;
using credentials::ProxyConfig;

namespace {
    const credentials::TimePoint FIXED_NOW = std::chrono::system_clock::from_time_t(1700000000);

    credentials::Clock fixed_clock() {
        return [] { return FIXED_NOW; };
    }

    ProxyConfig make_proxy(const std::string& name, const std::string& url, std::vector<std::string> domains = {}) {
        return ProxyConfig{.name_ = name, .domain_filters_ = std::move(domains), .url_ = url};
    }

    AuthEntry make_basic_auth(const std::string& name) {
        return AuthEntry{.name_ = name, .details_ = credentials::BasicAuth{.username_ = "u", .password_ = "p"}};
    }
}  // namespace

TEST(CredentialStoreTest, AddGeneratesIdAndRejectsDuplicateNames) {
    CredentialStore store;

    const auto id = store.add_auth(make_basic_auth("main"));
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(store.find_auth_by_id(id)->name_, "main");

    EXPECT_THROW(store.add_auth(make_basic_auth("main")), DuplicateNameError);
    EXPECT_NO_THROW(store.add_auth(make_basic_auth("Main")));
    EXPECT_EQ(store.auths().size(), 2U);
}

TEST(CredentialStoreTest, DuplicateNameErrorMessage) {
    CredentialStore store;
    store.add_proxy(make_proxy("corp", "proxy:3128"));

    try {
        store.add_proxy(make_proxy("corp", "other:3128"));
        FAIL() << "expected DuplicateNameError";
    } catch (const DuplicateNameError& e) {
        EXPECT_STREQ(e.what(), "Duplicate proxy name \"corp\"");
        EXPECT_EQ(e.kind_, "proxy");
    }

    store.add_auth(make_basic_auth("main"));
    try {
        store.add_auth(make_basic_auth("main"));
        FAIL() << "expected DuplicateNameError";
    } catch (const DuplicateNameError& e) {
        EXPECT_STREQ(e.what(), "Duplicate auth name \"main\"");
    }
}

TEST(CredentialStoreTest, RejectsDuplicateSuppliedIds) {
    CredentialStore store;
    auto first = make_basic_auth("first");
    first.id_ = "shared";
    auto second = make_basic_auth("second");
    second.id_ = "shared";

    EXPECT_EQ(store.add_auth(first), "shared");
    try {
        store.add_auth(second);
        FAIL() << "expected DuplicateIdError";
    } catch (const credentials::DuplicateIdError& e) {
        EXPECT_STREQ(e.what(), "Duplicate auth id \"shared\"");
        EXPECT_EQ(e.id_, "shared");
    }
    ASSERT_EQ(store.auths().size(), 1U);

    EXPECT_TRUE(store.remove_auth("shared"));
    EXPECT_TRUE(store.auths().empty());

    auto proxy = make_proxy("corp", "proxy:3128");
    proxy.id_ = "shared";
    EXPECT_EQ(store.add_proxy(proxy), "shared");
}

TEST(CredentialStoreTest, UpdateAndRemove) {
    CredentialStore store;
    const auto first = store.add_auth(make_basic_auth("first"));
    store.add_auth(make_basic_auth("second"));

    auto renamed = *store.find_auth_by_id(first);
    renamed.name_ = "second";
    EXPECT_THROW(store.update_auth(renamed), DuplicateNameError);

    renamed.name_ = "renamed";
    EXPECT_TRUE(store.update_auth(renamed));
    EXPECT_TRUE(store.find_auth_by_name("renamed").has_value());

    renamed.id_ = "missing";
    EXPECT_FALSE(store.update_auth(renamed));

    EXPECT_TRUE(store.remove_auth(first));
    EXPECT_FALSE(store.remove_auth(first));
}

TEST(CredentialStoreTest, SweepsExpiredCertificates) {
    CredentialStore store;
    store.add_cert(CertConfig{.name_ = "old", .expiry_date_ = FIXED_NOW - std::chrono::hours(1)});
    store.add_cert(CertConfig{.name_ = "current", .expiry_date_ = FIXED_NOW + std::chrono::hours(1)});
    store.add_cert(CertConfig{.name_ = "forever"});

    EXPECT_EQ(store.sweep_expired_certs(FIXED_NOW), 1U);
    EXPECT_FALSE(store.find_cert_by_name("old").has_value());
    EXPECT_EQ(store.certs().size(), 2U);
}

TEST(CredentialResolverTest, FirstMatchingProxyWins) {
    CredentialStore store;
    store.add_proxy(make_proxy("specific", "http://first:3128", {"*.example.com"}));
    store.add_proxy(make_proxy("catch-all", "http://second:3128"));
    const CredentialResolver resolver(store, fixed_clock());

    const auto proxy = resolver.resolve_proxy("https://api.example.com/v1");
    ASSERT_TRUE(proxy.has_value());
    EXPECT_EQ(proxy->host_, "first");
    EXPECT_EQ(proxy->port_, 3128);

    const auto other = resolver.resolve_proxy("https://other.org");
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(other->host_, "second");
}

TEST(CredentialResolverTest, SkipsDisabledExpiredAndExcludedProxies) {
    CredentialStore store;
    auto disabled = make_proxy("disabled", "http://disabled:1");
    disabled.enabled_ = false;
    auto expired = make_proxy("expired", "http://expired:1");
    expired.expiry_date_ = FIXED_NOW - std::chrono::seconds(1);
    auto excluding = make_proxy("excluding", "http://excluding:1");
    excluding.exclude_domains_ = {"*.internal"};
    store.add_proxy(disabled);
    store.add_proxy(expired);
    store.add_proxy(excluding);
    const CredentialResolver resolver(store, fixed_clock());

    EXPECT_FALSE(resolver.resolve_proxy("http://db.internal").has_value());
    const auto proxy = resolver.resolve_proxy("http://public.org");
    ASSERT_TRUE(proxy.has_value());
    EXPECT_EQ(proxy->host_, "excluding");
}

TEST(CredentialResolverTest, ProxyEndpointDefaultsAndCredentials) {
    auto bare = make_proxy("bare", "corp-proxy");
    const auto bare_endpoint = CredentialResolver::to_endpoint(bare);
    ASSERT_TRUE(bare_endpoint.has_value());
    EXPECT_EQ(bare_endpoint->scheme_, "http");
    EXPECT_EQ(bare_endpoint->port_, 80);

    auto socks = make_proxy("socks", "socks5://tunnel");
    socks.username_ = "user";
    const auto socks_endpoint = CredentialResolver::to_endpoint(socks);
    ASSERT_TRUE(socks_endpoint.has_value());
    EXPECT_EQ(socks_endpoint->port_, 1080);
    EXPECT_TRUE(socks_endpoint->username_.empty());

    socks.password_ = "secret";
    EXPECT_EQ(CredentialResolver::to_endpoint(socks)->password_, "secret");

    EXPECT_FALSE(CredentialResolver::to_endpoint(make_proxy("ftp", "ftp://files:21")).has_value());
}

TEST(CredentialResolverTest, MalformedTargetResolvesNothing) {
    CredentialStore store;
    store.add_proxy(make_proxy("any", "http://proxy:3128"));
    const CredentialResolver resolver(store, fixed_clock());

    EXPECT_FALSE(resolver.resolve_proxy("").has_value());
}

TEST(CredentialResolverTest, CertificatesOnlyForHttps) {
    CredentialStore store;
    store.add_cert(CertConfig{.name_ = "ca", .domain_filters_ = {"secure.example.com"}, .type_ = CertType::CA, .cert_file_ = "/etc/ca.pem"});
    const CredentialResolver resolver(store, fixed_clock());

    const auto material = resolver.resolve_cert("https://secure.example.com/x");
    ASSERT_TRUE(material.has_value());
    EXPECT_EQ(material->kind_, http::model::TlsMaterialKind::TRUST_ANCHOR);
    EXPECT_EQ(material->ca_file_, "/etc/ca.pem");

    EXPECT_FALSE(resolver.resolve_cert("http://secure.example.com/x").has_value());
    EXPECT_FALSE(resolver.resolve_cert("https://other.example.com/x").has_value());
}

TEST(CredentialResolverTest, ClientIdentityCertificate) {
    CredentialStore store;
    store.add_cert(CertConfig{.name_ = "expired", .expiry_date_ = FIXED_NOW - std::chrono::hours(1), .type_ = CertType::SELF_SIGNED, .pfx_file_ = "old.p12"});
    store.add_cert(CertConfig{.name_ = "client", .type_ = CertType::SELF_SIGNED, .pfx_file_ = "client.p12", .passphrase_ = "pw"});
    const CredentialResolver resolver(store, fixed_clock());

    const auto material = resolver.resolve_cert("https://mtls.example.com");
    ASSERT_TRUE(material.has_value());
    EXPECT_EQ(material->kind_, http::model::TlsMaterialKind::CLIENT_IDENTITY);
    EXPECT_EQ(material->pfx_file_, "client.p12");
    EXPECT_EQ(material->passphrase_, "pw");
}

TEST(CredentialResolverTest, ResolvesAuthByName) {
    CredentialStore store;
    store.add_auth(make_basic_auth("main"));
    const CredentialResolver resolver(store, fixed_clock());

    EXPECT_TRUE(resolver.resolve_auth("main").has_value());
    EXPECT_FALSE(resolver.resolve_auth("missing").has_value());
}
