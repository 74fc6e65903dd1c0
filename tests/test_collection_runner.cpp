#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../src/cookies/jar/cookie_jar.hpp"
#include "../src/cookies/storage/cookie_storage.hpp"
#include "../src/runner/collection_runner/collection_runner.hpp"
#include "../src/runner/manifest/run_manifest.hpp"
#include "mocks/mock_http_client.hpp"

using batch::ItemStatus;
using executor::HttpRequestDescriptor;
using runner::CollectionRunnerBuilder;
using runner::manifest::RunManifest;

namespace {
    constexpr const char* FULL_MANIFEST = R"({
        "settings": {"request_timeout_seconds": 30, "max_redirects": 2, "ignore_certificate_validation": true, "cookie_jar_path": "/tmp/jar.tsv"},
        "execution": {"concurrent_calls": 2, "delay_between_calls_ms": 10, "stop_on_failure": true},
        "environment": {"base": "https://api.example.com", "token": "t0k"},
        "auths": [
            {"name": "key", "type": "apiKey", "key": "X-Api-Key", "value": "{{token}}", "send_in": "header", "domain_filters": ["*.example.com"]},
            {"name": "login", "type": "basic", "username": "u", "password": "p", "expiry_date": "2099-01-01"},
            {"id": "dg", "name": "dig", "type": "digest", "username": "u", "password": "p", "algorithm": "SHA-256"},
            {"name": "refresh", "type": "oauth2Refresh", "token_url": "https://auth.example.com/token", "client_id": "c", "refresh_token": "r"}
        ],
        "proxies": [{"name": "corp", "url": "socks5://proxy:1080", "exclude_domains": ["localhost"]}],
        "certs": [{"name": "ca", "type": "ca", "cert_file": "/certs/ca.pem", "domain_filters": ["secure.example.com"]}],
        "requests": [
            {"id": "list", "url": "{{base}}/items", "params": {"page": "1"}, "auth": "key"},
            {"id": "create", "method": "POST", "url": "{{base}}/items", "headers": {"Content-Type": "application/json"}, "body": "{\"name\":\"x\"}"}
        ]
    })";

    std::vector<HttpRequestDescriptor> make_requests(size_t count) {
        std::vector<HttpRequestDescriptor> requests;
        for (size_t i = 0; i < count; ++i) {
            requests.push_back(HttpRequestDescriptor{.id_ = "r" + std::to_string(i), .url_ = "https://api.example.com/" + std::to_string(i)});
        }
        return requests;
    }

    std::unique_ptr<runner::CollectionRunner> build_runner(mocks::MockTransport& transport, const batch::ExecutionConfig& config = {}) {
        return CollectionRunnerBuilder()
            .with_http_client_factory(transport.client_factory())
            .with_cookie_jar(std::make_unique<cookies::CookieJar>(std::make_unique<cookies::MemoryCookieStorage>()))
            .with_execution_config(config)
            .validate()
            .build();
    }

    // Answers with the status of the first matching URL suffix, 200 otherwise.
    mocks::MockTransport::Handler status_by_path(std::vector<std::pair<std::string, long>> statuses) {
        return [statuses = std::move(statuses)](const http::model::Request& req) {
            for (const auto& [suffix, status] : statuses) {
                if (req.url_.ends_with(suffix)) {
                    return mocks::make_response(status);
                }
            }
            return mocks::make_response(200);
        };
    }
}  // namespace

TEST(RunManifestTest, ParsesEverySection) {
    RunManifest manifest;
    manifest.parse_string(FULL_MANIFEST);

    EXPECT_EQ(manifest.get_settings().request_timeout_seconds_, 30);
    EXPECT_EQ(manifest.get_settings().max_redirects_, 2);
    EXPECT_TRUE(manifest.get_settings().ignore_certificate_validation_);
    EXPECT_EQ(manifest.get_cookie_jar_path().value_or(""), "/tmp/jar.tsv");

    EXPECT_EQ(manifest.get_execution_config().concurrent_calls_, 2);
    EXPECT_EQ(manifest.get_execution_config().delay_between_calls_ms_, 10);
    EXPECT_TRUE(manifest.get_execution_config().stop_on_failure_);

    EXPECT_EQ(manifest.get_environment().at("token"), "t0k");

    ASSERT_EQ(manifest.get_auths().size(), 4U);
    EXPECT_EQ(manifest.get_auths()[0].type(), credentials::AuthType::API_KEY);
    EXPECT_EQ(manifest.get_auths()[0].id_, "key");
    EXPECT_EQ(manifest.get_auths()[0].domain_filters_, std::vector<std::string>{"*.example.com"});
    EXPECT_TRUE(manifest.get_auths()[1].expiry_date_.has_value());
    EXPECT_EQ(manifest.get_auths()[2].id_, "dg");
    EXPECT_EQ(std::get<credentials::DigestAuth>(manifest.get_auths()[2].details_).algorithm_, "SHA-256");
    EXPECT_EQ(std::get<credentials::OAuth2RefreshAuth>(manifest.get_auths()[3].details_).token_url_, "https://auth.example.com/token");

    ASSERT_EQ(manifest.get_proxies().size(), 1U);
    EXPECT_EQ(manifest.get_proxies()[0].exclude_domains_, std::vector<std::string>{"localhost"});
    ASSERT_EQ(manifest.get_certs().size(), 1U);
    EXPECT_EQ(manifest.get_certs()[0].type_, credentials::CertType::CA);

    const auto& requests = manifest.get_requests();
    ASSERT_EQ(requests.size(), 2U);
    EXPECT_EQ(requests[0].method_, "GET");
    EXPECT_EQ(requests[0].params_.size(), 1U);
    ASSERT_TRUE(requests[0].auth_.has_value());
    EXPECT_EQ(requests[0].auth_->name_, "key");
    EXPECT_EQ(requests[0].env_vars_.at("base"), "https://api.example.com");
    EXPECT_EQ(requests[1].method_, "POST");
    EXPECT_EQ(requests[1].body_, R"({"name":"x"})");
    EXPECT_FALSE(requests[1].auth_.has_value());
}

TEST(RunManifestTest, AppliesDefaults) {
    RunManifest manifest;
    manifest.parse_string(R"({"requests": [{"id": "only", "url": "https://example.com"}]})");

    EXPECT_EQ(manifest.get_settings().max_redirects_, 5);
    EXPECT_EQ(manifest.get_execution_config().concurrent_calls_, 1);
    EXPECT_FALSE(manifest.get_cookie_jar_path().has_value());
    EXPECT_TRUE(manifest.get_auths().empty());
}

TEST(RunManifestTest, RejectsInvalidManifests) {
    const std::vector<std::string> invalid = {
        "not json",
        R"({})",
        R"({"requests": []})",
        R"({"requests": [{"url": "https://example.com"}]})",
        R"({"requests": [{"id": "a", "url": "https://example.com", "method": "FETCH"}]})",
        R"({"requests": [{"id": "a", "url": "https://example.com", "auth": "missing"}]})",
        R"({"requests": [{"id": "a", "url": "x"}, {"id": "a", "url": "y"}]})",
        R"({"auths": [{"name": "a", "type": "kerberos"}], "requests": [{"id": "a", "url": "x"}]})",
        R"({"auths": [{"name": "a", "type": "basic", "expiry_date": "soon"}], "requests": [{"id": "a", "url": "x"}]})",
        R"({"execution": {"concurrent_calls": 0}, "requests": [{"id": "a", "url": "x"}]})",
    };

    for (const auto& json : invalid) {
        RunManifest manifest;
        EXPECT_THROW(manifest.parse_string(json), std::runtime_error) << json;
    }
}

TEST(RunManifestTest, PopulatesCredentialStore) {
    RunManifest manifest;
    manifest.parse_string(FULL_MANIFEST);
    credentials::CredentialStore store;

    manifest.populate(store);

    EXPECT_EQ(store.auths().size(), 4U);
    EXPECT_TRUE(store.find_proxy_by_name("corp").has_value());
    EXPECT_TRUE(store.find_cert_by_name("ca").has_value());
}

TEST(RunManifestTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "wave_engine_manifest_test.json";
    {
        std::ofstream out(path);
        out << FULL_MANIFEST;
    }

    RunManifest manifest;
    manifest.load_from_file(path);
    EXPECT_EQ(manifest.get_requests().size(), 2U);
    std::filesystem::remove(path);

    RunManifest missing;
    EXPECT_THROW(missing.load_from_file(path), std::runtime_error);
}

TEST(CollectionRunnerBuilderTest, RequiresClientFactoryAndCookieJar) {
    EXPECT_THROW(CollectionRunnerBuilder().validate(), std::runtime_error);

    mocks::MockTransport transport;
    EXPECT_THROW(CollectionRunnerBuilder().with_http_client_factory(transport.client_factory()).validate(), std::runtime_error);
    EXPECT_THROW(CollectionRunnerBuilder()
                     .with_http_client_factory(transport.client_factory())
                     .with_cookie_jar(std::make_unique<cookies::CookieJar>(std::make_unique<cookies::MemoryCookieStorage>()))
                     .with_execution_config(batch::ExecutionConfig{.concurrent_calls_ = 0})
                     .validate(),
                 std::runtime_error);
}

TEST(ClassifyTest, SuccessRange) {
    EXPECT_EQ(runner::classify(executor::HttpResponseResult{.status_ = 200}), ItemStatus::SUCCESS);
    EXPECT_EQ(runner::classify(executor::HttpResponseResult{.status_ = 302}), ItemStatus::SUCCESS);
    EXPECT_EQ(runner::classify(executor::HttpResponseResult{.status_ = 404}), ItemStatus::FAILED);
    EXPECT_EQ(runner::classify(executor::HttpResponseResult{.status_ = 0}), ItemStatus::FAILED);
}

TEST(ResolvePlaceholdersTest, ResolvesEveryField) {
    const auto resolved = runner::resolve_placeholders(HttpRequestDescriptor{
        .id_ = "r",
        .url_ = "{{base}}/items",
        .headers_ = {{"Authorization", "Bearer {{token}}"}},
        .params_ = {{"q", "{{query}}"}},
        .body_ = R"({"t":"{{token}}"})",
        .env_vars_ = {{"base", "https://h"}, {"token", "abc"}, {"query", "x"}},
    });

    EXPECT_EQ(resolved.url_, "https://h/items");
    EXPECT_EQ(resolved.headers_[0].second, "Bearer abc");
    EXPECT_EQ(resolved.params_[0].second, "x");
    EXPECT_EQ(resolved.body_, R"({"t":"abc"})");
}

TEST(CollectionRunnerTest, ReportsResultsInInputOrder) {
    mocks::MockTransport transport;
    transport.set_handler(status_by_path({{"/1", 404}}));
    auto collection_runner = build_runner(transport, batch::ExecutionConfig{.concurrent_calls_ = 3});

    const auto report = collection_runner->run(make_requests(5));

    ASSERT_EQ(report.results_.size(), 5U);
    for (size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(report.results_[i].id_, "r" + std::to_string(i));
    }
    EXPECT_EQ(report.results_[1].status_, ItemStatus::FAILED);
    EXPECT_EQ(report.results_[0].status_, ItemStatus::SUCCESS);
    EXPECT_EQ(report.progress_.passed_, 4U);
    EXPECT_EQ(report.progress_.failed_, 1U);
    EXPECT_FALSE(report.stopped_on_failure_);
    EXPECT_GE(report.average_time_ms_, 0.0);
    EXPECT_EQ(transport.exchange_count(), 5U);
}

TEST(CollectionRunnerTest, UnrunRequestsAreSkippedAfterStopOnFailure) {
    mocks::MockTransport transport;
    transport.set_handler(status_by_path({{"/0", 500}}));
    auto collection_runner = build_runner(transport, batch::ExecutionConfig{.concurrent_calls_ = 2, .stop_on_failure_ = true});

    const auto report = collection_runner->run(make_requests(5));

    ASSERT_EQ(report.results_.size(), 5U);
    EXPECT_TRUE(report.stopped_on_failure_);
    EXPECT_EQ(report.results_[0].status_, ItemStatus::FAILED);
    EXPECT_EQ(report.results_[1].status_, ItemStatus::SUCCESS);
    for (size_t i = 2; i < 5; ++i) {
        EXPECT_EQ(report.results_[i].status_, ItemStatus::SKIPPED);
        EXPECT_FALSE(report.results_[i].response_.has_value());
    }
    EXPECT_EQ(report.progress_.skipped_, 3U);
    EXPECT_EQ(report.progress_.completed_, 5U);
    EXPECT_EQ(transport.exchange_count(), 2U);
}

TEST(CollectionRunnerTest, CancelledRunMarksRemainingRequests) {
    mocks::MockTransport transport;
    transport.set_handler(status_by_path({}));
    auto collection_runner = build_runner(transport, batch::ExecutionConfig{.concurrent_calls_ = 1});

    batch::BatchCallbacks<runner::RequestRunResult> callbacks;
    callbacks.on_batch_complete_ = [&collection_runner](const std::vector<runner::RequestRunResult>&) { collection_runner->cancel(); };

    const auto report = collection_runner->run(make_requests(3), callbacks);

    EXPECT_TRUE(report.cancelled_);
    ASSERT_EQ(report.results_.size(), 3U);
    EXPECT_EQ(report.results_[0].status_, ItemStatus::SUCCESS);
    EXPECT_EQ(report.results_[1].status_, ItemStatus::CANCELLED);
    EXPECT_EQ(report.results_[2].status_, ItemStatus::CANCELLED);
    EXPECT_EQ(transport.exchange_count(), 1U);
}

TEST(CollectionRunnerTest, ResolvesEnvironmentAndAuthFromManifest) {
    RunManifest manifest;
    manifest.parse_string(FULL_MANIFEST);
    mocks::MockTransport transport;
    transport.set_handler(status_by_path({}));

    auto credential_store = std::make_unique<credentials::CredentialStore>();
    manifest.populate(*credential_store);
    auto collection_runner = CollectionRunnerBuilder()
                                 .with_http_client_factory(transport.client_factory())
                                 .with_credential_store(std::move(credential_store))
                                 .with_cookie_jar(std::make_unique<cookies::CookieJar>(std::make_unique<cookies::MemoryCookieStorage>()))
                                 .with_settings(manifest.get_settings())
                                 .validate()
                                 .build();

    const auto report = collection_runner->run(manifest.get_requests());

    ASSERT_EQ(report.results_.size(), 2U);
    const auto exchanges = transport.exchanges();
    ASSERT_EQ(exchanges.size(), 2U);
    for (const auto& exchange : exchanges) {
        EXPECT_EQ(exchange.options_.timeout_ms_, 30000);
        ASSERT_TRUE(exchange.options_.proxy_.has_value());
        EXPECT_EQ(exchange.options_.proxy_->scheme_, "socks5");
        if (exchange.request_.url_ == "https://api.example.com/items?page=1") {
            EXPECT_EQ(http::model::find_header(exchange.request_.headers_, "X-Api-Key").value_or(""), "t0k");
        } else {
            EXPECT_EQ(exchange.request_.method_, "POST");
            EXPECT_EQ(exchange.request_.url_, "https://api.example.com/items");
        }
    }
}
