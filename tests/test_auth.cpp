#include <gtest/gtest.h>

#include <chrono>
#include <variant>

#include "../src/auth/factory/auth_factory.hpp"
#include "../src/auth/strategies/api_key_auth.hpp"
#include "../src/auth/strategies/basic_auth.hpp"
#include "../src/auth/strategies/oauth2_refresh_auth.hpp"
#include "mocks/mock_http_client.hpp"

using auth::AuthFailure;
using auth::AuthRequestConfig;
using auth::HeaderContribution;
using credentials::AuthEntry;

namespace {
    const credentials::TimePoint FIXED_NOW = std::chrono::system_clock::from_time_t(1700000000);

    credentials::Clock fixed_clock() {
        return [] { return FIXED_NOW; };
    }

    AuthRequestConfig get_request(const std::string& url, http::model::Headers headers = {}) {
        return AuthRequestConfig{.method_ = "GET", .url_ = url, .headers_ = std::move(headers)};
    }

    AuthEntry api_key_entry(credentials::ApiKeyAuth details) { return AuthEntry{.id_ = "k1", .name_ = "key", .details_ = std::move(details)}; }

    AuthEntry basic_entry(const std::string& username, const std::string& password) {
        return AuthEntry{.id_ = "b1", .name_ = "basic", .details_ = credentials::BasicAuth{.username_ = username, .password_ = password}};
    }

    AuthEntry oauth2_entry() {
        return AuthEntry{
            .id_ = "o1",
            .name_ = "oauth",
            .details_ =
                credentials::OAuth2RefreshAuth{
                    .token_url_ = "https://auth.example.com/token",
                    .client_id_ = "client",
                    .client_secret_ = "{{secret}}",
                    .refresh_token_ = "refresh-1",
                },
        };
    }

    const HeaderContribution& contribution_of(const auth::AuthOutcome& outcome) { return std::get<HeaderContribution>(outcome); }

    std::string failure_of(const auth::AuthOutcome& outcome) { return std::get<AuthFailure>(outcome).message_; }

    class AuthStrategyTest : public ::testing::Test {
       protected:
        mocks::MockTransport transport_;
        mocks::MockRequestSender sender_{transport_};
    };
}  // namespace

TEST_F(AuthStrategyTest, ApiKeyAddsHeader) {
    auth::strategies::ApiKeyAuthService service(fixed_clock());
    const auto outcome =
        service.apply_auth(get_request("https://api.example.com"), api_key_entry({.key_ = " X-Api-Key ", .value_ = "{{key}}", .prefix_ = "Token "}),
                           {{"key", "s3cret"}}, sender_);

    const auto& contribution = contribution_of(outcome);
    ASSERT_EQ(contribution.headers_.size(), 1U);
    EXPECT_EQ(contribution.headers_[0].first, "X-Api-Key");
    EXPECT_EQ(contribution.headers_[0].second, "Token s3cret");
    EXPECT_TRUE(contribution.query_params_.empty());
}

TEST_F(AuthStrategyTest, ApiKeyNeverOverwritesExistingHeader) {
    auth::strategies::ApiKeyAuthService service(fixed_clock());
    const auto outcome = service.apply_auth(get_request("https://api.example.com", {{"x-api-key", "mine"}}),
                                            api_key_entry({.key_ = "X-Api-Key", .value_ = "theirs"}), {}, sender_);

    EXPECT_TRUE(contribution_of(outcome).headers_.empty());
}

TEST_F(AuthStrategyTest, ApiKeyInQueryWithBase64) {
    auth::strategies::ApiKeyAuthService service(fixed_clock());
    auto entry = api_key_entry({.key_ = "token", .value_ = "user:pass", .send_in_ = credentials::ApiKeyLocation::QUERY});
    entry.base64_encode_ = true;

    const auto outcome = service.apply_auth(get_request("https://api.example.com"), entry, {}, sender_);

    const auto& contribution = contribution_of(outcome);
    EXPECT_TRUE(contribution.headers_.empty());
    ASSERT_EQ(contribution.query_params_.size(), 1U);
    EXPECT_EQ(contribution.query_params_[0].second, "dXNlcjpwYXNz");
}

TEST_F(AuthStrategyTest, UnresolvedPlaceholdersFail) {
    auth::strategies::ApiKeyAuthService service(fixed_clock());
    const auto outcome =
        service.apply_auth(get_request("https://api.example.com"), api_key_entry({.key_ = "{{header}}", .value_ = "{{value}}"}), {}, sender_);

    EXPECT_EQ(failure_of(outcome), "Unresolved placeholders: header, value");
}

TEST_F(AuthStrategyTest, BasicEncodesCredentials) {
    auth::strategies::BasicAuthService service(fixed_clock());
    const auto outcome = service.apply_auth(get_request("https://api.example.com"), basic_entry("{{user}}", "pass"), {{"user", "user"}}, sender_);

    const auto& contribution = contribution_of(outcome);
    ASSERT_EQ(contribution.headers_.size(), 1U);
    EXPECT_EQ(contribution.headers_[0].first, "Authorization");
    EXPECT_EQ(contribution.headers_[0].second, "Basic dXNlcjpwYXNz");
}

TEST_F(AuthStrategyTest, BasicSkipsWhenAuthorizationPresent) {
    auth::strategies::BasicAuthService service(fixed_clock());
    const auto outcome = service.apply_auth(get_request("https://api.example.com", {{"authorization", "Bearer x"}}), basic_entry("u", "p"), {}, sender_);

    EXPECT_TRUE(contribution_of(outcome).headers_.empty());
}

TEST_F(AuthStrategyTest, ValidationFailures) {
    auth::strategies::BasicAuthService service(fixed_clock());

    auto disabled = basic_entry("u", "p");
    disabled.enabled_ = false;
    EXPECT_EQ(failure_of(service.apply_auth(get_request("https://a.com"), disabled, {}, sender_)), "Auth is disabled");

    auto expired = basic_entry("u", "p");
    expired.expiry_date_ = FIXED_NOW;
    EXPECT_EQ(failure_of(service.apply_auth(get_request("https://a.com"), expired, {}, sender_)), "Auth \"basic\" is expired");

    auto scoped = basic_entry("u", "p");
    scoped.domain_filters_ = {"*.internal"};
    EXPECT_EQ(failure_of(service.apply_auth(get_request("https://a.com"), scoped, {}, sender_)), "Auth \"basic\" does not match domain");

    EXPECT_EQ(failure_of(service.apply_auth(get_request("https://a.com"), oauth2_entry(), {}, sender_)), "Invalid auth type for BasicAuthService");
}

TEST(OAuth2TokenResponseTest, ParsesDefaults) {
    const auto token = auth::strategies::parse_token_response(R"({"access_token":"abc"})", FIXED_NOW);

    EXPECT_EQ(token.access_token_, "abc");
    EXPECT_EQ(token.token_type_, "Bearer");
    EXPECT_EQ(token.expires_at_, FIXED_NOW + std::chrono::seconds(300));
}

TEST(OAuth2TokenResponseTest, RejectsMissingToken) {
    EXPECT_THROW((void)auth::strategies::parse_token_response(R"({"token_type":"Bearer"})", FIXED_NOW), std::runtime_error);
    EXPECT_THROW((void)auth::strategies::parse_token_response("not json", FIXED_NOW), std::runtime_error);
}

TEST(OAuth2TokenResponseTest, ErrorMessages) {
    EXPECT_EQ(auth::strategies::token_error_message(mocks::make_response(400, R"({"error":"invalid_grant","error_description":"Token revoked"})")),
              "Error calling token endpoint: Token revoked");
    EXPECT_EQ(auth::strategies::token_error_message(mocks::make_response(400, R"({"error":"invalid_grant"})")),
              "Error calling token endpoint: invalid_grant");
    EXPECT_EQ(auth::strategies::token_error_message(mocks::make_response(502, "<html>")), "Error calling token endpoint: Token refresh failed with status 502");
}

TEST_F(AuthStrategyTest, OAuth2RefreshPostsFormAndSetsHeader) {
    auth::strategies::OAuth2RefreshService service(fixed_clock());
    transport_.enqueue(mocks::make_response(200, R"({"access_token":"tok","token_type":"MAC","expires_in":3600})"));

    const auto outcome = service.apply_auth(get_request("https://api.example.com"), oauth2_entry(), {{"secret", "shh"}}, sender_);

    const auto& contribution = contribution_of(outcome);
    ASSERT_EQ(contribution.headers_.size(), 1U);
    EXPECT_EQ(contribution.headers_[0].second, "MAC tok");

    const auto exchanges = transport_.exchanges();
    ASSERT_EQ(exchanges.size(), 1U);
    const auto& token_request = exchanges[0].request_;
    EXPECT_EQ(token_request.method_, "POST");
    EXPECT_EQ(token_request.url_, "https://auth.example.com/token");
    EXPECT_EQ(token_request.body_, "grant_type=refresh_token&refresh_token=refresh-1&client_id=client&client_secret=shh");
    EXPECT_EQ(http::model::find_header(token_request.headers_, "content-type"), "application/x-www-form-urlencoded");
}

TEST_F(AuthStrategyTest, OAuth2RefreshesEveryTimeByDefault) {
    auth::strategies::OAuth2RefreshService service(fixed_clock());
    transport_.set_handler([](const http::model::Request&) { return mocks::make_response(200, R"({"access_token":"tok"})"); });

    (void)service.apply_auth(get_request("https://api.example.com"), oauth2_entry(), {{"secret", "s"}}, sender_);
    (void)service.apply_auth(get_request("https://api.example.com"), oauth2_entry(), {{"secret", "s"}}, sender_);

    EXPECT_EQ(transport_.exchange_count(), 2U);
}

TEST_F(AuthStrategyTest, OAuth2CachesTokensWhenEnabled) {
    auth::strategies::OAuth2RefreshService service(fixed_clock(), true);
    transport_.set_handler([](const http::model::Request&) { return mocks::make_response(200, R"({"access_token":"tok","expires_in":3600})"); });

    (void)service.apply_auth(get_request("https://api.example.com"), oauth2_entry(), {{"secret", "s"}}, sender_);
    const auto outcome = service.apply_auth(get_request("https://api.example.com"), oauth2_entry(), {{"secret", "s"}}, sender_);

    EXPECT_EQ(transport_.exchange_count(), 1U);
    EXPECT_EQ(contribution_of(outcome).headers_[0].second, "Bearer tok");

    service.clear_cache(std::nullopt);
    (void)service.apply_auth(get_request("https://api.example.com"), oauth2_entry(), {{"secret", "s"}}, sender_);
    EXPECT_EQ(transport_.exchange_count(), 2U);
}

TEST_F(AuthStrategyTest, OAuth2EndpointErrorBecomesFailure) {
    auth::strategies::OAuth2RefreshService service(fixed_clock());
    transport_.enqueue(mocks::make_response(401, R"({"error":"invalid_client"})"));

    const auto outcome = service.apply_auth(get_request("https://api.example.com"), oauth2_entry(), {{"secret", "s"}}, sender_);

    EXPECT_EQ(failure_of(outcome), "Error calling token endpoint: invalid_client");
}

TEST_F(AuthStrategyTest, OAuth2TransportErrorBecomesFailure) {
    auth::strategies::OAuth2RefreshService service(fixed_clock());

    const auto outcome = service.apply_auth(get_request("https://api.example.com"), oauth2_entry(), {{"secret", "s"}}, sender_);

    EXPECT_EQ(failure_of(outcome), "No scripted response");
}

TEST(AuthServiceFactoryTest, CreatesOneServicePerType) {
    auth::factory::AuthServiceFactory factory(auth::factory::AuthServiceOptions{.clock_ = fixed_clock()});

    auto& first = factory.get_service(credentials::AuthType::BASIC);
    auto& second = factory.get_service(credentials::AuthType::BASIC);

    EXPECT_EQ(&first, &second);
    EXPECT_EQ(first.auth_type(), credentials::AuthType::BASIC);
    EXPECT_TRUE(factory.handles_request_internally(credentials::AuthType::DIGEST));
    EXPECT_FALSE(factory.handles_request_internally(credentials::AuthType::OAUTH2_REFRESH));
}

TEST(AuthServiceFactoryTest, DispatchesOnAuthType) {
    auth::factory::AuthServiceFactory factory;
    mocks::MockTransport transport;
    mocks::MockRequestSender sender(transport);

    const auto outcome = factory.apply(get_request("https://api.example.com"), basic_entry("user", "pass"), {}, sender);

    EXPECT_EQ(contribution_of(outcome).headers_[0].second, "Basic dXNlcjpwYXNz");
}
