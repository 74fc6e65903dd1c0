#include "oauth2_refresh_auth.hpp"

#include <simdjson.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>
#include <string_view>

#include "../../utils/constants.hpp"
#include "../../utils/json_parser.hpp"
#include "../../utils/string_utils.hpp"

namespace auth::strategies {
    namespace {
        const json_parser::ParserOptions<std::string_view> ACCESS_TOKEN_PARSER_OPTIONS = {
            .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "No access_token in token response"};
        const json_parser::ParserOptions<std::string_view> TOKEN_TYPE_PARSER_OPTIONS = {
            .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "Bearer", .error_message_ = "Invalid token_type in token response"};
        const json_parser::ParserOptions<int64_t> EXPIRES_IN_PARSER_OPTIONS = {.is_required_ = false,
                                                                               .allowed_values_ = {},
                                                                               .fallback_value_ = constants::DEFAULT_TOKEN_EXPIRES_IN_S,
                                                                               .error_message_ = "Invalid expires_in in token response"};

        bool is_success(long status) { return status >= constants::HTTP_SUCCESS_LOWER_BOUNDARY && status < 300; }
    }  // namespace

    AccessToken parse_token_response(const std::string& body, credentials::TimePoint now) {
        simdjson::ondemand::parser parser;
        simdjson::padded_string json(body);
        simdjson::ondemand::document doc;
        if (parser.iterate(json).get(doc) != simdjson::error_code::SUCCESS) {
            throw std::runtime_error("Invalid token response");
        }
        simdjson::ondemand::object obj;
        if (doc.get_object().get(obj) != simdjson::error_code::SUCCESS) {
            throw std::runtime_error("Invalid token response");
        }

        AccessToken token;
        token.access_token_ = std::string(json_parser::parse_value(obj["access_token"].get_string(), ACCESS_TOKEN_PARSER_OPTIONS));
        if (token.access_token_.empty()) {
            throw std::runtime_error(ACCESS_TOKEN_PARSER_OPTIONS.error_message_);
        }
        token.token_type_ = std::string(json_parser::parse_value(obj["token_type"].get_string(), TOKEN_TYPE_PARSER_OPTIONS));
        if (token.token_type_.empty()) {
            token.token_type_ = TOKEN_TYPE_PARSER_OPTIONS.fallback_value_;
        }

        int64_t expires_in = json_parser::parse_value(obj["expires_in"].get_int64(), EXPIRES_IN_PARSER_OPTIONS);
        if (expires_in <= 0) {
            expires_in = constants::DEFAULT_TOKEN_EXPIRES_IN_S;
        }
        token.expires_at_ = now + std::chrono::seconds(expires_in);
        return token;
    }

    std::string token_error_message(const http::model::Response& resp) {
        std::string detail = "Token refresh failed with status " + std::to_string(resp.status_);

        simdjson::ondemand::parser parser;
        simdjson::padded_string json(resp.body_);
        simdjson::ondemand::document doc;
        simdjson::ondemand::object obj;
        if (parser.iterate(json).get(doc) == simdjson::error_code::SUCCESS && doc.get_object().get(obj) == simdjson::error_code::SUCCESS) {
            std::string_view description;
            std::string_view error;
            if (obj["error_description"].get_string().get(description) == simdjson::error_code::SUCCESS && !description.empty()) {
                detail = std::string(description);
            } else if (obj["error"].get_string().get(error) == simdjson::error_code::SUCCESS && !error.empty()) {
                detail = std::string(error);
            }
        }
        return "Error calling token endpoint: " + detail;
    }

    OAuth2RefreshService::OAuth2RefreshService(credentials::Clock clock, bool cache_tokens)
        : AuthServiceBase(std::move(clock)), cache_tokens_(cache_tokens) {}

    void OAuth2RefreshService::clear_cache(const std::optional<std::string>& auth_id) {
        if (auth_id) {
            cache_.erase(*auth_id);
        } else {
            cache_.clear();
        }
    }

    bool OAuth2RefreshService::is_token_valid(const AccessToken& token) const {
        return now() < token.expires_at_ - std::chrono::seconds(constants::TOKEN_EXPIRY_BUFFER_S);
    }

    AccessToken OAuth2RefreshService::refresh_access_token(const std::string& token_url, const std::string& client_id, const std::string& client_secret,
                                                           const std::string& refresh_token, const std::string& scope, IRequestSender& sender) {
        std::vector<std::pair<std::string, std::string>> form = {
            {"grant_type", "refresh_token"},
            {"refresh_token", refresh_token},
            {"client_id", client_id},
        };
        if (!client_secret.empty()) {
            form.emplace_back("client_secret", client_secret);
        }
        if (!scope.empty()) {
            form.emplace_back("scope", scope);
        }

        const http::model::Request req{
            .url_ = token_url,
            .method_ = "POST",
            .body_ = string_utils::form_encode_pairs(form),
            .headers_ = {{"Content-Type", "application/x-www-form-urlencoded"}, {"Accept", "application/json"}},
        };

        const auto resp = sender.send(req);
        if (!is_success(resp.status_)) {
            throw std::runtime_error(token_error_message(resp));
        }
        return parse_token_response(resp.body_, now());
    }

    AuthOutcome OAuth2RefreshService::apply_auth(const AuthRequestConfig& config, const credentials::AuthEntry& auth, const placeholders::EnvVars& env_vars,
                                                 IRequestSender& sender) {
        const auto* oauth2 = std::get_if<credentials::OAuth2RefreshAuth>(&auth.details_);
        if (oauth2 == nullptr) {
            return AuthFailure{.message_ = wrong_type_message("OAuth2RefreshService")};
        }

        if (auto error = validate_auth(auth, config.url_)) {
            return AuthFailure{.message_ = *error};
        }

        if (has_authorization_header(config.headers_)) {
            return HeaderContribution{};
        }

        auto values = resolve_values({oauth2->token_url_, oauth2->client_id_, oauth2->client_secret_, oauth2->refresh_token_, oauth2->scope_}, env_vars);
        if (!values.unresolved_.empty()) {
            return AuthFailure{.message_ = unresolved_message(values.unresolved_)};
        }

        try {
            if (cache_tokens_) {
                if (auto cached = cache_.get(auth.id_, now()); cached && is_token_valid(*cached)) {
                    return HeaderContribution{.headers_ = {{"Authorization", cached->token_type_ + " " + cached->access_token_}}};
                }
            }

            auto token = refresh_access_token(values.resolved_[0], values.resolved_[1], values.resolved_[2], values.resolved_[3], values.resolved_[4], sender);
            spdlog::debug("Refreshed access token for \"{}\"", auth.name_);

            if (cache_tokens_) {
                cache_.put(auth.id_, token, token.expires_at_);
            }
            return HeaderContribution{.headers_ = {{"Authorization", token.token_type_ + " " + token.access_token_}}};
        } catch (const std::exception& e) {
            return AuthFailure{.message_ = e.what()};
        }
    }
}  // namespace auth::strategies
