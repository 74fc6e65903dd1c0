#include "http_executor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <stdexcept>

#include "../credentials/resolver/credential_resolver.hpp"
#include "../http/error/http_error.hpp"
#include "../utils/encoding.hpp"
#include "../utils/string_utils.hpp"
#include "../utils/url.hpp"

namespace executor {
    namespace {
        using SteadyClock = std::chrono::steady_clock;

        constexpr const char* SET_COOKIE = "set-cookie";

        using DispatchOptionsForUrl = std::function<http::model::DispatchOptions(const std::string& target_url)>;

        // Dispatch with proxy and TLS material resolved for each request's own URL; no cookies, no auth.
        class DispatchingSender : public auth::IRequestSender {
           public:
            DispatchingSender(http::client::IHttpClient& client, DispatchOptionsForUrl options_for) : client_(client), options_for_(std::move(options_for)) {}

            http::model::Response send(const http::model::Request& req) override {
                auto resp = client_.send(req, options_for_(req.url_));
                spdlog::debug("{} {} -> {}", req.method_, req.url_, resp.status_);
                return resp;
            }

           private:
            http::client::IHttpClient& client_;
            DispatchOptionsForUrl options_for_;
        };

        long long elapsed_ms(SteadyClock::time_point start) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start).count();
        }

        HttpResponseResult error_result(const std::string& id, const std::string& message, long long elapsed, const http::model::Response* partial) {
            HttpResponseResult result{.id_ = id, .status_text_ = constants::ERROR_STATUS_TEXT, .elapsed_time_ms_ = elapsed};

            if (partial != nullptr && partial->status_ > 0) {
                result.status_ = partial->status_;
                if (!partial->status_text_.empty()) {
                    result.status_text_ = partial->status_text_;
                }
                result.headers_ = normalize_headers(partial->headers_);
            }

            const std::string& raw = partial != nullptr && !partial->body_.empty() ? partial->body_ : message;
            result.body_ = encoding::base64_encode(raw);
            result.size_bytes_ = raw.size();
            return result;
        }
    }  // namespace

    http::model::Headers normalize_headers(const http::model::Headers& headers) {
        http::model::Headers out;
        for (const auto& [name, value] : headers) {
            const std::string key = string_utils::to_lower(name);
            auto it = std::ranges::find_if(out, [&](const auto& entry) { return entry.first == key; });
            if (it == out.end()) {
                out.emplace_back(key, value);
                continue;
            }
            it->second += (key == SET_COOKIE ? "\n" : ", ") + value;
        }
        return out;
    }

    HttpExecutor::HttpExecutor(HttpClientFactory http_client_factory, const credentials::ICredentialSource& credential_source, cookies::CookieJar& cookie_jar,
                               auth::factory::AuthServiceFactory& auth_services)
        : http_client_factory_(std::move(http_client_factory)), credential_source_(credential_source), cookie_jar_(cookie_jar), auth_services_(auth_services) {
        if (!http_client_factory_) {
            throw std::invalid_argument("HttpExecutor requires an http client factory");
        }
    }

    http::model::DispatchOptions HttpExecutor::dispatch_options_for(const std::string& target_url, const ExecutionSettings& settings) const {
        const credentials::CredentialResolver resolver(credential_source_);
        return http::model::DispatchOptions{
            .proxy_ = resolver.resolve_proxy(target_url),
            .tls_ = resolver.resolve_cert(target_url),
            .ignore_certificate_validation_ = settings.ignore_certificate_validation_,
            .max_redirects_ = settings.max_redirects_,
            .timeout_ms_ = settings.request_timeout_seconds_ > 0 ? settings.request_timeout_seconds_ * constants::MS_PER_SECOND : 0,
        };
    }

    ExecutionResult HttpExecutor::execute(const HttpRequestDescriptor& request, const ExecutionSettings& settings) const {
        auto start = SteadyClock::now();

        try {
            http::model::Headers headers = request.headers_;
            if (const std::string cookie_header = cookie_jar_.header_for(request.url_); !cookie_header.empty()) {
                http::model::set_header(headers, "Cookie", cookie_header);
            }

            std::string full_url = url::append_query(request.url_, string_utils::form_encode_pairs(request.params_));

            auto client = http_client_factory_();
            DispatchingSender sender(*client, [this, &settings](const std::string& target_url) { return dispatch_options_for(target_url, settings); });

            std::optional<http::model::Response> response;

            if (request.auth_ && request.auth_->enabled_) {
                const auth::AuthRequestConfig auth_config{.method_ = request.method_, .url_ = full_url, .headers_ = headers, .body_ = request.body_};

                start = SteadyClock::now();
                auto outcome = auth_services_.apply(auth_config, *request.auth_, request.env_vars_, sender);

                if (const auto* failure = std::get_if<auth::AuthFailure>(&outcome)) {
                    return ExecutionResult{.response_ = error_result(request.id_, "Auth error: " + failure->message_, elapsed_ms(start), nullptr)};
                }

                if (auto* completed = std::get_if<auth::CompletedResponse>(&outcome)) {
                    response = std::move(completed->response_);
                } else {
                    const auto& contribution = std::get<auth::HeaderContribution>(outcome);
                    for (const auto& [name, value] : contribution.headers_) {
                        http::model::set_header(headers, name, value);
                    }
                    full_url = url::append_query(full_url, string_utils::form_encode_pairs(contribution.query_params_));
                }
            }

            if (!response) {
                const http::model::Request req{.url_ = full_url, .method_ = request.method_, .body_ = request.body_, .headers_ = headers};
                start = SteadyClock::now();
                response = sender.send(req);
            }

            const long long elapsed = elapsed_ms(start);

            auto new_cookies = cookie_jar_.store_from_response(http::model::find_all_headers(response->headers_, SET_COOKIE), request.url_);

            spdlog::debug("{} {} completed with {} in {} ms", request.method_, full_url, response->status_, elapsed);

            return ExecutionResult{
                .response_ =
                    HttpResponseResult{
                        .id_ = request.id_,
                        .status_ = response->status_,
                        .status_text_ = response->status_text_,
                        .elapsed_time_ms_ = elapsed,
                        .size_bytes_ = response->body_.size(),
                        .headers_ = normalize_headers(response->headers_),
                        .body_ = encoding::base64_encode(response->body_),
                    },
                .new_cookies_ = std::move(new_cookies),
            };
        } catch (const http::http_error::TransportError& e) {
            spdlog::error("Request {} to {} failed: {}", request.id_, e.url_, e.what());
            return ExecutionResult{.response_ = error_result(request.id_, e.what(), elapsed_ms(start), &e.partial_)};
        } catch (const std::exception& e) {
            spdlog::error("Request {} failed: {}", request.id_, e.what());
            return ExecutionResult{.response_ = error_result(request.id_, e.what(), elapsed_ms(start), nullptr)};
        }
    }
}  // namespace executor
