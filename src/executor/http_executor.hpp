#ifndef WAVE_ENGINE_HTTP_EXECUTOR_HPP
#define WAVE_ENGINE_HTTP_EXECUTOR_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../auth/factory/auth_factory.hpp"
#include "../auth/model/types.hpp"
#include "../cookies/jar/cookie_jar.hpp"
#include "../credentials/model/credentials.hpp"
#include "../credentials/store/credential_store.hpp"
#include "../http/client/interface.hpp"
#include "../http/model/model.hpp"
#include "../utils/constants.hpp"
#include "../utils/placeholders.hpp"

namespace executor {
    using HttpClientFactory = std::function<std::unique_ptr<http::client::IHttpClient>()>;

    // Sourced once by the caller and passed to every execution.
    struct ExecutionSettings {
        long request_timeout_seconds_ = 0;  // 0 = unlimited
        long max_redirects_ = constants::DEFAULT_MAX_REDIRECTS;
        bool ignore_certificate_validation_ = false;
    };

    struct HttpRequestDescriptor {
        std::string id_;
        std::string method_ = "GET";
        std::string url_;
        http::model::Headers headers_;
        auth::QueryParams params_;
        std::string body_;
        std::optional<credentials::AuthEntry> auth_;
        placeholders::EnvVars env_vars_;
    };

    struct HttpResponseResult {
        std::string id_;
        long status_ = 0;
        std::string status_text_;
        long long elapsed_time_ms_ = 0;
        size_t size_bytes_ = 0;
        http::model::Headers headers_;  // lowercase names, one entry per name
        std::string body_;              // Base64
    };

    struct ExecutionResult {
        HttpResponseResult response_;
        std::vector<cookies::Cookie> new_cookies_;
    };

    // Lowercases names and folds repeated headers into one entry: values joined with ", ", or
    // with "\n" for set-cookie.
    [[nodiscard]] http::model::Headers normalize_headers(const http::model::Headers& headers);

    class HttpExecutor {
       public:
        HttpExecutor(HttpClientFactory http_client_factory, const credentials::ICredentialSource& credential_source, cookies::CookieJar& cookie_jar,
                     auth::factory::AuthServiceFactory& auth_services);

        ~HttpExecutor() = default;
        HttpExecutor(const HttpExecutor&) = delete;
        HttpExecutor& operator=(const HttpExecutor&) = delete;
        HttpExecutor(HttpExecutor&&) = delete;
        HttpExecutor& operator=(HttpExecutor&&) = delete;

        // Never throws. Failures come back as a response-shaped result with status 0 unless the
        // transport produced a partial response.
        [[nodiscard]] ExecutionResult execute(const HttpRequestDescriptor& request, const ExecutionSettings& settings) const;

       private:
        [[nodiscard]] http::model::DispatchOptions dispatch_options_for(const std::string& target_url, const ExecutionSettings& settings) const;

        HttpClientFactory http_client_factory_;
        const credentials::ICredentialSource& credential_source_;
        cookies::CookieJar& cookie_jar_;
        auth::factory::AuthServiceFactory& auth_services_;
    };
}  // namespace executor

#endif
