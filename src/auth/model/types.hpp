#ifndef WAVE_ENGINE_AUTH_TYPES_HPP
#define WAVE_ENGINE_AUTH_TYPES_HPP

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "../../http/model/model.hpp"

namespace auth {
    using QueryParams = std::vector<std::pair<std::string, std::string>>;

    // The outgoing request as the auth layer sees it. `url_` already carries the query string.
    struct AuthRequestConfig {
        std::string method_;
        std::string url_;
        http::model::Headers headers_;
        std::string body_;
    };

    // Headers and query parameters to merge into the outgoing request. Both may be empty.
    struct HeaderContribution {
        http::model::Headers headers_;
        QueryParams query_params_;
    };

    // The strategy dispatched the request itself; the caller must not dispatch again.
    struct CompletedResponse {
        http::model::Response response_;
    };

    struct AuthFailure {
        std::string message_;
    };

    using AuthOutcome = std::variant<HeaderContribution, CompletedResponse, AuthFailure>;

    // Dispatch capability handed to strategies that talk to the network (Digest, OAuth2).
    // Implementations resolve proxy and TLS material for each request's own URL and apply
    // transport settings, but neither cookies nor auth.
    class IRequestSender {
       public:
        IRequestSender() = default;
        virtual ~IRequestSender() = default;
        IRequestSender(const IRequestSender&) = delete;
        IRequestSender& operator=(const IRequestSender&) = delete;
        IRequestSender(IRequestSender&&) = delete;
        IRequestSender& operator=(IRequestSender&&) = delete;

        // Throws http::http_error::TransportError when no response could be obtained.
        virtual http::model::Response send(const http::model::Request& req) = 0;
    };
}  // namespace auth

#endif
