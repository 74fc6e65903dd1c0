#ifndef WAVE_ENGINE_CLIENT_INTERFACE_HPP
#define WAVE_ENGINE_CLIENT_INTERFACE_HPP

#include "../model/model.hpp"

namespace http::client {
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        // Performs one exchange. Any HTTP status is a response; only transport failures throw
        // http::http_error::TransportError.
        virtual http::model::Response send(const http::model::Request& req, const http::model::DispatchOptions& opts) = 0;
    };
}  // namespace http::client

#endif
