#ifndef WAVE_ENGINE_HTTP_ERROR_HPP
#define WAVE_ENGINE_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

#include "../model/model.hpp"

namespace http::http_error {
    // Thrown by a transport when no complete response could be obtained (DNS, connect, TLS,
    // timeout, too many redirects). Whatever the transport received is kept in partial_.
    struct TransportError : public std::runtime_error {
        std::string url_;
        http::model::Response partial_;

        explicit TransportError(std::string u, http::model::Response partial, const std::string& msg);

        [[nodiscard]] bool has_partial_response() const { return partial_.status_ > 0; }
    };
}  // namespace http::http_error

#endif
