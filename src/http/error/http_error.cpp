#include "http_error.hpp"

#include <stdexcept>
#include <string>

namespace http::http_error {
    TransportError::TransportError(std::string u, http::model::Response partial, const std::string& msg)
        : std::runtime_error(msg), url_(std::move(u)), partial_(std::move(partial)) {}
};  // namespace http::http_error
