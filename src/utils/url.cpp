#include "url.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <memory>
#include <string>

#include "constants.hpp"
#include "string_utils.hpp"

namespace url {
    namespace {
        using CurlUrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

        std::optional<std::string> get_part(CURLU* handle, CURLUPart part, unsigned int flags = 0) {
            char* value = nullptr;
            if (curl_url_get(handle, part, &value, flags) != CURLUE_OK || value == nullptr) {
                return std::nullopt;
            }
            std::string out(value);
            curl_free(value);
            return out;
        }
    }  // namespace

    std::optional<UrlParts> parse(const std::string& raw) {
        const std::string trimmed = string_utils::trim(raw);
        if (trimmed.empty()) {
            return std::nullopt;
        }

        CurlUrlHandle handle(curl_url(), &curl_url_cleanup);
        if (!handle) {
            return std::nullopt;
        }

        const unsigned int flags = CURLU_DEFAULT_SCHEME | CURLU_NON_SUPPORT_SCHEME;
        if (curl_url_set(handle.get(), CURLUPART_URL, trimmed.c_str(), flags) != CURLUE_OK) {
            return std::nullopt;
        }

        auto host = get_part(handle.get(), CURLUPART_HOST);
        if (!host || host->empty()) {
            return std::nullopt;
        }

        UrlParts parts;
        parts.scheme_ = string_utils::to_lower(get_part(handle.get(), CURLUPART_SCHEME).value_or("https"));
        parts.host_ = string_utils::to_lower(*host);

        if (auto port = get_part(handle.get(), CURLUPART_PORT, CURLU_DEFAULT_PORT)) {
            char* end = nullptr;
            parts.port_ = std::strtol(port->c_str(), &end, constants::BASE_10);
        }

        if (auto path = get_part(handle.get(), CURLUPART_PATH); path && !path->empty()) {
            parts.path_ = *path;
        }

        parts.query_ = get_part(handle.get(), CURLUPART_QUERY).value_or("");
        return parts;
    }

    std::optional<std::string> host_of(const std::string& raw) {
        auto parts = parse(raw);
        if (!parts) {
            return std::nullopt;
        }
        return parts->host_;
    }

    std::string append_query(const std::string& raw, const std::string& encoded_query) {
        if (encoded_query.empty()) {
            return raw;
        }
        const char separator = raw.find('?') == std::string::npos ? '?' : '&';
        return raw + separator + encoded_query;
    }
}  // namespace url
