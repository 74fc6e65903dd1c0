#include "curl_easy.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

#include "../../utils/string_utils.hpp"
#include "../error/http_error.hpp"
#include "../model/model.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long CONNECT_TIMEOUT_MS = 30'000L;
        static constexpr const char* USER_AGENT = "wave-engine/1.0";
        static constexpr const char* ACCEPT_ENCODING = "";
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long NO_FOLLOW_LOCATION = 0L;
        static constexpr long HTTP_GET = 1L;
        static constexpr long NO_BODY = 1L;
        static constexpr long VERIFY_OFF = 0L;
        static constexpr const char* PKCS12_CERT_TYPE = "P12";
    };

    struct HeaderKeys {
        static constexpr const char* STATUS_LINE = "HTTP/";
    };

    struct ProxyTypes {
        const char* scheme_;
        long type_;
    };

    constexpr std::array<ProxyTypes, 6> PROXY_TYPES{{
        {.scheme_ = "http", .type_ = CURLPROXY_HTTP},
        {.scheme_ = "https", .type_ = CURLPROXY_HTTPS},
        {.scheme_ = "socks4", .type_ = CURLPROXY_SOCKS4},
        {.scheme_ = "socks4a", .type_ = CURLPROXY_SOCKS4A},
        {.scheme_ = "socks5", .type_ = CURLPROXY_SOCKS5},
        {.scheme_ = "socks5h", .type_ = CURLPROXY_SOCKS5_HOSTNAME},
    }};

    CurlEasy::CurlEasy() : handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_defaults() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_CONNECTTIMEOUT_MS, CurlDefaults::CONNECT_TIMEOUT_MS);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
        // Empty string => accept all supported encodings (gzip/deflate/br)
        setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
    }

    void CurlEasy::set_headers(const http::model::Headers& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& [name, value] : hs) {
            // "Name;" is curl's spelling of a header with an empty value
            const std::string line = value.empty() ? name + ";" : name + ": " + value;
            headers_ = curl_slist_append(headers_, line.c_str());
        }
        if (headers_ != nullptr) {
            setopt(CURLOPT_HTTPHEADER, headers_);
        }
    }

    void CurlEasy::set_method_and_body(const http::model::Request& req) {
        const std::string method = string_utils::to_upper(req.method_);

        if (method == "GET" && req.body_.empty()) {
            setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
            return;
        }
        if (method == "HEAD") {
            setopt(CURLOPT_NOBODY, CurlDefaults::NO_BODY);
            return;
        }

        if (!req.body_.empty() || method == "POST" || method == "PUT" || method == "PATCH") {
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body_.size()));
            setopt(CURLOPT_POSTFIELDS, req.body_.data());
        }
        setopt(CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    void CurlEasy::apply_redirects_and_timeout(const http::model::DispatchOptions& opts) {
        if (opts.max_redirects_ > 0) {
            setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
            setopt(CURLOPT_MAXREDIRS, opts.max_redirects_);
        } else {
            setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::NO_FOLLOW_LOCATION);
        }

        // curl treats 0 as "no timeout"
        setopt(CURLOPT_TIMEOUT_MS, opts.timeout_ms_ > 0 ? opts.timeout_ms_ : 0L);
    }

    void CurlEasy::apply_proxy(const http::model::ProxyEndpoint& proxy) {
        const std::string proxy_url = proxy.to_url();
        setopt(CURLOPT_PROXY, proxy_url.c_str());

        for (const auto& entry : PROXY_TYPES) {
            if (proxy.scheme_ == entry.scheme_) {
                setopt(CURLOPT_PROXYTYPE, entry.type_);
                break;
            }
        }

        if (!proxy.username_.empty()) {
            setopt(CURLOPT_PROXYUSERNAME, proxy.username_.c_str());
            setopt(CURLOPT_PROXYPASSWORD, proxy.password_.c_str());
        }
    }

    void CurlEasy::apply_tls(const http::model::DispatchOptions& opts) {
        if (opts.tls_) {
            const auto& tls = *opts.tls_;

            if (tls.kind_ == http::model::TlsMaterialKind::TRUST_ANCHOR) {
                setopt(CURLOPT_CAINFO, tls.ca_file_.c_str());
            } else if (!tls.pfx_file_.empty()) {
                setopt(CURLOPT_SSLCERT, tls.pfx_file_.c_str());
                setopt(CURLOPT_SSLCERTTYPE, CurlDefaults::PKCS12_CERT_TYPE);
            } else {
                setopt(CURLOPT_SSLCERT, tls.cert_file_.c_str());
                setopt(CURLOPT_SSLKEY, tls.key_file_.c_str());
            }

            if (tls.kind_ == http::model::TlsMaterialKind::CLIENT_IDENTITY && !tls.passphrase_.empty()) {
                setopt(CURLOPT_KEYPASSWD, tls.passphrase_.c_str());
            }
        }

        // composes with a client identity: the certificate is still presented
        if (opts.ignore_certificate_validation_) {
            setopt(CURLOPT_SSL_VERIFYPEER, CurlDefaults::VERIFY_OFF);
            setopt(CURLOPT_SSL_VERIFYHOST, CurlDefaults::VERIFY_OFF);
        }
    }

    void CurlEasy::prepare_for_new_request(std::string& body) {
        // Clear per-request scratch
        last_response_headers_.clear();
        last_status_text_.clear();
        error_buf_[0] = '\0';
        body.clear();

        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, &body);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, this);
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;
        const std::string line = string_utils::trim(std::string(buffer, bytes));

        if (line.empty()) {
            return bytes;
        }

        // A new status line starts a new response (redirect hop, proxy CONNECT, 100-continue).
        if (string_utils::ieq_prefix(line, HeaderKeys::STATUS_LINE)) {
            self->last_response_headers_.clear();
            self->last_status_text_.clear();

            const auto first_space = line.find(' ');
            const auto second_space = first_space == std::string::npos ? std::string::npos : line.find(' ', first_space + 1);
            if (second_space != std::string::npos) {
                self->last_status_text_ = line.substr(second_space + 1);
            }
            return bytes;
        }

        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            self->last_response_headers_.emplace_back(string_utils::trim(line.substr(0, colon)), string_utils::trim(line.substr(colon + 1)));
        }

        return bytes;
    }

    http::model::Response CurlEasy::send(const http::model::Request& req, const http::model::DispatchOptions& opts) {
        curl_easy_reset(handle_);
        set_defaults();

        setopt(CURLOPT_URL, req.url_.c_str());
        set_headers(req.headers_);
        set_method_and_body(req);
        apply_redirects_and_timeout(opts);
        if (opts.proxy_) {
            apply_proxy(*opts.proxy_);
        }
        apply_tls(opts);

        std::string body;
        prepare_for_new_request(body);

        perform_throw(req.url_, body);
        return make_response(body);
    }

    template <typename T>
    void CurlEasy::setopt(CURLoption option, T value) {
        const auto rc = curl_easy_setopt(handle_, option, value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    void CurlEasy::perform_throw(const std::string& u, std::string& body) {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        spdlog::error("{} ({})", err, u);
        throw http::http_error::TransportError(u, make_response(body), err);
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        http::model::Response r;
        r.status_ = code;
        r.status_text_ = std::move(last_status_text_);
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        r.headers_ = std::move(last_response_headers_);
        return r;
    }

}  // namespace http::client
