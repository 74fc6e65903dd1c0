#ifndef WAVE_ENGINE_CURL_EASY_HPP
#define WAVE_ENGINE_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <string>

#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    // One libcurl easy handle. Not thread-safe: the executor creates one per execution.
    class CurlEasy : public IHttpClient {
       public:
        CurlEasy();

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response send(const http::model::Request& req, const http::model::DispatchOptions& opts) override;

       private:
        template <typename T>
        void setopt(CURLoption option, T value);

        void set_defaults();
        void set_headers(const http::model::Headers& hs);
        void set_method_and_body(const http::model::Request& req);
        void apply_redirects_and_timeout(const http::model::DispatchOptions& opts);
        void apply_proxy(const http::model::ProxyEndpoint& proxy);
        void apply_tls(const http::model::DispatchOptions& opts);
        void prepare_for_new_request(std::string& body);

        void perform_throw(const std::string& u, std::string& body);
        http::model::Response make_response(std::string& incoming_body);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        std::string last_status_text_;
        http::model::Headers last_response_headers_;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace http::client

#endif
