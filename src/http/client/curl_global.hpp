#ifndef WAVE_ENGINE_CURL_GLOBAL_HPP
#define WAVE_ENGINE_CURL_GLOBAL_HPP

namespace http::client {
    // Owns curl_global_init / curl_global_cleanup. Construct one on the main thread before any
    // CurlEasy exists.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;
    };
}  // namespace http::client

#endif
