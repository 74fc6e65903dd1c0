#ifndef WAVE_ENGINE_COOKIE_STORAGE_HPP
#define WAVE_ENGINE_COOKIE_STORAGE_HPP

#include <filesystem>
#include <string_view>
#include <vector>

#include "../model/cookie.hpp"

namespace cookies {
    class ICookieStorage {
       public:
        ICookieStorage() = default;
        virtual ~ICookieStorage() = default;
        ICookieStorage(const ICookieStorage&) = delete;
        ICookieStorage& operator=(const ICookieStorage&) = delete;
        ICookieStorage(ICookieStorage&&) = delete;
        ICookieStorage& operator=(ICookieStorage&&) = delete;

        // Both throw std::runtime_error on I/O failure.
        [[nodiscard]] virtual std::vector<Cookie> load() = 0;
        virtual void save(const std::vector<Cookie>& cookies) = 0;
    };

    class MemoryCookieStorage : public ICookieStorage {
       public:
        MemoryCookieStorage() = default;

        [[nodiscard]] std::vector<Cookie> load() override { return cookies_; }
        void save(const std::vector<Cookie>& cookies) override {
            cookies_ = cookies;
            ++save_count_;
        }

        [[nodiscard]] size_t save_count() const { return save_count_; }

       private:
        std::vector<Cookie> cookies_;
        size_t save_count_ = 0;
    };

    // One cookie per tab-separated line:
    // domain, path, name, value, expires (unix seconds, 0 = session), secure, http_only, enabled, id
    class FileCookieStorage : public ICookieStorage {
       public:
        explicit FileCookieStorage(std::filesystem::path path);

        [[nodiscard]] std::vector<Cookie> load() override;
        void save(const std::vector<Cookie>& cookies) override;

        [[nodiscard]] const std::filesystem::path& path() const { return path_; }

       private:
        static void write_atomic(const std::filesystem::path& p, std::string_view bytes);

        std::filesystem::path path_;
    };
}  // namespace cookies

#endif
