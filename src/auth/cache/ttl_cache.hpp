#ifndef WAVE_ENGINE_TTL_CACHE_HPP
#define WAVE_ENGINE_TTL_CACHE_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace auth::cache {
    // Per-auth-id values with an absolute expiry. Expired entries are dropped on read.
    template <typename T>
    class TtlCache {
       public:
        using TimePoint = std::chrono::system_clock::time_point;

        [[nodiscard]] std::optional<T> get(const std::string& key, TimePoint now) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = live_entry(key, now);
            if (it == entries_.end()) {
                return std::nullopt;
            }
            return it->second.value_;
        }

        // Returns the stored value as it was, then applies `update` to the stored copy.
        template <typename F>
        std::optional<T> get_and_update(const std::string& key, TimePoint now, F update) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = live_entry(key, now);
            if (it == entries_.end()) {
                return std::nullopt;
            }
            T before = it->second.value_;
            update(it->second.value_);
            return before;
        }

        void put(const std::string& key, T value, TimePoint expires_at) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.insert_or_assign(key, Entry{.value_ = std::move(value), .expires_at_ = expires_at});
        }

        void erase(const std::string& key) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.erase(key);
        }

        void clear() {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.clear();
        }

       private:
        struct Entry {
            T value_;
            TimePoint expires_at_;
        };

        typename std::map<std::string, Entry>::iterator live_entry(const std::string& key, TimePoint now) {
            auto it = entries_.find(key);
            if (it != entries_.end() && now > it->second.expires_at_) {
                entries_.erase(it);
                return entries_.end();
            }
            return it;
        }

        std::mutex mutex_;
        std::map<std::string, Entry> entries_;
    };
}  // namespace auth::cache

#endif
