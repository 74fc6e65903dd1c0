#ifndef WAVE_ENGINE_DOMAIN_MATCHER_HPP
#define WAVE_ENGINE_DOMAIN_MATCHER_HPP

#include <regex>
#include <string>
#include <vector>

namespace credentials::domain_matcher {
    // "*.b.com" -> ^.*\.b\.com$ (case-insensitive). Every regex metacharacter except '*' is escaped.
    [[nodiscard]] std::regex compile_pattern(const std::string& pattern);

    // True when `url_or_host` has a host matching any pattern. An empty pattern list matches
    // everything; a host that cannot be determined matches nothing else.
    [[nodiscard]] bool matches(const std::string& url_or_host, const std::vector<std::string>& patterns);

    // A pattern list compiled once and reused across calls.
    class CompiledPatterns {
       public:
        explicit CompiledPatterns(const std::vector<std::string>& patterns);

        [[nodiscard]] bool matches(const std::string& url_or_host) const;
        [[nodiscard]] bool matches_host(const std::string& host) const;
        [[nodiscard]] bool empty() const { return regexes_.empty(); }

       private:
        std::vector<std::regex> regexes_;
    };
}  // namespace credentials::domain_matcher

#endif
