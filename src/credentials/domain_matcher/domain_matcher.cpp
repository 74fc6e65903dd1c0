#include "domain_matcher.hpp"

#include <string_view>

#include "../../utils/string_utils.hpp"
#include "../../utils/url.hpp"

namespace credentials::domain_matcher {
    namespace {
        constexpr std::string_view REGEX_METACHARACTERS = R"(.+?^${}()|[]\/)";
    }

    std::regex compile_pattern(const std::string& pattern) {
        std::string expr = "^";
        for (const char c : string_utils::trim(pattern)) {
            if (c == '*') {
                expr += ".*";
                continue;
            }
            if (REGEX_METACHARACTERS.find(c) != std::string_view::npos) {
                expr += '\\';
            }
            expr += c;
        }
        expr += "$";
        return std::regex(expr, std::regex::ECMAScript | std::regex::icase);
    }

    bool matches(const std::string& url_or_host, const std::vector<std::string>& patterns) {
        if (patterns.empty()) {
            return true;
        }
        return CompiledPatterns(patterns).matches(url_or_host);
    }

    CompiledPatterns::CompiledPatterns(const std::vector<std::string>& patterns) {
        regexes_.reserve(patterns.size());
        for (const auto& pattern : patterns) {
            regexes_.push_back(compile_pattern(pattern));
        }
    }

    bool CompiledPatterns::matches(const std::string& url_or_host) const {
        if (regexes_.empty()) {
            return true;
        }

        const auto host = url::host_of(url_or_host);
        if (!host) {
            return false;
        }
        return matches_host(*host);
    }

    bool CompiledPatterns::matches_host(const std::string& host) const {
        if (regexes_.empty()) {
            return true;
        }
        for (const auto& re : regexes_) {
            if (std::regex_match(host, re)) {
                return true;
            }
        }
        return false;
    }
}  // namespace credentials::domain_matcher
