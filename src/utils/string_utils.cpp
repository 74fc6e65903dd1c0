#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* body = static_cast<std::string*>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq_prefix(std::string_view s, std::string_view prefix) {
        if (s.size() < prefix.size()) {
            return false;
        }
        return iequals(s.substr(0, prefix.size()), prefix);
    }

    bool iequals(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string to_upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::vector<std::string> split(std::string_view sv, char delimiter) {
        std::vector<std::string> out;
        size_t start = 0;
        for (;;) {
            size_t pos = sv.find(delimiter, start);
            size_t end = (pos == std::string_view::npos) ? sv.size() : pos;
            out.emplace_back(sv.substr(start, end - start));
            if (pos == std::string_view::npos) {
                break;
            }
            start = pos + 1;
        }
        return out;
    }

    std::vector<std::string> split_comma_delimited_string(std::string_view sv) {
        std::vector<std::string> out;
        size_t start = 0;
        for (;;) {
            size_t pos = sv.find(',', start);
            size_t end = (pos == std::string_view::npos) ? sv.size() : pos;

            std::string_view token = sv.substr(start, end - start);
            const auto first = token.find_first_not_of(" \t");
            if (first != std::string_view::npos) {
                const auto last = token.find_last_not_of(" \t");
                out.emplace_back(token.substr(first, last - first + 1));
            }

            if (pos == std::string_view::npos) {
                break;
            }

            start = pos + 1;
        }
        return out;
    }

    std::string join(const std::vector<std::string>& parts, std::string_view separator) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) {
                out.append(separator);
            }
            out.append(parts[i]);
        }
        return out;
    }

    std::string form_encode(std::string_view s) {
        static constexpr const char* HEX = "0123456789ABCDEF";
        std::string out;
        out.reserve(s.size());
        for (const char ch : s) {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '*') {
                out.push_back(ch);
            } else if (c == ' ') {
                out.push_back('+');
            } else {
                out.push_back('%');
                out.push_back(HEX[c >> 4]);
                out.push_back(HEX[c & 0x0F]);
            }
        }
        return out;
    }

    std::string form_encode_pairs(const std::vector<std::pair<std::string, std::string>>& pairs) {
        std::vector<std::string> encoded;
        encoded.reserve(pairs.size());
        for (const auto& [key, value] : pairs) {
            encoded.push_back(form_encode(key) + "=" + form_encode(value));
        }
        return join(encoded, "&");
    }
}  // namespace string_utils
