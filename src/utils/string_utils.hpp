#ifndef WAVE_ENGINE_STRING_UTILS_HPP
#define WAVE_ENGINE_STRING_UTILS_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(std::string_view s, std::string_view prefix);

    bool iequals(std::string_view a, std::string_view b);

    std::string to_lower(std::string s);

    std::string to_upper(std::string s);

    std::string trim(std::string s);

    std::vector<std::string> split(std::string_view sv, char delimiter);

    std::vector<std::string> split_comma_delimited_string(std::string_view sv);

    std::string join(const std::vector<std::string>& parts, std::string_view separator);

    // application/x-www-form-urlencoded, space as '+'
    std::string form_encode(std::string_view s);

    std::string form_encode_pairs(const std::vector<std::pair<std::string, std::string>>& pairs);
}  // namespace string_utils

#endif
