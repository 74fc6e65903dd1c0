#include "model.hpp"

#include "../../utils/string_utils.hpp"

namespace http::model {
    std::optional<std::string> find_header(const Headers& headers, std::string_view name) {
        for (const auto& [key, value] : headers) {
            if (string_utils::iequals(key, name)) {
                return value;
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> find_all_headers(const Headers& headers, std::string_view name) {
        std::vector<std::string> out;
        for (const auto& [key, value] : headers) {
            if (string_utils::iequals(key, name)) {
                out.push_back(value);
            }
        }
        return out;
    }

    bool has_header(const Headers& headers, std::string_view name) { return find_header(headers, name).has_value(); }

    void set_header(Headers& headers, const std::string& name, const std::string& value) {
        for (auto& [key, existing] : headers) {
            if (string_utils::iequals(key, name)) {
                existing = value;
                return;
            }
        }
        headers.emplace_back(name, value);
    }
}  // namespace http::model
