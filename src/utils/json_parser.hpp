#ifndef WAVE_ENGINE_JSON_PARSER_HPP
#define WAVE_ENGINE_JSON_PARSER_HPP

#include <simdjson.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace json_parser {
    template <typename T>
    struct ParserOptions {
        bool is_required_ = true;
        std::vector<T> allowed_values_;
        T fallback_value_;
        std::string error_message_;
    };

    // A missing optional field yields the fallback. Any other error, or a value outside
    // `allowed_values_`, throws std::runtime_error with the option's message.
    template <typename T>
    T parse_value(simdjson::simdjson_result<T> result, const ParserOptions<T>& options) {
        if (result.error() == simdjson::error_code::NO_SUCH_FIELD && !options.is_required_) {
            return options.fallback_value_;
        }

        if (result.error() != simdjson::error_code::SUCCESS) {
            throw std::runtime_error(options.error_message_);
        }

        auto value = result.value();

        if (options.allowed_values_.empty()) {
            return T(value);
        }

        if (!std::ranges::any_of(options.allowed_values_, [value](const T& allowed_value) { return allowed_value == value; })) {
            throw std::runtime_error(options.error_message_);
        }

        return T(value);
    }
}  // namespace json_parser

#endif
