#include "placeholders.hpp"

#include <string>

#include "string_utils.hpp"

namespace placeholders {
    static const std::string* find_variable(const EnvVars& env_vars, const std::string& name) {
        for (const auto& [key, value] : env_vars) {
            if (string_utils::iequals(key, name)) {
                return &value;
            }
        }
        return nullptr;
    }

    Resolution resolve(const std::string& value, const EnvVars& env_vars) {
        Resolution out;
        out.resolved_.reserve(value.size());

        size_t pos = 0;
        while (pos < value.size()) {
            const size_t open = value.find("{{", pos);
            if (open == std::string::npos) {
                break;
            }
            const size_t close = value.find("}}", open + 2);
            if (close == std::string::npos) {
                break;
            }

            const std::string inner = value.substr(open + 2, close - open - 2);
            out.resolved_.append(value, pos, open - pos);

            // {{}} and names containing '}' are not placeholders
            if (inner.empty() || inner.find('}') != std::string::npos) {
                out.resolved_.append(value, open, close + 2 - open);
                pos = close + 2;
                continue;
            }

            const std::string name = string_utils::trim(inner);
            if (const std::string* replacement = find_variable(env_vars, name)) {
                out.resolved_.append(*replacement);
            } else {
                out.unresolved_.push_back(name);
                out.resolved_.append(value, open, close + 2 - open);
            }
            pos = close + 2;
        }

        if (pos < value.size()) {
            out.resolved_.append(value, pos, std::string::npos);
        }
        return out;
    }
}  // namespace placeholders
