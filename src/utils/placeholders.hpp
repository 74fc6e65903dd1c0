#ifndef WAVE_ENGINE_PLACEHOLDERS_HPP
#define WAVE_ENGINE_PLACEHOLDERS_HPP

#include <map>
#include <string>
#include <vector>

namespace placeholders {
    using EnvVars = std::map<std::string, std::string>;

    struct Resolution {
        std::string resolved_;
        std::vector<std::string> unresolved_;
    };

    // Replaces every {{name}} with the matching environment value. Names are trimmed and
    // compared case-insensitively; unknown names are left in place and reported.
    [[nodiscard]] Resolution resolve(const std::string& value, const EnvVars& env_vars);
}  // namespace placeholders

#endif
