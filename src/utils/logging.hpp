#ifndef WAVE_ENGINE_LOGGING_HPP
#define WAVE_ENGINE_LOGGING_HPP

#include <string>

namespace logging {
    // Installs the stderr logger as spdlog's default. `level` is an spdlog level name
    // ("trace", "debug", "info", "warn", "error", "critical", "off"); an empty string falls back
    // to WAVE_LOG_LEVEL and then to "info".
    void init(const std::string& level = "");
}  // namespace logging

#endif
