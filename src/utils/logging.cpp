#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

namespace logging {
    static constexpr const char* LOGGER_NAME = "wave";
    static constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    static constexpr const char* LEVEL_ENV_VAR = "WAVE_LOG_LEVEL";

    void init(const std::string& level) {
        std::string chosen = level;
        if (chosen.empty()) {
            const char* from_env = std::getenv(LEVEL_ENV_VAR);
            chosen = from_env != nullptr ? from_env : "info";
        }

        auto logger = spdlog::get(LOGGER_NAME);
        if (!logger) {
            logger = spdlog::stderr_color_mt(LOGGER_NAME);
        }
        logger->set_pattern(LOG_PATTERN);
        logger->set_level(spdlog::level::from_str(chosen));
        spdlog::set_default_logger(logger);
    }
}  // namespace logging
