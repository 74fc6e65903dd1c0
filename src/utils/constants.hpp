#ifndef WAVE_ENGINE_CONSTANTS_HPP
#define WAVE_ENGINE_CONSTANTS_HPP

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr int BASE_16 = 16;
    inline constexpr long MS_PER_SECOND = 1000L;
    inline constexpr long DEFAULT_MAX_REDIRECTS = 5L;
    inline constexpr long DEFAULT_TOKEN_EXPIRES_IN_S = 300L;
    inline constexpr long TOKEN_EXPIRY_BUFFER_S = 60L;
    inline constexpr long DEFAULT_AUTH_CACHE_TTL_S = 60L * 60L;
    inline constexpr long CANCELLATION_POLL_INTERVAL_MS = 50L;
    inline constexpr int DIGEST_NONCE_COUNT_WIDTH = 8;
    inline constexpr int CNONCE_LENGTH = 16;
    inline constexpr int RECORD_ID_BYTES = 16;
    inline constexpr long HTTP_SUCCESS_LOWER_BOUNDARY = 200;
    inline constexpr long HTTP_SUCCESS_UPPER_BOUNDARY = 400;
    inline constexpr long HTTP_UNAUTHORIZED = 401;
    inline constexpr const char* ERROR_STATUS_TEXT = "Error";
    inline constexpr const char* DEFAULT_COOKIE_JAR_PATH = "store/cookies.tsv";
}  // namespace constants

#endif
