#ifndef WAVE_ENGINE_ENCODING_HPP
#define WAVE_ENGINE_ENCODING_HPP

#include <string>
#include <string_view>

namespace encoding {
    enum class DigestAlgorithm { MD5, SHA256 };

    std::string base64_encode(std::string_view bytes);

    std::string to_hex(const unsigned char* data, size_t len);

    // Lowercase hex digest of the input.
    std::string hex_digest(DigestAlgorithm algorithm, std::string_view input);

    // Hex string built from `num_bytes` bytes of OpenSSL randomness.
    std::string random_hex(size_t num_bytes);

    // Alphanumeric string of `length` characters.
    std::string random_alphanumeric(size_t length);
}  // namespace encoding

#endif
