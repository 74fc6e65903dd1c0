#include "encoding.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace encoding {
    std::string base64_encode(std::string_view bytes) {
        if (bytes.empty()) {
            return {};
        }

        // 4 output chars per 3 input bytes, plus the terminating NUL EVP_EncodeBlock writes
        std::string out(((bytes.size() + 2) / 3) * 4 + 1, '\0');
        const int written =
            EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), reinterpret_cast<const unsigned char*>(bytes.data()), static_cast<int>(bytes.size()));
        if (written < 0) {
            throw std::runtime_error("EVP_EncodeBlock failed");
        }
        out.resize(static_cast<size_t>(written));
        return out;
    }

    std::string to_hex(const unsigned char* data, size_t len) {
        static constexpr const char* HEX = "0123456789abcdef";
        std::string out;
        out.reserve(len * 2);
        for (size_t i = 0; i < len; ++i) {
            out.push_back(HEX[data[i] >> 4]);
            out.push_back(HEX[data[i] & 0x0F]);
        }
        return out;
    }

    std::string hex_digest(DigestAlgorithm algorithm, std::string_view input) {
        const EVP_MD* md = algorithm == DigestAlgorithm::SHA256 ? EVP_sha256() : EVP_md5();

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_len = 0;
        if (EVP_Digest(input.data(), input.size(), digest, &digest_len, md, nullptr) != 1) {
            throw std::runtime_error("EVP_Digest failed");
        }
        return to_hex(digest, digest_len);
    }

    std::string random_hex(size_t num_bytes) {
        std::vector<unsigned char> buf(num_bytes);
        if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        return to_hex(buf.data(), buf.size());
    }

    std::string random_alphanumeric(size_t length) {
        static constexpr std::string_view CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
        std::vector<unsigned char> buf(length);
        if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        std::string out;
        out.reserve(length);
        for (const unsigned char b : buf) {
            out.push_back(CHARS[b % CHARS.size()]);
        }
        return out;
    }
}  // namespace encoding
