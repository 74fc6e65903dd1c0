#include "credentials.hpp"

namespace credentials {
    const char* to_string(AuthType type) {
        switch (type) {
            case AuthType::API_KEY:
                return "apiKey";
            case AuthType::BASIC:
                return "basic";
            case AuthType::DIGEST:
                return "digest";
            case AuthType::OAUTH2_REFRESH:
                return "oauth2Refresh";
        }
        return "unknown";
    }
}  // namespace credentials
