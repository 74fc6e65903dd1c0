#include "digest_auth.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iomanip>
#include <regex>
#include <sstream>
#include <string_view>

#include "../../http/error/http_error.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/encoding.hpp"
#include "../../utils/string_utils.hpp"
#include "../../utils/url.hpp"

namespace auth::strategies {
    namespace {
        constexpr const char* DIGEST_SCHEME = "digest";
        constexpr const char* SESSION_SUFFIX = "-SESS";
        constexpr const char* SHA256_PREFIX = "SHA-256";

        const std::regex& challenge_param_regex() {
            static const std::regex re(R"re((\w+)=(?:"([^"]*)"|([^\s,]+)))re");
            return re;
        }

        std::string pick(const std::string& primary, const std::string& fallback) { return primary.empty() ? fallback : primary; }

        // Server values first, configured values for whatever the server left out.
        DigestChallenge with_defaults(const DigestChallenge& challenge, const credentials::DigestAuth& configured) {
            return DigestChallenge{
                .realm_ = pick(challenge.realm_, configured.realm_),
                .nonce_ = pick(challenge.nonce_, configured.nonce_),
                .qop_ = pick(challenge.qop_, configured.qop_),
                .opaque_ = pick(challenge.opaque_, configured.opaque_),
                .algorithm_ = pick(challenge.algorithm_, configured.algorithm_),
                .stale_ = challenge.stale_,
            };
        }

        std::optional<DigestChallenge> find_challenge(const http::model::Response& resp) {
            for (const auto& value : http::model::find_all_headers(resp.headers_, "WWW-Authenticate")) {
                if (auto challenge = parse_www_authenticate(value)) {
                    return challenge;
                }
            }
            return std::nullopt;
        }

        unsigned long initial_nonce_count(const credentials::DigestAuth& configured) {
            if (configured.nc_.empty()) {
                return 1;
            }
            char* end = nullptr;
            const unsigned long nc = std::strtoul(configured.nc_.c_str(), &end, constants::BASE_16);
            return nc > 0 ? nc : 1;
        }

        std::string format_nonce_count(unsigned long nc) {
            std::ostringstream oss;
            oss << std::hex << std::setw(constants::DIGEST_NONCE_COUNT_WIDTH) << std::setfill('0') << nc;
            return oss.str();
        }
    }  // namespace

    std::optional<DigestChallenge> parse_www_authenticate(const std::string& header) {
        const std::string trimmed = string_utils::trim(header);
        if (!string_utils::ieq_prefix(trimmed, DIGEST_SCHEME)) {
            return std::nullopt;
        }

        DigestChallenge challenge;
        const std::string params = trimmed.substr(std::string_view(DIGEST_SCHEME).size());
        for (std::sregex_iterator it(params.begin(), params.end(), challenge_param_regex()), end; it != end; ++it) {
            const auto& match = *it;
            const std::string key = string_utils::to_lower(match[1].str());
            const std::string value = match[2].matched ? match[2].str() : match[3].str();

            if (key == "realm") {
                challenge.realm_ = value;
            } else if (key == "nonce") {
                challenge.nonce_ = value;
            } else if (key == "qop") {
                challenge.qop_ = select_qop(value);
            } else if (key == "opaque") {
                challenge.opaque_ = value;
            } else if (key == "algorithm") {
                challenge.algorithm_ = value;
            } else if (key == "stale") {
                challenge.stale_ = string_utils::iequals(value, "true");
            }
        }
        return challenge;
    }

    std::string select_qop(const std::string& offered) {
        const auto options = string_utils::split_comma_delimited_string(offered);
        if (options.empty()) {
            return "";
        }
        for (const char* preferred : {"auth", "auth-int"}) {
            for (const auto& option : options) {
                if (string_utils::iequals(option, preferred)) {
                    return preferred;
                }
            }
        }
        return options.front();
    }

    std::string build_authorization_header(const std::string& method, const std::string& uri, const std::string& body, const std::string& username,
                                           const std::string& password, const DigestChallenge& challenge, unsigned long nc, const std::string& cnonce) {
        const std::string algorithm = string_utils::to_upper(challenge.algorithm_.empty() ? "MD5" : challenge.algorithm_);
        const auto hash_alg = algorithm.starts_with(SHA256_PREFIX) ? encoding::DigestAlgorithm::SHA256 : encoding::DigestAlgorithm::MD5;
        auto hash = [hash_alg](const std::string& s) { return encoding::hex_digest(hash_alg, s); };

        const std::string nc_hex = format_nonce_count(nc);

        std::string ha1 = hash(username + ":" + challenge.realm_ + ":" + password);
        if (algorithm.ends_with(SESSION_SUFFIX)) {
            ha1 = hash(ha1 + ":" + challenge.nonce_ + ":" + cnonce);
        }

        const std::string upper_method = string_utils::to_upper(method);
        const std::string ha2 = challenge.qop_ == "auth-int" ? hash(upper_method + ":" + uri + ":" + hash(body)) : hash(upper_method + ":" + uri);

        const std::string response = challenge.qop_.empty()
                                         ? hash(ha1 + ":" + challenge.nonce_ + ":" + ha2)
                                         : hash(ha1 + ":" + challenge.nonce_ + ":" + nc_hex + ":" + cnonce + ":" + challenge.qop_ + ":" + ha2);

        std::string header = "Digest username=\"" + username + "\", realm=\"" + challenge.realm_ + "\", nonce=\"" + challenge.nonce_ + "\", uri=\"" + uri +
                             "\", response=\"" + response + "\"";
        if (!challenge.algorithm_.empty()) {
            header += ", algorithm=" + challenge.algorithm_;
        }
        if (!challenge.qop_.empty()) {
            header += ", qop=" + challenge.qop_ + ", nc=" + nc_hex + ", cnonce=\"" + cnonce + "\"";
        }
        if (!challenge.opaque_.empty()) {
            header += ", opaque=\"" + challenge.opaque_ + "\"";
        }
        return header;
    }

    DigestAuthService::DigestAuthService(credentials::Clock clock, CnonceGenerator cnonce_generator)
        : AuthServiceBase(std::move(clock)), cnonce_generator_(std::move(cnonce_generator)) {}

    void DigestAuthService::clear_cache(const std::optional<std::string>& auth_id) {
        if (auth_id) {
            cache_.erase(*auth_id);
        } else {
            cache_.clear();
        }
    }

    std::string DigestAuthService::next_cnonce(const Exchange& exchange) const {
        if (!exchange.fixed_cnonce_.empty()) {
            return exchange.fixed_cnonce_;
        }
        if (cnonce_generator_) {
            return cnonce_generator_();
        }
        return encoding::random_alphanumeric(constants::CNONCE_LENGTH);
    }

    http::model::Response DigestAuthService::send_authenticated(const Exchange& exchange, const DigestChallenge& challenge, unsigned long nc,
                                                                IRequestSender& sender) {
        http::model::Request req = exchange.request_;
        http::model::set_header(req.headers_, "Authorization",
                                build_authorization_header(req.method_, exchange.uri_, req.body_, exchange.username_, exchange.password_, challenge, nc,
                                                           next_cnonce(exchange)));
        return sender.send(req);
    }

    CompletedResponse DigestAuthService::respond_to_challenge(const Exchange& exchange, const DigestChallenge& challenge, unsigned long nc,
                                                              const std::string& auth_id, IRequestSender& sender) {
        cache_.put(auth_id, DigestState{.challenge_ = challenge, .nc_ = nc + 1}, now() + std::chrono::seconds(constants::DEFAULT_AUTH_CACHE_TTL_S));
        return CompletedResponse{.response_ = send_authenticated(exchange, challenge, nc, sender)};
    }

    AuthOutcome DigestAuthService::apply_auth(const AuthRequestConfig& config, const credentials::AuthEntry& auth, const placeholders::EnvVars& env_vars,
                                              IRequestSender& sender) {
        const auto* digest = std::get_if<credentials::DigestAuth>(&auth.details_);
        if (digest == nullptr) {
            return AuthFailure{.message_ = wrong_type_message("DigestAuthService")};
        }

        if (auto error = validate_auth(auth, config.url_)) {
            return AuthFailure{.message_ = *error};
        }

        auto values = resolve_values({digest->username_, digest->password_}, env_vars);
        if (!values.unresolved_.empty()) {
            return AuthFailure{.message_ = unresolved_message(values.unresolved_)};
        }

        const auto parts = url::parse(config.url_);
        if (!parts) {
            return AuthFailure{.message_ = "Invalid URL: " + config.url_};
        }

        const Exchange exchange{
            .request_ = http::model::Request{.url_ = config.url_, .method_ = config.method_, .body_ = config.body_, .headers_ = config.headers_},
            .uri_ = parts->request_target(),
            .username_ = values.resolved_[0],
            .password_ = values.resolved_[1],
            .fixed_cnonce_ = digest->cnonce_,
        };

        try {
            if (auto cached = cache_.get_and_update(auth.id_, now(), [](DigestState& s) { ++s.nc_; })) {
                auto resp = send_authenticated(exchange, cached->challenge_, cached->nc_, sender);
                if (resp.status_ != constants::HTTP_UNAUTHORIZED) {
                    return CompletedResponse{.response_ = std::move(resp)};
                }

                auto challenge = find_challenge(resp);
                if (challenge && challenge->stale_) {
                    spdlog::debug("Digest nonce for \"{}\" is stale, retrying with the new nonce", auth.name_);
                    DigestChallenge refreshed = cached->challenge_;
                    refreshed.nonce_ = pick(challenge->nonce_, refreshed.nonce_);
                    refreshed.realm_ = pick(challenge->realm_, refreshed.realm_);
                    refreshed.opaque_ = pick(challenge->opaque_, refreshed.opaque_);
                    refreshed.qop_ = pick(challenge->qop_, refreshed.qop_);
                    refreshed.algorithm_ = pick(challenge->algorithm_, refreshed.algorithm_);
                    return respond_to_challenge(exchange, refreshed, 1, auth.id_, sender);
                }
                cache_.erase(auth.id_);
            }

            auto initial = sender.send(exchange.request_);
            if (initial.status_ != constants::HTTP_UNAUTHORIZED) {
                return CompletedResponse{.response_ = std::move(initial)};
            }

            auto challenge = find_challenge(initial);
            if (!challenge) {
                return CompletedResponse{.response_ = std::move(initial)};
            }

            const DigestChallenge merged = with_defaults(*challenge, *digest);
            if (merged.realm_.empty() || merged.nonce_.empty()) {
                return AuthFailure{.message_ = "Failed to parse Digest challenge"};
            }

            return respond_to_challenge(exchange, merged, initial_nonce_count(*digest), auth.id_, sender);
        } catch (const http::http_error::TransportError&) {
            throw;
        } catch (const std::exception& e) {
            return AuthFailure{.message_ = e.what()};
        }
    }
}  // namespace auth::strategies
