#ifndef WAVE_ENGINE_RUN_MANIFEST_HPP
#define WAVE_ENGINE_RUN_MANIFEST_HPP

#include <simdjson.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../../batch/execution_types.hpp"
#include "../../credentials/model/credentials.hpp"
#include "../../credentials/store/credential_store.hpp"
#include "../../executor/http_executor.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/json_parser.hpp"
#include "../../utils/placeholders.hpp"

namespace runner::manifest {
    using json_parser::ParserOptions;

    const ParserOptions<int64_t> REQUEST_TIMEOUT_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 0, .error_message_ = "Invalid request timeout seconds"};
    const ParserOptions<int64_t> MAX_REDIRECTS_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = constants::DEFAULT_MAX_REDIRECTS, .error_message_ = "Invalid max redirects"};
    const ParserOptions<bool> IGNORE_CERTIFICATE_VALIDATION_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {true, false}, .fallback_value_ = false, .error_message_ = "Invalid ignore certificate validation"};
    const ParserOptions<std::string_view> COOKIE_JAR_PATH_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid cookie jar path"};

    const ParserOptions<int64_t> CONCURRENT_CALLS_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 1, .error_message_ = "Invalid concurrent calls"};
    const ParserOptions<int64_t> DELAY_BETWEEN_CALLS_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = 0, .error_message_ = "Invalid delay between calls"};
    const ParserOptions<bool> STOP_ON_FAILURE_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {true, false}, .fallback_value_ = false, .error_message_ = "Invalid stop on failure"};

    const ParserOptions<std::string_view> ID_PARSER_OPTIONS = {.is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid id"};
    const ParserOptions<std::string_view> NAME_PARSER_OPTIONS = {.is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid name"};
    const ParserOptions<bool> ENABLED_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {true, false}, .fallback_value_ = true, .error_message_ = "Invalid enabled"};
    const ParserOptions<std::string_view> EXPIRY_DATE_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid expiry date"};

    const ParserOptions<std::string_view> AUTH_TYPE_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {"apiKey", "basic", "digest", "oauth2Refresh"}, .fallback_value_ = "", .error_message_ = "Invalid auth type"};
    const ParserOptions<bool> BASE64_ENCODE_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {true, false}, .fallback_value_ = false, .error_message_ = "Invalid base64 encode"};
    const ParserOptions<std::string_view> SEND_IN_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {"header", "query"}, .fallback_value_ = "header", .error_message_ = "Invalid api key location"};
    const ParserOptions<std::string_view> CERT_TYPE_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {"ca", "selfSigned"}, .fallback_value_ = "", .error_message_ = "Invalid certificate type"};
    const ParserOptions<std::string_view> PROXY_URL_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid proxy url"};

    // Free-form string fields of auth, proxy and certificate records.
    const ParserOptions<std::string_view> OPTIONAL_STRING_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid string field"};

    const ParserOptions<std::string_view> REQUEST_ID_PARSER_OPTIONS = {
        .is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid request id"};
    const ParserOptions<std::string_view> METHOD_PARSER_OPTIONS = {
        .is_required_ = false,
        .allowed_values_ = {"GET", "POST", "PUT", "PATCH", "DELETE", "HEAD", "OPTIONS"},
        .fallback_value_ = "GET",
        .error_message_ = "Invalid method"};
    const ParserOptions<std::string_view> URL_PARSER_OPTIONS = {.is_required_ = true, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid url"};
    const ParserOptions<std::string_view> BODY_PARSER_OPTIONS = {.is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid body"};
    const ParserOptions<std::string_view> AUTH_NAME_PARSER_OPTIONS = {
        .is_required_ = false, .allowed_values_ = {}, .fallback_value_ = "", .error_message_ = "Invalid auth reference"};

    // JSON description of one collection run: settings, execution config, environment,
    // credentials and the requests to execute.
    class RunManifest {
       public:
        RunManifest() = default;

        ~RunManifest() = default;
        RunManifest(const RunManifest&) = delete;
        RunManifest& operator=(const RunManifest&) = delete;
        RunManifest(RunManifest&&) = delete;
        RunManifest& operator=(RunManifest&&) = delete;

        void load_from_file(const std::filesystem::path& path);
        void parse_string(std::string_view json);

        [[nodiscard]] const executor::ExecutionSettings& get_settings() const;
        [[nodiscard]] const batch::ExecutionConfig& get_execution_config() const;
        [[nodiscard]] const placeholders::EnvVars& get_environment() const;
        [[nodiscard]] const std::vector<credentials::AuthEntry>& get_auths() const;
        [[nodiscard]] const std::vector<credentials::ProxyConfig>& get_proxies() const;
        [[nodiscard]] const std::vector<credentials::CertConfig>& get_certs() const;
        [[nodiscard]] const std::vector<executor::HttpRequestDescriptor>& get_requests() const;
        [[nodiscard]] std::optional<std::string> get_cookie_jar_path() const;

        // Adds every auth, proxy and certificate record to `store`.
        void populate(credentials::CredentialStore& store) const;

       private:
        void parse_json(simdjson::ondemand::document& doc);

        executor::ExecutionSettings settings_;
        batch::ExecutionConfig execution_config_;
        placeholders::EnvVars environment_;
        std::vector<credentials::AuthEntry> auths_;
        std::vector<credentials::ProxyConfig> proxies_;
        std::vector<credentials::CertConfig> certs_;
        std::vector<executor::HttpRequestDescriptor> requests_;
        std::string cookie_jar_path_;
    };
}  // namespace runner::manifest

#endif
