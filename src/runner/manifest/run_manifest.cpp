#include "run_manifest.hpp"

#include <simdjson.h>

#include <algorithm>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>

#include "../../utils/time_utils.hpp"

namespace runner::manifest {
    namespace {
        using simdjson::error_code;
        using simdjson::ondemand::array;
        using simdjson::ondemand::object;
        using FieldResult = simdjson::simdjson_result<simdjson::ondemand::value>;

        std::optional<object> optional_object(FieldResult field, const std::string& error_message) {
            if (field.error() == error_code::NO_SUCH_FIELD) {
                return std::nullopt;
            }

            object value;
            if (field.get_object().get(value) != error_code::SUCCESS) {
                throw std::runtime_error(error_message);
            }
            return value;
        }

        std::optional<array> optional_array(FieldResult field, const std::string& error_message) {
            if (field.error() == error_code::NO_SUCH_FIELD) {
                return std::nullopt;
            }

            array value;
            if (field.get_array().get(value) != error_code::SUCCESS) {
                throw std::runtime_error(error_message);
            }
            return value;
        }

        std::vector<std::string> parse_string_list(FieldResult field, const std::string& error_message) {
            std::vector<std::string> out;
            auto raw_list = optional_array(std::move(field), error_message);
            if (!raw_list) {
                return out;
            }

            for (auto raw_item : *raw_list) {
                std::string_view item;
                if (raw_item.get_string().get(item) != error_code::SUCCESS) {
                    throw std::runtime_error(error_message);
                }
                out.emplace_back(item);
            }
            return out;
        }

        // Object of string values, in document order.
        std::vector<std::pair<std::string, std::string>> parse_string_pairs(FieldResult field, const std::string& error_message) {
            std::vector<std::pair<std::string, std::string>> out;
            auto raw_object = optional_object(std::move(field), error_message);
            if (!raw_object) {
                return out;
            }

            for (auto raw_field : *raw_object) {
                simdjson::ondemand::field entry;
                std::string_view key;
                std::string_view value;
                if (std::move(raw_field).get(entry) != error_code::SUCCESS || entry.unescaped_key().get(key) != error_code::SUCCESS ||
                    entry.value().get_string().get(value) != error_code::SUCCESS) {
                    throw std::runtime_error(error_message);
                }
                out.emplace_back(std::string(key), std::string(value));
            }
            return out;
        }

        std::optional<credentials::TimePoint> parse_expiry_date(FieldResult field) {
            const std::string raw(json_parser::parse_value(field.get_string(), EXPIRY_DATE_PARSER_OPTIONS));
            if (raw.empty()) {
                return std::nullopt;
            }

            auto parsed = time_utils::parse_iso8601(raw);
            if (!parsed) {
                throw std::runtime_error(EXPIRY_DATE_PARSER_OPTIONS.error_message_ + ": " + raw);
            }
            return parsed;
        }

        std::string optional_string(object& obj, const char* key) { return std::string(json_parser::parse_value(obj[key].get_string(), OPTIONAL_STRING_PARSER_OPTIONS)); }

        std::string id_or_name(const std::string& id, const std::string& name) { return id.empty() ? name : id; }

        credentials::AuthDetails parse_auth_details(object& obj, std::string_view type) {
            if (type == "apiKey") {
                const std::string send_in(json_parser::parse_value(obj["send_in"].get_string(), SEND_IN_PARSER_OPTIONS));
                return credentials::ApiKeyAuth{
                    .key_ = optional_string(obj, "key"),
                    .value_ = optional_string(obj, "value"),
                    .send_in_ = send_in == "query" ? credentials::ApiKeyLocation::QUERY : credentials::ApiKeyLocation::HEADER,
                    .prefix_ = optional_string(obj, "prefix"),
                };
            }

            if (type == "basic") {
                return credentials::BasicAuth{.username_ = optional_string(obj, "username"), .password_ = optional_string(obj, "password")};
            }

            if (type == "digest") {
                return credentials::DigestAuth{
                    .username_ = optional_string(obj, "username"),
                    .password_ = optional_string(obj, "password"),
                    .realm_ = optional_string(obj, "realm"),
                    .nonce_ = optional_string(obj, "nonce"),
                    .algorithm_ = optional_string(obj, "algorithm"),
                    .qop_ = optional_string(obj, "qop"),
                    .nc_ = optional_string(obj, "nc"),
                    .cnonce_ = optional_string(obj, "cnonce"),
                    .opaque_ = optional_string(obj, "opaque"),
                };
            }

            return credentials::OAuth2RefreshAuth{
                .token_url_ = optional_string(obj, "token_url"),
                .client_id_ = optional_string(obj, "client_id"),
                .client_secret_ = optional_string(obj, "client_secret"),
                .refresh_token_ = optional_string(obj, "refresh_token"),
                .scope_ = optional_string(obj, "scope"),
            };
        }

        credentials::AuthEntry parse_auth(object& obj) {
            const std::string name(json_parser::parse_value(obj["name"].get_string(), NAME_PARSER_OPTIONS));
            const std::string id(json_parser::parse_value(obj["id"].get_string(), ID_PARSER_OPTIONS));
            const std::string type(json_parser::parse_value(obj["type"].get_string(), AUTH_TYPE_PARSER_OPTIONS));

            return credentials::AuthEntry{
                .id_ = id_or_name(id, name),
                .name_ = name,
                .enabled_ = json_parser::parse_value<bool>(obj["enabled"].get_bool(), ENABLED_PARSER_OPTIONS),
                .domain_filters_ = parse_string_list(obj["domain_filters"], "Invalid domain filters"),
                .expiry_date_ = parse_expiry_date(obj["expiry_date"]),
                .base64_encode_ = json_parser::parse_value<bool>(obj["base64_encode"].get_bool(), BASE64_ENCODE_PARSER_OPTIONS),
                .details_ = parse_auth_details(obj, type),
            };
        }

        credentials::ProxyConfig parse_proxy(object& obj) {
            const std::string name(json_parser::parse_value(obj["name"].get_string(), NAME_PARSER_OPTIONS));
            const std::string id(json_parser::parse_value(obj["id"].get_string(), ID_PARSER_OPTIONS));

            return credentials::ProxyConfig{
                .id_ = id_or_name(id, name),
                .name_ = name,
                .enabled_ = json_parser::parse_value<bool>(obj["enabled"].get_bool(), ENABLED_PARSER_OPTIONS),
                .domain_filters_ = parse_string_list(obj["domain_filters"], "Invalid domain filters"),
                .exclude_domains_ = parse_string_list(obj["exclude_domains"], "Invalid exclude domains"),
                .url_ = std::string(json_parser::parse_value(obj["url"].get_string(), PROXY_URL_PARSER_OPTIONS)),
                .username_ = optional_string(obj, "username"),
                .password_ = optional_string(obj, "password"),
                .expiry_date_ = parse_expiry_date(obj["expiry_date"]),
            };
        }

        credentials::CertConfig parse_cert(object& obj) {
            const std::string name(json_parser::parse_value(obj["name"].get_string(), NAME_PARSER_OPTIONS));
            const std::string id(json_parser::parse_value(obj["id"].get_string(), ID_PARSER_OPTIONS));
            const std::string type(json_parser::parse_value(obj["type"].get_string(), CERT_TYPE_PARSER_OPTIONS));

            return credentials::CertConfig{
                .id_ = id_or_name(id, name),
                .name_ = name,
                .enabled_ = json_parser::parse_value<bool>(obj["enabled"].get_bool(), ENABLED_PARSER_OPTIONS),
                .domain_filters_ = parse_string_list(obj["domain_filters"], "Invalid domain filters"),
                .expiry_date_ = parse_expiry_date(obj["expiry_date"]),
                .type_ = type == "ca" ? credentials::CertType::CA : credentials::CertType::SELF_SIGNED,
                .cert_file_ = optional_string(obj, "cert_file"),
                .key_file_ = optional_string(obj, "key_file"),
                .pfx_file_ = optional_string(obj, "pfx_file"),
                .passphrase_ = optional_string(obj, "passphrase"),
            };
        }

        template <typename T, typename F>
        std::vector<T> parse_records(FieldResult field, const std::string& error_message, F&& parse_record) {
            std::vector<T> out;
            auto raw_records = optional_array(std::move(field), error_message);
            if (!raw_records) {
                return out;
            }

            for (auto raw_record : *raw_records) {
                object record;
                if (raw_record.get_object().get(record) != error_code::SUCCESS) {
                    throw std::runtime_error(error_message);
                }
                out.push_back(parse_record(record));
            }
            return out;
        }
    }  // namespace

    void RunManifest::load_from_file(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path)) {
            throw std::runtime_error("Manifest file not found: " + path.string());
        }

        simdjson::padded_string manifest_json;
        if (simdjson::padded_string::load(path.string()).get(manifest_json) != error_code::SUCCESS) {
            throw std::runtime_error("Unable to read manifest file: " + path.string());
        }

        simdjson::ondemand::parser parser;
        simdjson::ondemand::document manifest_document;
        if (parser.iterate(manifest_json).get(manifest_document) != error_code::SUCCESS) {
            throw std::runtime_error("Invalid manifest JSON");
        }
        parse_json(manifest_document);
    }

    void RunManifest::parse_string(std::string_view json) {
        simdjson::padded_string manifest_json(json);
        simdjson::ondemand::parser parser;
        simdjson::ondemand::document manifest_document;
        if (parser.iterate(manifest_json).get(manifest_document) != error_code::SUCCESS) {
            throw std::runtime_error("Invalid manifest JSON");
        }
        parse_json(manifest_document);
    }

    void RunManifest::parse_json(simdjson::ondemand::document& doc) {
        if (auto settings = optional_object(doc["settings"], "Invalid settings")) {
            settings_ = executor::ExecutionSettings{
                .request_timeout_seconds_ = json_parser::parse_value((*settings)["request_timeout_seconds"].get_int64(), REQUEST_TIMEOUT_PARSER_OPTIONS),
                .max_redirects_ = json_parser::parse_value((*settings)["max_redirects"].get_int64(), MAX_REDIRECTS_PARSER_OPTIONS),
                .ignore_certificate_validation_ =
                    json_parser::parse_value<bool>((*settings)["ignore_certificate_validation"].get_bool(), IGNORE_CERTIFICATE_VALIDATION_PARSER_OPTIONS),
            };
            cookie_jar_path_ = std::string(json_parser::parse_value((*settings)["cookie_jar_path"].get_string(), COOKIE_JAR_PATH_PARSER_OPTIONS));

            if (settings_.request_timeout_seconds_ < 0 || settings_.max_redirects_ < 0) {
                throw std::runtime_error("Settings cannot be negative");
            }
        }

        if (auto execution = optional_object(doc["execution"], "Invalid execution")) {
            execution_config_ = batch::ExecutionConfig{
                .concurrent_calls_ = int(json_parser::parse_value((*execution)["concurrent_calls"].get_int64(), CONCURRENT_CALLS_PARSER_OPTIONS)),
                .delay_between_calls_ms_ = json_parser::parse_value((*execution)["delay_between_calls_ms"].get_int64(), DELAY_BETWEEN_CALLS_PARSER_OPTIONS),
                .stop_on_failure_ = json_parser::parse_value<bool>((*execution)["stop_on_failure"].get_bool(), STOP_ON_FAILURE_PARSER_OPTIONS),
            };

            if (execution_config_.concurrent_calls_ < 1) {
                throw std::runtime_error(CONCURRENT_CALLS_PARSER_OPTIONS.error_message_);
            }
            if (execution_config_.delay_between_calls_ms_ < 0) {
                throw std::runtime_error(DELAY_BETWEEN_CALLS_PARSER_OPTIONS.error_message_);
            }
        }

        for (auto& [name, value] : parse_string_pairs(doc["environment"], "Invalid environment")) {
            environment_[name] = value;
        }

        auths_ = parse_records<credentials::AuthEntry>(doc["auths"], "Invalid auths", [](object& obj) { return parse_auth(obj); });
        proxies_ = parse_records<credentials::ProxyConfig>(doc["proxies"], "Invalid proxies", [](object& obj) { return parse_proxy(obj); });
        certs_ = parse_records<credentials::CertConfig>(doc["certs"], "Invalid certs", [](object& obj) { return parse_cert(obj); });

        std::set<std::string> request_ids;
        requests_ = parse_records<executor::HttpRequestDescriptor>(doc["requests"], "Invalid requests", [this, &request_ids](object& obj) {
            executor::HttpRequestDescriptor request{
                .id_ = std::string(json_parser::parse_value(obj["id"].get_string(), REQUEST_ID_PARSER_OPTIONS)),
                .method_ = std::string(json_parser::parse_value(obj["method"].get_string(), METHOD_PARSER_OPTIONS)),
                .url_ = std::string(json_parser::parse_value(obj["url"].get_string(), URL_PARSER_OPTIONS)),
                .headers_ = parse_string_pairs(obj["headers"], "Invalid headers"),
                .params_ = parse_string_pairs(obj["params"], "Invalid params"),
                .body_ = std::string(json_parser::parse_value(obj["body"].get_string(), BODY_PARSER_OPTIONS)),
                .env_vars_ = environment_,
            };

            if (!request_ids.insert(request.id_).second) {
                throw std::runtime_error("Duplicate request id \"" + request.id_ + "\"");
            }

            const std::string auth_name(json_parser::parse_value(obj["auth"].get_string(), AUTH_NAME_PARSER_OPTIONS));
            if (!auth_name.empty()) {
                auto it = std::ranges::find_if(auths_, [&auth_name](const credentials::AuthEntry& a) { return a.name_ == auth_name; });
                if (it == auths_.end()) {
                    throw std::runtime_error("Unknown auth \"" + auth_name + "\" for request \"" + request.id_ + "\"");
                }
                request.auth_ = *it;
            }
            return request;
        });

        if (requests_.empty()) {
            throw std::runtime_error("Manifest has no requests");
        }
    }

    const executor::ExecutionSettings& RunManifest::get_settings() const { return settings_; }

    const batch::ExecutionConfig& RunManifest::get_execution_config() const { return execution_config_; }

    const placeholders::EnvVars& RunManifest::get_environment() const { return environment_; }

    const std::vector<credentials::AuthEntry>& RunManifest::get_auths() const { return auths_; }

    const std::vector<credentials::ProxyConfig>& RunManifest::get_proxies() const { return proxies_; }

    const std::vector<credentials::CertConfig>& RunManifest::get_certs() const { return certs_; }

    const std::vector<executor::HttpRequestDescriptor>& RunManifest::get_requests() const { return requests_; }

    std::optional<std::string> RunManifest::get_cookie_jar_path() const {
        if (cookie_jar_path_.empty()) {
            return std::nullopt;
        }
        return cookie_jar_path_;
    }

    void RunManifest::populate(credentials::CredentialStore& store) const {
        for (const auto& auth : auths_) {
            store.add_auth(auth);
        }
        for (const auto& proxy : proxies_) {
            store.add_proxy(proxy);
        }
        for (const auto& cert : certs_) {
            store.add_cert(cert);
        }
    }
}  // namespace runner::manifest
