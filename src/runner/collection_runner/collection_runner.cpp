#include "collection_runner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

#include "../../utils/constants.hpp"
#include "../../utils/placeholders.hpp"

namespace runner {
    namespace {
        std::string resolve_one(const std::string& value, const placeholders::EnvVars& env_vars, const std::string& request_id) {
            auto resolution = placeholders::resolve(value, env_vars);
            for (const auto& name : resolution.unresolved_) {
                spdlog::warn("Request {}: unresolved placeholder {{{{{}}}}}", request_id, name);
            }
            return resolution.resolved_;
        }
    }  // namespace

    batch::ItemStatus classify(const executor::HttpResponseResult& response) {
        const bool ok = response.status_ >= constants::HTTP_SUCCESS_LOWER_BOUNDARY && response.status_ < constants::HTTP_SUCCESS_UPPER_BOUNDARY;
        return ok ? batch::ItemStatus::SUCCESS : batch::ItemStatus::FAILED;
    }

    executor::HttpRequestDescriptor resolve_placeholders(const executor::HttpRequestDescriptor& request) {
        executor::HttpRequestDescriptor out = request;
        if (request.env_vars_.empty()) {
            return out;
        }

        out.url_ = resolve_one(request.url_, request.env_vars_, request.id_);
        out.body_ = resolve_one(request.body_, request.env_vars_, request.id_);
        for (auto& [name, value] : out.headers_) {
            value = resolve_one(value, request.env_vars_, request.id_);
        }
        for (auto& [name, value] : out.params_) {
            value = resolve_one(value, request.env_vars_, request.id_);
        }
        return out;
    }

    //
    // CollectionRunnerBuilder implementation
    //

    CollectionRunnerBuilder::CollectionRunnerBuilder() : collection_runner_(std::make_unique<CollectionRunner>()) {}

    CollectionRunnerBuilder& CollectionRunnerBuilder::with_http_client_factory(executor::HttpClientFactory http_client_factory) {
        collection_runner_->set_http_client_factory(std::move(http_client_factory));
        return *this;
    }

    CollectionRunnerBuilder& CollectionRunnerBuilder::with_credential_store(std::unique_ptr<credentials::CredentialStore> credential_store) {
        has_credential_store_ = credential_store != nullptr;
        collection_runner_->set_credential_store(std::move(credential_store));
        return *this;
    }

    CollectionRunnerBuilder& CollectionRunnerBuilder::with_cookie_jar(std::unique_ptr<cookies::CookieJar> cookie_jar) {
        has_cookie_jar_ = cookie_jar != nullptr;
        collection_runner_->set_cookie_jar(std::move(cookie_jar));
        return *this;
    }

    CollectionRunnerBuilder& CollectionRunnerBuilder::with_auth_services(std::unique_ptr<auth::factory::AuthServiceFactory> auth_services) {
        has_auth_services_ = auth_services != nullptr;
        collection_runner_->set_auth_services(std::move(auth_services));
        return *this;
    }

    CollectionRunnerBuilder& CollectionRunnerBuilder::with_settings(const executor::ExecutionSettings& settings) {
        collection_runner_->set_settings(settings);
        return *this;
    }

    CollectionRunnerBuilder& CollectionRunnerBuilder::with_execution_config(const batch::ExecutionConfig& execution_config) {
        collection_runner_->set_execution_config(execution_config);
        return *this;
    }

    CollectionRunnerBuilder& CollectionRunnerBuilder::validate() {
        if (collection_runner_->get_http_client_factory() == nullptr) {
            throw std::runtime_error("HTTP client factory is required");
        }
        if (!has_cookie_jar_) {
            throw std::runtime_error("Cookie jar is required");
        }
        if (collection_runner_->get_execution_config().concurrent_calls_ < 1) {
            throw std::runtime_error("Concurrent calls must be at least 1");
        }
        if (collection_runner_->get_execution_config().delay_between_calls_ms_ < 0) {
            throw std::runtime_error("Delay between calls cannot be negative");
        }
        return *this;
    }

    std::unique_ptr<CollectionRunner> CollectionRunnerBuilder::build() {
        if (!has_credential_store_) {
            collection_runner_->set_credential_store(std::make_unique<credentials::CredentialStore>());
        }
        if (!has_auth_services_) {
            collection_runner_->set_auth_services(std::make_unique<auth::factory::AuthServiceFactory>());
        }
        collection_runner_->initialize();
        return std::move(collection_runner_);
    }

    //
    // CollectionRunner implementation
    //

    void CollectionRunner::set_http_client_factory(executor::HttpClientFactory http_client_factory) { http_client_factory_ = std::move(http_client_factory); }

    void CollectionRunner::set_credential_store(std::unique_ptr<credentials::CredentialStore> credential_store) {
        credential_store_ = std::move(credential_store);
    }

    void CollectionRunner::set_cookie_jar(std::unique_ptr<cookies::CookieJar> cookie_jar) { cookie_jar_ = std::move(cookie_jar); }

    void CollectionRunner::set_auth_services(std::unique_ptr<auth::factory::AuthServiceFactory> auth_services) { auth_services_ = std::move(auth_services); }

    void CollectionRunner::set_settings(const executor::ExecutionSettings& settings) { settings_ = settings; }

    void CollectionRunner::set_execution_config(const batch::ExecutionConfig& execution_config) { execution_config_ = execution_config; }

    const executor::HttpClientFactory& CollectionRunner::get_http_client_factory() const { return http_client_factory_; }

    const batch::ExecutionConfig& CollectionRunner::get_execution_config() const { return execution_config_; }

    credentials::CredentialStore& CollectionRunner::get_credential_store() const { return *credential_store_; }

    cookies::CookieJar& CollectionRunner::get_cookie_jar() const { return *cookie_jar_; }

    void CollectionRunner::initialize() {
        if (!http_client_factory_ || !credential_store_ || !cookie_jar_ || !auth_services_) {
            throw std::runtime_error("CollectionRunner is missing a component");
        }
        executor_ = std::make_unique<executor::HttpExecutor>(http_client_factory_, *credential_store_, *cookie_jar_, *auth_services_);
    }

    void CollectionRunner::cancel() {
        cancelled_ = true;
        batch_executor_.cancel_delay();
    }

    CollectionRunReport CollectionRunner::run(const std::vector<executor::HttpRequestDescriptor>& requests,
                                              const batch::BatchCallbacks<RequestRunResult>& callbacks) {
        if (!executor_) {
            throw std::runtime_error("CollectionRunner is not initialized");
        }
        cancelled_ = false;

        const batch::FunctionStatusExtractor<RequestRunResult> extractor(
            [](const RequestRunResult& r) { return batch::StatusClassification{.status_ = r.status_, .validation_status_ = batch::ValidationStatus::NONE}; });

        auto run_one = [this](const executor::HttpRequestDescriptor& request) {
            auto execution = executor_->execute(resolve_placeholders(request), settings_);
            const auto status = classify(execution.response_);
            return RequestRunResult{.id_ = request.id_, .status_ = status, .response_ = std::move(execution.response_)};
        };

        spdlog::info("Running {} request(s), {} at a time", requests.size(), std::max(execution_config_.concurrent_calls_, 1));
        auto batch_result = batch_executor_.execute(requests, run_one, execution_config_, [this] { return cancelled_.load(); }, extractor, callbacks);

        CollectionRunReport report{
            .progress_ = batch_result.progress_,
            .cancelled_ = batch_result.cancelled_,
            .stopped_on_failure_ = batch_result.stopped_on_failure_,
        };

        // Requests that never ran are reported as skipped (stopped on failure) or cancelled.
        const auto unrun_status = batch_result.stopped_on_failure_ ? batch::ItemStatus::SKIPPED : batch::ItemStatus::CANCELLED;

        double total_time_ms = 0.0;
        size_t timed = 0;
        for (const auto& request : requests) {
            auto it = std::ranges::find_if(batch_result.results_, [&](const RequestRunResult& r) { return r.id_ == request.id_; });
            if (it == batch_result.results_.end()) {
                if (batch_result.stopped_on_failure_ || batch_result.cancelled_) {
                    report.results_.push_back(RequestRunResult{.id_ = request.id_, .status_ = unrun_status});
                    if (unrun_status == batch::ItemStatus::SKIPPED) {
                        batch::update_progress(report.progress_, batch::ItemStatus::SKIPPED, batch::ValidationStatus::NONE);
                    }
                } else {
                    // the executor threw for this request
                    report.results_.push_back(RequestRunResult{.id_ = request.id_, .status_ = batch::ItemStatus::FAILED});
                }
                continue;
            }

            if (it->response_) {
                total_time_ms += static_cast<double>(it->response_->elapsed_time_ms_);
                ++timed;
            }
            report.results_.push_back(*it);
        }

        report.average_time_ms_ = timed > 0 ? total_time_ms / static_cast<double>(timed) : 0.0;
        return report;
    }
}  // namespace runner
