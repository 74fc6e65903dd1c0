#ifndef WAVE_ENGINE_COLLECTION_RUNNER_HPP
#define WAVE_ENGINE_COLLECTION_RUNNER_HPP

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../../auth/factory/auth_factory.hpp"
#include "../../batch/batch_executor.hpp"
#include "../../batch/execution_types.hpp"
#include "../../cookies/jar/cookie_jar.hpp"
#include "../../credentials/store/credential_store.hpp"
#include "../../executor/http_executor.hpp"

namespace runner {
    struct RequestRunResult {
        std::string id_;
        batch::ItemStatus status_ = batch::ItemStatus::SKIPPED;
        std::optional<executor::HttpResponseResult> response_;
    };

    struct CollectionRunReport {
        std::vector<RequestRunResult> results_;  // input order
        batch::ExecutionProgress progress_;
        bool cancelled_ = false;
        bool stopped_on_failure_ = false;
        double average_time_ms_ = 0.0;
    };

    // 200..399 is success; anything else, including a status-0 error result, failed.
    [[nodiscard]] batch::ItemStatus classify(const executor::HttpResponseResult& response);

    // Replaces {{name}} in url, header values, params and body with the request's environment.
    [[nodiscard]] executor::HttpRequestDescriptor resolve_placeholders(const executor::HttpRequestDescriptor& request);

    class CollectionRunner {
       public:
        void set_http_client_factory(executor::HttpClientFactory http_client_factory);
        void set_credential_store(std::unique_ptr<credentials::CredentialStore> credential_store);
        void set_cookie_jar(std::unique_ptr<cookies::CookieJar> cookie_jar);
        void set_auth_services(std::unique_ptr<auth::factory::AuthServiceFactory> auth_services);
        void set_settings(const executor::ExecutionSettings& settings);
        void set_execution_config(const batch::ExecutionConfig& execution_config);

        [[nodiscard]] const executor::HttpClientFactory& get_http_client_factory() const;
        [[nodiscard]] const batch::ExecutionConfig& get_execution_config() const;
        [[nodiscard]] credentials::CredentialStore& get_credential_store() const;
        [[nodiscard]] cookies::CookieJar& get_cookie_jar() const;

        // Wires the executor from the configured parts. Called by the builder.
        void initialize();

        CollectionRunReport run(const std::vector<executor::HttpRequestDescriptor>& requests, const batch::BatchCallbacks<RequestRunResult>& callbacks = {});

        // Stops before the next batch and ends a pending delay.
        void cancel();

       private:
        executor::HttpClientFactory http_client_factory_;
        std::unique_ptr<credentials::CredentialStore> credential_store_;
        std::unique_ptr<cookies::CookieJar> cookie_jar_;
        std::unique_ptr<auth::factory::AuthServiceFactory> auth_services_;
        std::unique_ptr<executor::HttpExecutor> executor_;
        executor::ExecutionSettings settings_;
        batch::ExecutionConfig execution_config_;

        batch::BatchExecutor<executor::HttpRequestDescriptor, RequestRunResult> batch_executor_;
        std::atomic<bool> cancelled_{false};
    };

    class CollectionRunnerBuilder {
       public:
        CollectionRunnerBuilder();

        CollectionRunnerBuilder& with_http_client_factory(executor::HttpClientFactory http_client_factory);
        CollectionRunnerBuilder& with_credential_store(std::unique_ptr<credentials::CredentialStore> credential_store);
        CollectionRunnerBuilder& with_cookie_jar(std::unique_ptr<cookies::CookieJar> cookie_jar);
        CollectionRunnerBuilder& with_auth_services(std::unique_ptr<auth::factory::AuthServiceFactory> auth_services);
        CollectionRunnerBuilder& with_settings(const executor::ExecutionSettings& settings);
        CollectionRunnerBuilder& with_execution_config(const batch::ExecutionConfig& execution_config);
        CollectionRunnerBuilder& validate();
        std::unique_ptr<CollectionRunner> build();

       private:
        std::unique_ptr<CollectionRunner> collection_runner_;
        bool has_credential_store_ = false;
        bool has_cookie_jar_ = false;
        bool has_auth_services_ = false;
    };
}  // namespace runner

#endif
