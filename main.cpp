#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "src/cookies/jar/cookie_jar.hpp"
#include "src/cookies/storage/cookie_storage.hpp"
#include "src/credentials/store/credential_store.hpp"
#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/runner/collection_runner/collection_runner.hpp"
#include "src/runner/manifest/run_manifest.hpp"
#include "src/utils/constants.hpp"
#include "src/utils/logging.hpp"

namespace {
    volatile std::sig_atomic_t interrupted = 0;

    void on_interrupt(int /*signal*/) { interrupted = 1; }

    struct CliOptions {
        std::string manifest_path_;
        std::string cookie_jar_path_;
        std::string log_level_;
    };

    void print_usage() { std::cerr << "Usage: wave_run <manifest.json> [--cookies <path>] [--log-level <level>]" << std::endl; }

    bool parse_args(int argc, char** argv, CliOptions& options) {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if ((arg == "--cookies" || arg == "--log-level") && i + 1 < argc) {
                (arg == "--cookies" ? options.cookie_jar_path_ : options.log_level_) = argv[++i];
            } else if (!arg.starts_with("--") && options.manifest_path_.empty()) {
                options.manifest_path_ = arg;
            } else {
                return false;
            }
        }
        return !options.manifest_path_.empty();
    }

    void print_result(const runner::RequestRunResult& result) {
        std::cout << "[" << batch::to_string(result.status_) << "] " << result.id_;
        if (result.response_) {
            const auto& response = *result.response_;
            std::cout << "  " << response.status_ << " " << response.status_text_ << "  " << response.elapsed_time_ms_ << " ms  " << response.size_bytes_
                      << " B";
        }
        std::cout << std::endl;
    }
}  // namespace

int main(int argc, char** argv) {
    CliOptions cli_options;
    if (!parse_args(argc, argv, cli_options)) {
        print_usage();
        return 2;
    }

    logging::init(cli_options.log_level_);
    http::client::CurlGlobal curl_global;

    std::unique_ptr<runner::CollectionRunner> collection_runner;
    runner::manifest::RunManifest manifest;

    try {
        //
        // Collect
        //

        manifest.load_from_file(cli_options.manifest_path_);

        std::string cookie_jar_path = constants::DEFAULT_COOKIE_JAR_PATH;
        if (!cli_options.cookie_jar_path_.empty()) {
            cookie_jar_path = cli_options.cookie_jar_path_;
        } else if (auto manifest_path = manifest.get_cookie_jar_path()) {
            cookie_jar_path = *manifest_path;
        }

        auto credential_store = std::make_unique<credentials::CredentialStore>();
        manifest.populate(*credential_store);

        collection_runner = runner::CollectionRunnerBuilder()
                                .with_http_client_factory([]() { return std::make_unique<http::client::CurlEasy>(); })
                                .with_credential_store(std::move(credential_store))
                                .with_cookie_jar(std::make_unique<cookies::CookieJar>(std::make_unique<cookies::FileCookieStorage>(cookie_jar_path)))
                                .with_settings(manifest.get_settings())
                                .with_execution_config(manifest.get_execution_config())
                                .validate()
                                .build();
    } catch (const std::exception& e) {
        std::cerr << "Setup Error: " << e.what() << std::endl;
        return 2;
    }

    //
    // Run
    //

    std::signal(SIGINT, on_interrupt);
    std::atomic<bool> run_finished{false};
    std::thread interrupt_watcher([&collection_runner, &run_finished] {
        while (!run_finished) {
            if (interrupted != 0) {
                spdlog::warn("Interrupted, cancelling the run");
                collection_runner->cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(constants::CANCELLATION_POLL_INTERVAL_MS));
        }
    });

    runner::CollectionRunReport report;
    try {
        report = collection_runner->run(manifest.get_requests());
    } catch (const std::exception& e) {
        run_finished = true;
        interrupt_watcher.join();
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 2;
    }
    run_finished = true;
    interrupt_watcher.join();

    //
    // Report
    //

    bool all_succeeded = true;
    for (const auto& result : report.results_) {
        print_result(result);
        all_succeeded = all_succeeded && result.status_ == batch::ItemStatus::SUCCESS;
    }

    std::cout << "\n"
              << report.progress_.completed_ << "/" << report.progress_.total_ << " completed, " << report.progress_.passed_ << " passed, "
              << report.progress_.failed_ << " failed, " << report.progress_.skipped_ << " skipped, average " << report.average_time_ms_ << " ms";
    if (report.cancelled_) {
        std::cout << " (cancelled)";
    } else if (report.stopped_on_failure_) {
        std::cout << " (stopped on failure)";
    }
    std::cout << std::endl;

    return all_succeeded ? 0 : 1;
}
