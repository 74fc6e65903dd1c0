#ifndef WAVE_ENGINE_BATCH_EXECUTOR_HPP
#define WAVE_ENGINE_BATCH_EXECUTOR_HPP

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "../utils/constants.hpp"
#include "../utils/thread_pool.hpp"
#include "execution_types.hpp"

namespace batch {
    template <typename TResult>
    struct BatchCallbacks {
        std::function<void(const std::string& item_id)> on_item_start_;
        std::function<void(const TResult& result)> on_item_complete_;
        std::function<void(const std::string& item_id, const std::string& message)> on_item_error_;
        std::function<void(const std::vector<TResult>& batch_results)> on_batch_complete_;
        std::function<void(const ExecutionProgress& progress)> on_progress_;
    };

    template <typename TResult>
    struct BatchExecutionResult {
        std::vector<TResult> results_;  // completion order
        ExecutionProgress progress_;
        bool cancelled_ = false;
        bool stopped_on_failure_ = false;
    };

    // Runs items in fixed-size windows of `concurrent_calls_`. A window always runs to completion;
    // cancellation is observed between windows and during the inter-window delay. Items left in
    // the queue after a stop produce no result.
    template <typename TItem, typename TResult>
    class BatchExecutor {
       public:
        using ItemExecutor = std::function<TResult(const TItem&)>;

        BatchExecutor() = default;

        ~BatchExecutor() = default;
        BatchExecutor(const BatchExecutor&) = delete;
        BatchExecutor& operator=(const BatchExecutor&) = delete;
        BatchExecutor(BatchExecutor&&) = delete;
        BatchExecutor& operator=(BatchExecutor&&) = delete;

        BatchExecutionResult<TResult> execute(const std::vector<TItem>& items, const ItemExecutor& executor, const ExecutionConfig& config,
                                              const CancellationPredicate& is_cancelled, const ResultStatusExtractor<TResult>& extract_status,
                                              const BatchCallbacks<TResult>& callbacks = {}) {
            BatchExecutionResult<TResult> out;
            out.progress_.total_ = items.size();

            const size_t window = static_cast<size_t>(std::max(config.concurrent_calls_, 1));
            std::deque<const TItem*> pending;
            for (const auto& item : items) {
                pending.push_back(&item);
            }

            concurrency::ThreadPool pool(std::min(window, std::max<size_t>(items.size(), 1)));

            while (!pending.empty() && !cancelled(is_cancelled)) {
                std::vector<const TItem*> current;
                while (!pending.empty() && current.size() < window) {
                    current.push_back(pending.front());
                    pending.pop_front();
                }

                if (callbacks.on_item_start_) {
                    for (const TItem* item : current) {
                        callbacks.on_item_start_(item->id_);
                    }
                }

                std::mutex completion_mutex;
                std::vector<TResult> batch_results;
                std::vector<std::pair<std::string, std::string>> batch_errors;

                for (const TItem* item : current) {
                    pool.enqueue([&, item] {
                        try {
                            TResult result = executor(*item);
                            std::lock_guard<std::mutex> lock(completion_mutex);
                            batch_results.push_back(std::move(result));
                        } catch (const std::exception& e) {
                            spdlog::error("Item {} failed: {}", item->id_, e.what());
                            std::lock_guard<std::mutex> lock(completion_mutex);
                            batch_errors.emplace_back(item->id_, e.what());
                        }
                    });
                }
                pool.wait_all();

                bool has_failure = false;
                for (const auto& result : batch_results) {
                    out.results_.push_back(result);
                    if (callbacks.on_item_complete_) {
                        callbacks.on_item_complete_(result);
                    }

                    const auto classification = extract_status.extract(result);
                    update_progress(out.progress_, classification.status_, classification.validation_status_);
                    has_failure = has_failure || classification.status_ == ItemStatus::FAILED;
                }

                for (const auto& [item_id, message] : batch_errors) {
                    if (callbacks.on_item_error_) {
                        callbacks.on_item_error_(item_id, message);
                    }
                    update_progress(out.progress_, ItemStatus::FAILED, ValidationStatus::NONE);
                    has_failure = true;
                }

                if (callbacks.on_batch_complete_) {
                    callbacks.on_batch_complete_(batch_results);
                }
                if (callbacks.on_progress_) {
                    callbacks.on_progress_(out.progress_);
                }
                spdlog::info("Progress: {}/{} completed, {} passed, {} failed", out.progress_.completed_, out.progress_.total_, out.progress_.passed_,
                             out.progress_.failed_);

                if (config.stop_on_failure_ && has_failure) {
                    out.stopped_on_failure_ = true;
                    break;
                }

                if (config.delay_between_calls_ms_ > 0 && !pending.empty() && !cancelled(is_cancelled)) {
                    delay(std::chrono::milliseconds(config.delay_between_calls_ms_), is_cancelled);
                }
            }

            out.cancelled_ = cancelled(is_cancelled);
            return out;
        }

        // Ends a pending inter-batch delay early.
        void cancel_delay() {
            std::lock_guard<std::mutex> lock(delay_mutex_);
            delay_cancelled_ = true;
            delay_cv_.notify_all();
        }

       private:
        static bool cancelled(const CancellationPredicate& is_cancelled) { return is_cancelled && is_cancelled(); }

        void delay(std::chrono::milliseconds duration, const CancellationPredicate& is_cancelled) {
            const auto deadline = std::chrono::steady_clock::now() + duration;
            const auto poll_interval = std::chrono::milliseconds(constants::CANCELLATION_POLL_INTERVAL_MS);

            std::unique_lock<std::mutex> lock(delay_mutex_);
            delay_cancelled_ = false;
            while (!delay_cancelled_ && !cancelled(is_cancelled)) {
                const auto now = std::chrono::steady_clock::now();
                if (now >= deadline) {
                    break;
                }
                const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, poll_interval);
                delay_cv_.wait_for(lock, slice, [this] { return delay_cancelled_; });
            }
        }

        std::mutex delay_mutex_;
        std::condition_variable delay_cv_;
        bool delay_cancelled_ = false;
    };
}  // namespace batch

#endif
