#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../src/batch/batch_executor.hpp"
#include "../src/batch/execution_types.hpp"

using batch::BatchCallbacks;
using batch::BatchExecutor;
using batch::ExecutionConfig;
using batch::ItemStatus;
using batch::ValidationStatus;

namespace {
    struct TestItem {
        std::string id_;
        bool should_pass_ = true;
    };

    struct TestResult {
        std::string id_;
        bool passed_ = true;
    };

    std::vector<TestItem> make_items(size_t count) {
        std::vector<TestItem> items;
        for (size_t i = 0; i < count; ++i) {
            items.push_back(TestItem{.id_ = "item-" + std::to_string(i)});
        }
        return items;
    }

    const batch::FunctionStatusExtractor<TestResult> EXTRACTOR([](const TestResult& r) {
        return batch::StatusClassification{.status_ = r.passed_ ? ItemStatus::SUCCESS : ItemStatus::FAILED};
    });

    TestResult run_item(const TestItem& item) { return TestResult{.id_ = item.id_, .passed_ = item.should_pass_}; }
}  // namespace

TEST(ExecutionProgressTest, CountsByStatusAndValidation) {
    batch::ExecutionProgress progress{.total_ = 5};

    batch::update_progress(progress, ItemStatus::SUCCESS, ValidationStatus::NONE);
    batch::update_progress(progress, ItemStatus::SUCCESS, ValidationStatus::FAIL);
    batch::update_progress(progress, ItemStatus::FAILED, ValidationStatus::NONE);
    batch::update_progress(progress, ItemStatus::SKIPPED, ValidationStatus::NONE);

    EXPECT_EQ(progress.completed_, 4U);
    EXPECT_EQ(progress.passed_, 1U);
    EXPECT_EQ(progress.failed_, 2U);
    EXPECT_EQ(progress.skipped_, 1U);
}

TEST(BatchExecutorTest, RunsEveryItemWithinTheConcurrencyLimit) {
    BatchExecutor<TestItem, TestResult> executor;
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    int progress_calls = 0;

    BatchCallbacks<TestResult> callbacks;
    callbacks.on_progress_ = [&progress_calls](const batch::ExecutionProgress&) { ++progress_calls; };

    const auto result = executor.execute(
        make_items(10),
        [&](const TestItem& item) {
            const int now_in_flight = ++in_flight;
            int seen = max_in_flight.load();
            while (now_in_flight > seen && !max_in_flight.compare_exchange_weak(seen, now_in_flight)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --in_flight;
            return run_item(item);
        },
        ExecutionConfig{.concurrent_calls_ = 3}, {}, EXTRACTOR, callbacks);

    EXPECT_EQ(result.results_.size(), 10U);
    EXPECT_EQ(result.progress_.total_, 10U);
    EXPECT_EQ(result.progress_.completed_, 10U);
    EXPECT_EQ(result.progress_.passed_, 10U);
    EXPECT_FALSE(result.cancelled_);
    EXPECT_FALSE(result.stopped_on_failure_);
    EXPECT_LE(max_in_flight.load(), 3);
    EXPECT_EQ(progress_calls, 4);
}

TEST(BatchExecutorTest, StopsAfterTheBatchContainingAFailure) {
    BatchExecutor<TestItem, TestResult> executor;
    auto items = make_items(9);
    items[1].should_pass_ = false;

    std::atomic<int> started{0};
    BatchCallbacks<TestResult> callbacks;
    callbacks.on_item_start_ = [&started](const std::string&) { ++started; };

    const auto result = executor.execute(items, run_item, ExecutionConfig{.concurrent_calls_ = 3, .stop_on_failure_ = true}, {}, EXTRACTOR, callbacks);

    EXPECT_EQ(started.load(), 3);
    EXPECT_EQ(result.results_.size(), 3U);
    EXPECT_TRUE(result.stopped_on_failure_);
    EXPECT_EQ(result.progress_.failed_, 1U);
    EXPECT_EQ(result.progress_.passed_, 2U);
}

TEST(BatchExecutorTest, ExecutorExceptionsCountAsFailures) {
    BatchExecutor<TestItem, TestResult> executor;
    std::vector<std::string> errors;

    BatchCallbacks<TestResult> callbacks;
    callbacks.on_item_error_ = [&errors](const std::string& id, const std::string& message) { errors.push_back(id + ": " + message); };

    const auto result = executor.execute(
        make_items(2),
        [](const TestItem& item) -> TestResult {
            if (item.id_ == "item-1") {
                throw std::runtime_error("boom");
            }
            return run_item(item);
        },
        ExecutionConfig{.concurrent_calls_ = 2}, {}, EXTRACTOR, callbacks);

    EXPECT_EQ(result.results_.size(), 1U);
    EXPECT_EQ(result.progress_.failed_, 1U);
    EXPECT_EQ(result.progress_.completed_, 2U);
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_EQ(errors[0], "item-1: boom");
}

TEST(BatchExecutorTest, CancellationBeforeStartRunsNothing) {
    BatchExecutor<TestItem, TestResult> executor;

    const auto result = executor.execute(make_items(3), run_item, ExecutionConfig{}, [] { return true; }, EXTRACTOR);

    EXPECT_TRUE(result.results_.empty());
    EXPECT_TRUE(result.cancelled_);
    EXPECT_EQ(result.progress_.total_, 3U);
    EXPECT_EQ(result.progress_.completed_, 0U);
}

TEST(BatchExecutorTest, CancellationDuringDelayEndsTheRun) {
    BatchExecutor<TestItem, TestResult> executor;
    std::atomic<bool> cancelled{false};

    std::thread canceller([&cancelled] {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        cancelled = true;
    });

    const auto started_at = std::chrono::steady_clock::now();
    const auto result = executor.execute(make_items(3), run_item, ExecutionConfig{.concurrent_calls_ = 1, .delay_between_calls_ms_ = 5000},
                                         [&cancelled] { return cancelled.load(); }, EXTRACTOR);
    const auto elapsed = std::chrono::steady_clock::now() - started_at;
    canceller.join();

    EXPECT_TRUE(result.cancelled_);
    EXPECT_EQ(result.results_.size(), 1U);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(BatchExecutorTest, CancelDelayShortensTheWaitOnly) {
    BatchExecutor<TestItem, TestResult> executor;
    std::atomic<bool> done{false};

    std::thread interrupter([&executor, &done] {
        while (!done) {
            executor.cancel_delay();
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    });

    const auto started_at = std::chrono::steady_clock::now();
    const auto result = executor.execute(make_items(2), run_item, ExecutionConfig{.concurrent_calls_ = 1, .delay_between_calls_ms_ = 5000}, {}, EXTRACTOR);
    const auto elapsed = std::chrono::steady_clock::now() - started_at;
    done = true;
    interrupter.join();

    EXPECT_FALSE(result.cancelled_);
    EXPECT_EQ(result.results_.size(), 2U);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}
