#ifndef WAVE_ENGINE_EXECUTION_TYPES_HPP
#define WAVE_ENGINE_EXECUTION_TYPES_HPP

#include <cstddef>
#include <functional>
#include <string>

namespace batch {
    enum class ItemStatus { SUCCESS, FAILED, SKIPPED, CANCELLED };

    // NONE when no validation rules apply to the item.
    enum class ValidationStatus { NONE, PENDING, PASS, FAIL };

    struct StatusClassification {
        ItemStatus status_ = ItemStatus::SUCCESS;
        ValidationStatus validation_status_ = ValidationStatus::NONE;
    };

    struct ExecutionConfig {
        int concurrent_calls_ = 1;
        long delay_between_calls_ms_ = 0;
        bool stop_on_failure_ = false;
    };

    struct ExecutionProgress {
        size_t total_ = 0;
        size_t completed_ = 0;  // success + failed + skipped
        size_t passed_ = 0;
        size_t failed_ = 0;
        size_t skipped_ = 0;
    };

    using CancellationPredicate = std::function<bool()>;

    void update_progress(ExecutionProgress& progress, ItemStatus status, ValidationStatus validation_status);

    [[nodiscard]] const char* to_string(ItemStatus status);

    // Maps a domain result onto the status pair used for progress accounting.
    template <typename TResult>
    class ResultStatusExtractor {
       public:
        ResultStatusExtractor() = default;
        virtual ~ResultStatusExtractor() = default;
        ResultStatusExtractor(const ResultStatusExtractor&) = delete;
        ResultStatusExtractor& operator=(const ResultStatusExtractor&) = delete;
        ResultStatusExtractor(ResultStatusExtractor&&) = delete;
        ResultStatusExtractor& operator=(ResultStatusExtractor&&) = delete;

        [[nodiscard]] virtual StatusClassification extract(const TResult& result) const = 0;
    };

    template <typename TResult>
    class FunctionStatusExtractor : public ResultStatusExtractor<TResult> {
       public:
        explicit FunctionStatusExtractor(std::function<StatusClassification(const TResult&)> fn) : fn_(std::move(fn)) {}

        [[nodiscard]] StatusClassification extract(const TResult& result) const override { return fn_(result); }

       private:
        std::function<StatusClassification(const TResult&)> fn_;
    };
}  // namespace batch

#endif
