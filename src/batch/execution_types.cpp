#include "execution_types.hpp"

namespace batch {
    void update_progress(ExecutionProgress& progress, ItemStatus status, ValidationStatus validation_status) {
        const bool is_completed = status == ItemStatus::SUCCESS || status == ItemStatus::FAILED || status == ItemStatus::SKIPPED;
        const bool is_passed = status == ItemStatus::SUCCESS && validation_status != ValidationStatus::FAIL;
        const bool is_failed = status == ItemStatus::FAILED || validation_status == ValidationStatus::FAIL;

        progress.completed_ += is_completed ? 1 : 0;
        progress.passed_ += is_passed ? 1 : 0;
        progress.failed_ += is_failed ? 1 : 0;
        progress.skipped_ += status == ItemStatus::SKIPPED ? 1 : 0;
    }

    const char* to_string(ItemStatus status) {
        switch (status) {
            case ItemStatus::SUCCESS:
                return "success";
            case ItemStatus::FAILED:
                return "failed";
            case ItemStatus::SKIPPED:
                return "skipped";
            case ItemStatus::CANCELLED:
                return "cancelled";
        }
        return "unknown";
    }
}  // namespace batch
