#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace polystore {

// Why a forward step asked for the saga to be rolled back
enum class RollbackReason {
    SourceNotFound,
    MetadataCorrupt,
    MaxRetriesExceeded,
    IntegrityMismatch,
    OperationNotFound,
    StoreFailure,
    Cancelled,
    Paused,
    StepFailed
};

inline const char* to_string(RollbackReason reason) {
    switch (reason) {
        case RollbackReason::SourceNotFound:     return "source_not_found";
        case RollbackReason::MetadataCorrupt:    return "metadata_corrupt";
        case RollbackReason::MaxRetriesExceeded: return "max_retries_exceeded";
        case RollbackReason::IntegrityMismatch:  return "integrity_mismatch";
        case RollbackReason::OperationNotFound:  return "operation_not_found";
        case RollbackReason::StoreFailure:       return "store_failure";
        case RollbackReason::Cancelled:          return "cancelled";
        case RollbackReason::Paused:             return "paused";
        case RollbackReason::StepFailed:         return "step_failed";
    }
    return "unknown";
}

struct RollbackSignal {
    RollbackReason reason = RollbackReason::StepFailed;
    std::string message;
    std::string operation_id;
    int attempts = 0;
    std::string last_error;
    // One entry per failed upload attempt, in order
    std::vector<std::string> attempt_errors;

    std::string describe() const {
        std::string out = std::string(to_string(reason)) + ": " + message;
        if (!last_error.empty() && last_error != message) {
            out += " (last error: " + last_error + ")";
        }
        return out;
    }
};

/**
 * Tagged result of a saga step: either a value or a rollback signal.
 * Steps return these instead of throwing through the executor.
 */
template<typename T>
class StepResult {
public:
    static StepResult success(T value = T{}) {
        return StepResult(std::in_place_index<0>, std::move(value));
    }

    static StepResult rollback(RollbackSignal signal) {
        return StepResult(std::in_place_index<1>, std::move(signal));
    }

    static StepResult rollback(RollbackReason reason, std::string message) {
        RollbackSignal signal;
        signal.reason = reason;
        signal.message = std::move(message);
        return rollback(std::move(signal));
    }

    bool ok() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    T& value() { return std::get<0>(state_); }
    const T& value() const { return std::get<0>(state_); }

    const RollbackSignal& signal() const { return std::get<1>(state_); }

private:
    template<size_t I, typename U>
    StepResult(std::in_place_index_t<I> tag, U&& v) : state_(tag, std::forward<U>(v)) {}

    std::variant<T, RollbackSignal> state_;
};

// Forward actions publish their values into the SagaContext and return this
using StepOutcome = StepResult<std::monostate>;

// Shared flag checked between chunks and before each saga step
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true); }
    bool cancelled() const noexcept { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// One resource touched by a compensation
struct CompensationItem {
    enum class Kind { Chunk, Record, Other };
    enum class Outcome { Removed, AlreadyAbsent, Failed };

    Kind kind = Kind::Other;
    std::string resource_id;
    Outcome outcome = Outcome::Failed;
    std::string error;
};

inline const char* to_string(CompensationItem::Outcome outcome) {
    switch (outcome) {
        case CompensationItem::Outcome::Removed:       return "removed";
        case CompensationItem::Outcome::AlreadyAbsent: return "already_absent";
        case CompensationItem::Outcome::Failed:        return "failed";
    }
    return "unknown";
}

} // namespace polystore
