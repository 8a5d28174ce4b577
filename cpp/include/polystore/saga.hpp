#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "polystore/chunk_uploader.hpp"
#include "polystore/integrity_verifier.hpp"
#include "polystore/progress.hpp"
#include "polystore/source.hpp"
#include "polystore/step_result.hpp"
#include "polystore/types.hpp"

namespace polystore {

enum class StepKind {
    Action,     // mutates a store, may carry a compensation
    Gate        // read-only check, never compensated
};

enum class StepStatus {
    Pending,
    Succeeded,
    Failed,
    Compensated,
    CompensationFailed
};

enum class SagaStatus {
    Pending,
    Running,
    Compensating,
    Completed,
    Compensated,
    CompensationFailed
};

const char* to_string(StepStatus status);
const char* to_string(SagaStatus status);
bool is_terminal(SagaStatus status);

/**
 * Per-execution bag handed to every forward action and compensation.
 * Steps publish their results here for the steps that follow.
 */
struct SagaContext {
    std::string saga_id;
    const SourceArtifact* source = nullptr;

    // Upload parameters
    uint64_t chunk_size = 5 * 1024 * 1024;
    int max_attempts = 3;
    std::chrono::milliseconds retry_delay{5000};

    Metadata metadata;
    ProgressSink progress;
    CancellationToken cancel;

    // Published by steps
    std::string operation_id;
    std::optional<UploadResult> upload;
    std::optional<IntegrityReport> integrity;
    std::string document_id;
    std::map<std::string, std::string> record_ids;     // store name -> record id
    std::vector<std::string> attempt_failures;
};

using StepAction = std::function<StepOutcome(SagaContext&)>;
using StepCompensation = std::function<std::vector<CompensationItem>(SagaContext&)>;
// True when the resource named by the item is confirmed gone
using StepVerification = std::function<bool(SagaContext&, const CompensationItem&)>;

struct SagaStep {
    std::string id;
    std::string name;
    StepKind kind = StepKind::Action;
    StepAction action;
    StepCompensation compensation;     // optional
    StepVerification verify;           // optional, requires compensation

    bool has_compensation() const { return static_cast<bool>(compensation); }
};

/**
 * Immutable ordered list of steps for one saga type.
 * Built once and shared read-only across concurrent executions.
 *
 * @throws InvalidArgumentError on an empty list, duplicate or empty ids,
 *         empty names, a missing forward action, a verification without a
 *         compensation, or a gate that carries a compensation
 */
class SagaDefinition {
public:
    SagaDefinition(std::string name, std::vector<SagaStep> steps);

    const std::string& name() const { return name_; }
    const std::vector<SagaStep>& steps() const { return steps_; }
    size_t size() const { return steps_.size(); }
    const SagaStep& step(size_t index) const { return steps_.at(index); }
    std::optional<size_t> index_of(const std::string& step_id) const;

private:
    std::string name_;
    std::vector<SagaStep> steps_;
};

struct CompensationSummary {
    int attempted = 0;
    int succeeded = 0;
    int failed = 0;
    int removed = 0;
    std::vector<std::string> errors;
    // Step index -> final status (Compensated / CompensationFailed)
    std::map<size_t, StepStatus> step_results;

    double success_rate() const {
        return attempted == 0 ? 1.0 : static_cast<double>(succeeded) / attempted;
    }
};

struct SagaExecutionState {
    std::string saga_id;
    std::string definition;
    size_t cursor = 0;
    SagaStatus status = SagaStatus::Pending;
    std::vector<size_t> completed_steps;
    std::vector<std::string> errors;
    std::vector<std::string> compensation_errors;
    std::vector<StepStatus> step_status;
    TimePoint started_at;
    std::optional<TimePoint> finished_at;
};

struct SagaExecutionResult {
    std::string saga_id;
    SagaStatus status = SagaStatus::Pending;
    std::vector<std::string> completed_steps;                      // step ids, execution order
    std::vector<std::string> errors;
    std::vector<std::string> compensation_errors;
    CompensationSummary compensation;
    std::vector<std::pair<std::string, StepStatus>> step_statuses;
    std::optional<RollbackSignal> failure;
    TimePoint started_at;
    TimePoint finished_at;

    bool succeeded() const { return status == SagaStatus::Completed; }
};

} // namespace polystore
