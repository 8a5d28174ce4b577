#include "polystore/saga_executor.hpp"

#include <cstdio>
#include <random>

#include "polystore/error.hpp"
#include "polystore/logging.hpp"

namespace polystore {

namespace {

std::string error_text(const std::exception& e) {
    if (auto* pe = dynamic_cast<const PolystoreException*>(&e)) {
        return pe->message();
    }
    return e.what();
}

} // anonymous namespace

SagaExecutor::SagaExecutor(CompensationEngine& compensation,
                           SagaMonitor* monitor,
                           SagaJournal* journal)
    : compensation_(compensation), monitor_(monitor), journal_(journal) {}

std::string SagaExecutor::generate_saga_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    char buf[13];
    std::snprintf(buf, sizeof(buf), "%012llx",
                  static_cast<unsigned long long>(rng() & 0xFFFFFFFFFFFFULL));
    return std::string("saga-") + buf;
}

void SagaExecutor::transition(SagaExecutionState& state, const SagaContext& context,
                              SagaStatus status, int64_t step, const std::string& detail) {
    state.status = status;
    if (!journal_) return;
    try {
        journal_->record(state.saga_id, to_string(status), step, detail,
                         context.operation_id, context.record_ids);
    } catch (const std::exception& e) {
        LOG_ERROR("[", state.saga_id, "] journal write failed: ", e.what());
        state.errors.push_back("journal: " + error_text(e));
    }
}

SagaExecutionResult SagaExecutor::execute(const SagaDefinition& definition, SagaContext& context) {
    if (context.saga_id.empty()) {
        context.saga_id = generate_saga_id();
    }

    SagaExecutionState state;
    state.saga_id = context.saga_id;
    state.definition = definition.name();
    state.step_status.assign(definition.size(), StepStatus::Pending);
    state.started_at = Clock::now();

    if (monitor_) monitor_->track_saga(state.saga_id);
    if (journal_) {
        try {
            journal_->begin(state.saga_id, definition.name());
        } catch (const std::exception& e) {
            LOG_ERROR("[", state.saga_id, "] journal write failed: ", e.what());
            state.errors.push_back("journal: " + error_text(e));
        }
    }

    state.status = SagaStatus::Running;
    LOG_INFO("[", state.saga_id, "] starting ", definition.name(), " (", definition.size(), " steps)");

    std::optional<RollbackSignal> failure;

    for (size_t i = 0; i < definition.size(); ++i) {
        const SagaStep& step = definition.step(i);
        state.cursor = i;

        if (context.cancel.cancelled()) {
            RollbackSignal signal;
            signal.reason = RollbackReason::Cancelled;
            signal.message = "saga cancelled before " + step.id;
            signal.operation_id = context.operation_id;
            failure = signal;
            state.step_status[i] = StepStatus::Failed;
            break;
        }

        LOG_DEBUG("[", state.saga_id, "] step ", i, " ", step.id);

        try {
            StepOutcome outcome = step.action(context);
            if (!outcome.ok()) {
                failure = outcome.signal();
            }
        } catch (const std::exception& e) {
            RollbackSignal signal;
            signal.reason = dynamic_cast<const StoreError*>(&e) ? RollbackReason::StoreFailure
                                                                 : RollbackReason::StepFailed;
            signal.message = error_text(e);
            signal.last_error = signal.message;
            signal.operation_id = context.operation_id;
            failure = signal;
        } catch (...) {
            RollbackSignal signal;
            signal.reason = RollbackReason::StepFailed;
            signal.message = "unknown exception";
            signal.last_error = signal.message;
            signal.operation_id = context.operation_id;
            failure = signal;
        }

        if (failure) {
            state.step_status[i] = StepStatus::Failed;
            break;
        }

        state.step_status[i] = StepStatus::Succeeded;
        state.completed_steps.push_back(i);
        transition(state, context, SagaStatus::Running, static_cast<int64_t>(i), step.id + " succeeded");
    }

    CompensationSummary summary;

    if (!failure) {
        transition(state, context, SagaStatus::Completed, static_cast<int64_t>(state.cursor), "all steps succeeded");
        if (monitor_) monitor_->saga_completed(state.saga_id);
        LOG_INFO("[", state.saga_id, "] completed");
    } else {
        const SagaStep& failed_step = definition.step(state.cursor);
        const std::string error = failed_step.id + ": " + failure->describe();
        state.errors.push_back(error);
        LOG_WARN("[", state.saga_id, "] step failed, rolling back ", state.completed_steps.size(),
                 " completed step(s): ", error);

        transition(state, context, SagaStatus::Compensating, static_cast<int64_t>(state.cursor), error);
        summary = compensation_.compensate(state.saga_id, definition, state.completed_steps, context);

        for (const auto& [index, status] : summary.step_results) {
            state.step_status[index] = status;
        }
        state.compensation_errors = summary.errors;

        const bool rollback_ok = summary.failed == 0;
        transition(state, context, rollback_ok ? SagaStatus::Compensated : SagaStatus::CompensationFailed,
                   static_cast<int64_t>(state.cursor),
                   std::to_string(summary.failed) + " compensation failure(s)");

        if (monitor_) {
            monitor_->saga_rolled_back(state.saga_id, rollback_ok);
            if (!rollback_ok) {
                monitor_->alert_rollback_failure(state.saga_id, state.compensation_errors,
                                                 {{"definition", definition.name()},
                                                  {"failed_step", failed_step.id},
                                                  {"reason", to_string(failure->reason)}});
            }
        }
    }

    state.finished_at = Clock::now();

    SagaExecutionResult result;
    result.saga_id = state.saga_id;
    result.status = state.status;
    for (size_t i : state.completed_steps) {
        result.completed_steps.push_back(definition.step(i).id);
    }
    result.errors = state.errors;
    result.compensation_errors = state.compensation_errors;
    result.compensation = std::move(summary);
    for (size_t i = 0; i < definition.size(); ++i) {
        result.step_statuses.emplace_back(definition.step(i).id, state.step_status[i]);
    }
    result.failure = failure;
    result.started_at = state.started_at;
    result.finished_at = *state.finished_at;
    return result;
}

} // namespace polystore
