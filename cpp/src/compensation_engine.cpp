#include "polystore/compensation_engine.hpp"

#include <optional>

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

FailureKind failure_kind_for(CompensationItem::Kind kind) {
    switch (kind) {
        case CompensationItem::Kind::Chunk:  return FailureKind::OrphanedChunk;
        case CompensationItem::Kind::Record: return FailureKind::OrphanedRecord;
        case CompensationItem::Kind::Other:  break;
    }
    return FailureKind::CriticalFailure;
}

// A failure-log write must never stop the remaining compensations
void append_or_log(FailureLog& log, const std::string& saga_id, FailureKind kind,
                   std::map<std::string, std::string> detail) {
    try {
        log.append(saga_id, kind, std::move(detail));
    } catch (const std::exception& e) {
        LOG_ERROR("[", saga_id, "] could not write ", to_string(kind), " record: ", e.what());
    }
}

} // anonymous namespace

CompensationEngine::CompensationEngine(FailureLog& failure_log) : failure_log_(failure_log) {}

CompensationSummary CompensationEngine::compensate(const std::string& saga_id,
                                                   const SagaDefinition& definition,
                                                   const std::vector<size_t>& completed,
                                                   SagaContext& context) {
    CompensationSummary summary;

    for (auto it = completed.rbegin(); it != completed.rend(); ++it) {
        const size_t index = *it;
        const SagaStep& step = definition.step(index);
        if (!step.has_compensation()) continue;

        LOG_INFO("[", saga_id, "] compensating ", step.id);

        std::vector<CompensationItem> items;
        std::optional<std::string> thrown;
        try {
            items = step.compensation(context);
        } catch (const std::exception& e) {
            thrown = error_text(e);
        } catch (...) {
            thrown = "unknown exception";
        }
        if (thrown) {
            const std::string& msg = *thrown;
            ++summary.attempted;
            ++summary.failed;
            summary.errors.push_back(step.id + ": compensation threw: " + msg);
            summary.step_results[index] = StepStatus::CompensationFailed;
            LOG_ERROR("[", saga_id, "] compensation of ", step.id, " threw: ", msg);
            append_or_log(failure_log_, saga_id, FailureKind::CriticalFailure,
                          {{"step", step.id},
                           {"step_name", step.name},
                           {"phase", "compensation"},
                           {"error", msg}});
            continue;
        }

        bool step_ok = true;
        for (CompensationItem& item : items) {
            ++summary.attempted;

            if (item.outcome != CompensationItem::Outcome::Failed && step.verify) {
                bool gone = false;
                try {
                    gone = step.verify(context, item);
                } catch (const std::exception& e) {
                    item.error = "verification threw: " + error_text(e);
                } catch (...) {
                    item.error = "verification threw: unknown exception";
                }
                if (!gone) {
                    item.outcome = CompensationItem::Outcome::Failed;
                    if (item.error.empty()) item.error = "still present after compensation";
                }
            }

            if (item.outcome == CompensationItem::Outcome::Failed) {
                ++summary.failed;
                step_ok = false;
            } else {
                ++summary.succeeded;
                if (item.outcome == CompensationItem::Outcome::Removed) ++summary.removed;
            }
        }

        auto errors = record_failures(saga_id, step.id, items);
        summary.errors.insert(summary.errors.end(), errors.begin(), errors.end());
        summary.step_results[index] = step_ok ? StepStatus::Compensated : StepStatus::CompensationFailed;
    }

    if (summary.failed == 0) {
        LOG_INFO("[", saga_id, "] compensation complete: ", summary.removed, " removed, ",
                 summary.succeeded - summary.removed, " already absent");
    } else {
        LOG_ERROR("[", saga_id, "] compensation incomplete: ", summary.failed, " of ",
                  summary.attempted, " items failed");
    }
    return summary;
}

std::vector<std::string> CompensationEngine::record_failures(const std::string& saga_id,
                                                             const std::string& step_id,
                                                             const std::vector<CompensationItem>& items) {
    std::vector<std::string> errors;
    for (const CompensationItem& item : items) {
        if (item.outcome != CompensationItem::Outcome::Failed) continue;

        errors.push_back(step_id + ": failed to remove " + item.resource_id + ": " + item.error);
        append_or_log(failure_log_, saga_id, failure_kind_for(item.kind),
                      {{"step", step_id},
                       {"resource_id", item.resource_id},
                       {"error", item.error},
                       {"status", "REQUIRES_MANUAL_CLEANUP"}});
    }
    return errors;
}

} // namespace polystore
