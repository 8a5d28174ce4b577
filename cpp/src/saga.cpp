#include "polystore/saga.hpp"

#include <set>

#include "polystore/error.hpp"

namespace polystore {

const char* to_string(StepStatus status) {
    switch (status) {
        case StepStatus::Pending:            return "pending";
        case StepStatus::Succeeded:          return "succeeded";
        case StepStatus::Failed:             return "failed";
        case StepStatus::Compensated:        return "compensated";
        case StepStatus::CompensationFailed: return "compensation_failed";
    }
    return "unknown";
}

const char* to_string(SagaStatus status) {
    switch (status) {
        case SagaStatus::Pending:            return "pending";
        case SagaStatus::Running:            return "running";
        case SagaStatus::Compensating:       return "compensating";
        case SagaStatus::Completed:          return "completed";
        case SagaStatus::Compensated:        return "compensated";
        case SagaStatus::CompensationFailed: return "compensation_failed";
    }
    return "unknown";
}

bool is_terminal(SagaStatus status) {
    return status == SagaStatus::Completed || status == SagaStatus::Compensated ||
           status == SagaStatus::CompensationFailed;
}

SagaDefinition::SagaDefinition(std::string name, std::vector<SagaStep> steps)
    : name_(std::move(name)), steps_(std::move(steps)) {
    POLYSTORE_CHECK_ARGUMENT(!name_.empty(), "saga definition needs a name");
    POLYSTORE_CHECK_ARGUMENT(!steps_.empty(), "saga definition '" + name_ + "' has no steps");

    std::set<std::string> seen;
    for (size_t i = 0; i < steps_.size(); ++i) {
        const SagaStep& s = steps_[i];
        const std::string where = "step " + std::to_string(i) + " of '" + name_ + "'";

        POLYSTORE_CHECK_ARGUMENT(!s.id.empty(), where + " has an empty id");
        POLYSTORE_CHECK_ARGUMENT(!s.name.empty(), where + " ('" + s.id + "') has an empty name");
        POLYSTORE_CHECK_ARGUMENT(seen.insert(s.id).second, "duplicate step id '" + s.id + "' in '" + name_ + "'");
        POLYSTORE_CHECK_ARGUMENT(static_cast<bool>(s.action), where + " ('" + s.id + "') has no forward action");
        POLYSTORE_CHECK_ARGUMENT(!s.verify || s.has_compensation(),
                                 where + " ('" + s.id + "') verifies a compensation it does not have");
        POLYSTORE_CHECK_ARGUMENT(s.kind != StepKind::Gate || !s.has_compensation(),
                                 where + " ('" + s.id + "') is a gate and cannot be compensated");
    }
}

std::optional<size_t> SagaDefinition::index_of(const std::string& step_id) const {
    for (size_t i = 0; i < steps_.size(); ++i) {
        if (steps_[i].id == step_id) return i;
    }
    return std::nullopt;
}

} // namespace polystore
