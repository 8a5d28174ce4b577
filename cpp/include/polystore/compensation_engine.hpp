#pragma once

#include <string>
#include <vector>

#include "polystore/failure_log.hpp"
#include "polystore/saga.hpp"

namespace polystore {

/**
 * Runs the compensations of completed steps in strict reverse order.
 *
 * Best-effort: a failing item or a throwing compensation is recorded in the
 * FailureLog and the loop moves on to the next step. Items reported as
 * already absent count as successes, so compensating twice deletes nothing
 * the second time.
 */
class CompensationEngine {
public:
    explicit CompensationEngine(FailureLog& failure_log);

    /**
     * @param completed Indices into definition.steps(), in execution order
     */
    CompensationSummary compensate(const std::string& saga_id,
                                   const SagaDefinition& definition,
                                   const std::vector<size_t>& completed,
                                   SagaContext& context);

    /**
     * Writes one orphaned_* record per failed item; returns the error lines.
     * Also used for cleanup outside a rollback (a failed upload's partial chunks).
     */
    std::vector<std::string> record_failures(const std::string& saga_id,
                                             const std::string& step_id,
                                             const std::vector<CompensationItem>& items);

private:
    FailureLog& failure_log_;
};

} // namespace polystore
