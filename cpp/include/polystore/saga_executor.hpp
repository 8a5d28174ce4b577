#pragma once

#include <string>

#include "polystore/compensation_engine.hpp"
#include "polystore/saga.hpp"
#include "polystore/saga_journal.hpp"
#include "polystore/saga_monitor.hpp"

namespace polystore {

/**
 * Drives one saga execution:
 *   Pending -> Running -> Completed
 *                      -> Compensating -> Compensated | CompensationFailed
 *
 * Never throws for step failures; everything lands in the result.
 * Monitor and journal are optional and not owned.
 */
class SagaExecutor {
public:
    explicit SagaExecutor(CompensationEngine& compensation,
                          SagaMonitor* monitor = nullptr,
                          SagaJournal* journal = nullptr);

    // Assigns context.saga_id when it is empty
    SagaExecutionResult execute(const SagaDefinition& definition, SagaContext& context);

    static std::string generate_saga_id();

private:
    // Journals the operation id and record ids published so far with each state
    void transition(SagaExecutionState& state, const SagaContext& context, SagaStatus status,
                    int64_t step = -1, const std::string& detail = "");

    CompensationEngine& compensation_;
    SagaMonitor* monitor_;
    SagaJournal* journal_;
};

} // namespace polystore
