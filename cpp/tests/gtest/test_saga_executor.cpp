// =============================================================================
// Saga Executor Tests
// =============================================================================

#include <gtest/gtest.h>
#include "polystore/saga_executor.hpp"
#include "polystore/error.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <regex>
#include <thread>

using namespace polystore;

class SagaExecutorTest : public ::testing::Test {
protected:
    test_support::TempDir dir;
    FailureLog failure_log{dir.file("failures.jsonl")};
    SagaJournal journal{dir.file("journal.log")};
    SagaMonitor monitor{&failure_log};
    CompensationEngine compensation{failure_log};
    SagaExecutor executor{compensation, &monitor, &journal};

    std::vector<std::string> trace;

    // Forward step that records itself and undoes with one item
    SagaStep step(const std::string& id, bool compensable = true) {
        SagaStep s;
        s.id = id;
        s.name = "Step " + id;
        s.action = [this, id](SagaContext&) {
            trace.push_back(id);
            return StepOutcome::success();
        };
        if (compensable) {
            s.compensation = [this, id](SagaContext&) {
                trace.push_back("undo-" + id);
                CompensationItem item;
                item.kind = CompensationItem::Kind::Other;
                item.resource_id = id;
                item.outcome = CompensationItem::Outcome::Removed;
                return std::vector<CompensationItem>{item};
            };
        }
        return s;
    }

    SagaStep failing(const std::string& id, RollbackReason reason) {
        SagaStep s = step(id, false);
        s.action = [this, id, reason](SagaContext&) {
            trace.push_back(id);
            return StepOutcome::rollback(reason, id + " refused");
        };
        return s;
    }
};

// Test every step runs in order and the saga completes
TEST_F(SagaExecutorTest, AllStepsSucceed) {
    SagaStep gate = step("check", false);
    gate.kind = StepKind::Gate;
    SagaDefinition def("demo", {step("a"), gate, step("b")});

    SagaContext ctx;
    auto r = executor.execute(def, ctx);

    EXPECT_TRUE(r.succeeded());
    EXPECT_EQ(r.status, SagaStatus::Completed);
    EXPECT_EQ(trace, (std::vector<std::string>{"a", "check", "b"}));
    EXPECT_EQ(r.completed_steps, (std::vector<std::string>{"a", "check", "b"}));
    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(r.saga_id, ctx.saga_id);
    EXPECT_LE(r.started_at, r.finished_at);

    EXPECT_FALSE(journal.get(r.saga_id).has_value());
    EXPECT_EQ(test_support::last_journaled_state(journal.path(), r.saga_id), "completed");

    auto stats = monitor.get_stats();
    EXPECT_EQ(stats.completed, 1u);
    EXPECT_EQ(stats.active, 0u);
}

// Test a failure compensates completed steps newest first
TEST_F(SagaExecutorTest, FailureCompensatesInReverse) {
    SagaStep gate = step("check", false);
    gate.kind = StepKind::Gate;
    SagaDefinition def("demo", {step("a"), step("b"), gate,
                                failing("c", RollbackReason::StepFailed), step("d")});

    SagaContext ctx;
    auto r = executor.execute(def, ctx);

    EXPECT_EQ(r.status, SagaStatus::Compensated);
    EXPECT_EQ(trace, (std::vector<std::string>{"a", "b", "check", "c", "undo-b", "undo-a"}));
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0], "c: step_failed: c refused");
    ASSERT_TRUE(r.failure.has_value());
    EXPECT_EQ(r.failure->reason, RollbackReason::StepFailed);

    EXPECT_EQ(r.compensation.attempted, 2);
    EXPECT_EQ(r.compensation.succeeded, 2);
    EXPECT_DOUBLE_EQ(r.compensation.success_rate(), 1.0);

    ASSERT_EQ(r.step_statuses.size(), 5u);
    EXPECT_EQ(r.step_statuses[0].second, StepStatus::Compensated);
    EXPECT_EQ(r.step_statuses[1].second, StepStatus::Compensated);
    EXPECT_EQ(r.step_statuses[2].second, StepStatus::Succeeded);
    EXPECT_EQ(r.step_statuses[3].second, StepStatus::Failed);
    EXPECT_EQ(r.step_statuses[4].second, StepStatus::Pending);

    EXPECT_FALSE(journal.get(r.saga_id).has_value());
    EXPECT_EQ(test_support::last_journaled_state(journal.path(), r.saga_id), "compensated");
    EXPECT_EQ(monitor.get_stats().successful_rollbacks, 1u);
}

// Test a throwing step becomes a rollback
TEST_F(SagaExecutorTest, ThrowingStepRollsBack) {
    SagaStep boom = step("insert", false);
    boom.action = [](SagaContext&) -> StepOutcome {
        throw StoreError("connection reset");
    };
    SagaDefinition def("demo", {step("a"), boom});

    SagaContext ctx;
    auto r = executor.execute(def, ctx);

    EXPECT_EQ(r.status, SagaStatus::Compensated);
    ASSERT_TRUE(r.failure.has_value());
    EXPECT_EQ(r.failure->reason, RollbackReason::StoreFailure);
    EXPECT_EQ(r.errors[0], "insert: store_failure: connection reset");
    EXPECT_EQ(trace, (std::vector<std::string>{"a", "undo-a"}));
}

// Test a step throwing something that is not an exception still rolls back
TEST_F(SagaExecutorTest, NonExceptionThrowRollsBack) {
    SagaStep odd = step("insert", false);
    odd.action = [](SagaContext&) -> StepOutcome { throw 42; };
    SagaDefinition def("demo", {step("a"), odd, step("b")});

    SagaContext ctx;
    ctx.operation_id = "op-7";
    auto r = executor.execute(def, ctx);

    EXPECT_EQ(r.status, SagaStatus::Compensated);
    ASSERT_TRUE(r.failure.has_value());
    EXPECT_EQ(r.failure->reason, RollbackReason::StepFailed);
    EXPECT_EQ(r.failure->message, "unknown exception");
    EXPECT_EQ(r.failure->operation_id, "op-7");
    EXPECT_EQ(r.errors[0], "insert: step_failed: unknown exception");
    EXPECT_EQ(trace, (std::vector<std::string>{"a", "undo-a"}));
    EXPECT_EQ(monitor.get_stats().active, 0u);
}

// Test a failed compensation ends in compensation_failed and raises an alert
TEST_F(SagaExecutorTest, CompensationFailureAlerts) {
    SagaStep sticky = step("a");
    sticky.compensation = [](SagaContext&) {
        CompensationItem item;
        item.kind = CompensationItem::Kind::Chunk;
        item.resource_id = "chunk-7";
        item.outcome = CompensationItem::Outcome::Failed;
        item.error = "permission denied";
        return std::vector<CompensationItem>{item};
    };
    SagaDefinition def("demo", {sticky, failing("b", RollbackReason::StoreFailure)});

    SagaContext ctx;
    auto r = executor.execute(def, ctx);

    EXPECT_EQ(r.status, SagaStatus::CompensationFailed);
    ASSERT_EQ(r.compensation_errors.size(), 1u);
    EXPECT_EQ(r.compensation_errors[0], "a: failed to remove chunk-7: permission denied");
    EXPECT_EQ(r.step_statuses[0].second, StepStatus::CompensationFailed);

    auto records = failure_log.read_all();
    bool orphan = false, alert = false;
    for (const auto& rec : records) {
        EXPECT_EQ(rec.saga_id, r.saga_id);
        if (rec.kind == FailureKind::OrphanedChunk && rec.detail.at("resource_id") == "chunk-7") orphan = true;
        if (rec.kind == FailureKind::RollbackAlert) {
            alert = true;
            EXPECT_EQ(rec.detail.at("severity"), "CRITICAL");
            EXPECT_EQ(rec.detail.at("failed_step"), "b");
        }
    }
    EXPECT_TRUE(orphan);
    EXPECT_TRUE(alert);

    auto stats = monitor.get_stats();
    EXPECT_EQ(stats.failed_rollbacks, 1u);
    EXPECT_EQ(stats.pending_manual_cleanup, 1u);
}

// Test a compensation whose resource is still present after undo fails verification
TEST_F(SagaExecutorTest, VerificationFailureCounts) {
    SagaStep a = step("a");
    a.verify = [](SagaContext&, const CompensationItem&) { return false; };
    SagaDefinition def("demo", {a, failing("b", RollbackReason::StepFailed)});

    SagaContext ctx;
    auto r = executor.execute(def, ctx);
    EXPECT_EQ(r.status, SagaStatus::CompensationFailed);
    ASSERT_EQ(r.compensation_errors.size(), 1u);
    EXPECT_NE(r.compensation_errors[0].find("still present after compensation"), std::string::npos);
}

// Test a cancelled context stops before the next step and rolls back
TEST_F(SagaExecutorTest, CancellationStopsBetweenSteps) {
    SagaContext ctx;
    SagaStep cancel_after = step("a");
    cancel_after.action = [this, &ctx](SagaContext&) {
        trace.push_back("a");
        ctx.cancel.cancel();
        return StepOutcome::success();
    };
    SagaDefinition def("demo", {cancel_after, step("b")});

    auto r = executor.execute(def, ctx);
    EXPECT_EQ(r.status, SagaStatus::Compensated);
    ASSERT_TRUE(r.failure.has_value());
    EXPECT_EQ(r.failure->reason, RollbackReason::Cancelled);
    EXPECT_EQ(trace, (std::vector<std::string>{"a", "undo-a"}));
}

// Test a caller-provided saga id is kept; otherwise one is generated
TEST_F(SagaExecutorTest, SagaIds) {
    SagaDefinition def("demo", {step("a")});

    SagaContext given;
    given.saga_id = "saga-custom";
    EXPECT_EQ(executor.execute(def, given).saga_id, "saga-custom");

    std::string id = SagaExecutor::generate_saga_id();
    EXPECT_TRUE(std::regex_match(id, std::regex("saga-[0-9a-f]{12}"))) << id;
    EXPECT_NE(id, SagaExecutor::generate_saga_id());
}

// Test concurrent executions share one definition safely
TEST_F(SagaExecutorTest, ConcurrentExecutions) {
    SagaStep counted;
    counted.id = "count";
    counted.name = "Count";
    std::atomic<int> runs{0};
    counted.action = [&runs](SagaContext&) {
        ++runs;
        return StepOutcome::success();
    };
    SagaDefinition def("demo", {counted});

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            SagaContext ctx;
            EXPECT_TRUE(executor.execute(def, ctx).succeeded());
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(runs.load(), 8);
    EXPECT_EQ(monitor.get_stats().completed, 8u);
    EXPECT_TRUE(journal.list_all().empty());
    EXPECT_EQ(test_support::read_lines(journal.path()).size(), 8u * 3u);
}
