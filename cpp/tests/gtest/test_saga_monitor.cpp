// =============================================================================
// Saga Monitor Tests
// =============================================================================

#include <gtest/gtest.h>
#include "polystore/saga_monitor.hpp"
#include "test_helpers.hpp"

using namespace polystore;

class SagaMonitorTest : public ::testing::Test {
protected:
    test_support::TempDir dir;
    FailureLog failure_log{dir.file("failures.jsonl")};
    SagaMonitor monitor{&failure_log};
};

// Test counters across the saga lifecycle
TEST_F(SagaMonitorTest, LifecycleCounters) {
    auto empty = monitor.get_stats();
    EXPECT_EQ(empty.active, 0u);
    EXPECT_DOUBLE_EQ(empty.success_rate, 1.0);
    EXPECT_DOUBLE_EQ(empty.success_percent(), 100.0);

    monitor.track_saga("s1");
    monitor.track_saga("s2");
    monitor.track_saga("s3");
    monitor.track_saga("s4");
    EXPECT_TRUE(monitor.is_active("s1"));
    EXPECT_EQ(monitor.get_stats().active, 4u);

    monitor.saga_completed("s1");
    monitor.saga_completed("s2");
    monitor.saga_rolled_back("s3", true);
    monitor.saga_rolled_back("s4", false);

    auto stats = monitor.get_stats();
    EXPECT_EQ(stats.active, 0u);
    EXPECT_EQ(stats.completed, 2u);
    EXPECT_EQ(stats.failed, 2u);
    EXPECT_EQ(stats.rolled_back, 2u);
    EXPECT_EQ(stats.successful_rollbacks, 1u);
    EXPECT_EQ(stats.failed_rollbacks, 1u);
    EXPECT_EQ(stats.pending_manual_cleanup, 1u);
    EXPECT_DOUBLE_EQ(stats.success_rate, 0.5);
    EXPECT_DOUBLE_EQ(stats.success_percent(), 50.0);
    EXPECT_FALSE(monitor.is_active("s1"));
}

// Test an alert lands in the failure log with its context
TEST_F(SagaMonitorTest, AlertWritesRecord) {
    monitor.alert_rollback_failure("saga-1", {"chunk x stuck", "record y stuck"},
                                   {{"failed_step", "insert_graph"}});

    auto records = failure_log.read_all();
    ASSERT_EQ(records.size(), 1u);
    const auto& rec = records[0];
    EXPECT_EQ(rec.kind, FailureKind::RollbackAlert);
    EXPECT_EQ(rec.saga_id, "saga-1");
    EXPECT_EQ(rec.detail.at("severity"), "CRITICAL");
    EXPECT_EQ(rec.detail.at("type"), "ROLLBACK_FAILURE");
    EXPECT_EQ(rec.detail.at("error_count"), "2");
    EXPECT_EQ(rec.detail.at("errors"), "chunk x stuck; record y stuck");
    EXPECT_EQ(rec.detail.at("failed_step"), "insert_graph");
}

// Test a monitor without a failure log only logs
TEST_F(SagaMonitorTest, AlertWithoutLog) {
    SagaMonitor bare;
    EXPECT_NO_THROW(bare.alert_rollback_failure("saga-2", {"oops"}));
    EXPECT_TRUE(failure_log.read_all().empty());
}
