// =============================================================================
// Failure Log Tests
// =============================================================================

#include <gtest/gtest.h>
#include "polystore/failure_log.hpp"
#include "test_helpers.hpp"
#include <fstream>
#include <set>
#include <thread>

using namespace polystore;

class FailureLogTest : public ::testing::Test {
protected:
    test_support::TempDir dir;
};

// Test the serialized shape of one record
TEST_F(FailureLogTest, JsonShape) {
    FailureRecord rec;
    rec.timestamp = from_epoch_ms(1759406400123);
    rec.saga_id = "saga-abc";
    rec.kind = FailureKind::OrphanedChunk;
    rec.detail = {{"resource_id", "op-1-chunk-0"}, {"step", "chunked_upload"}};

    EXPECT_EQ(rec.to_json(),
              "{\"timestamp\":\"2025-10-02T12:00:00.123Z\",\"saga_id\":\"saga-abc\","
              "\"kind\":\"orphaned_chunk\",\"detail\":{\"resource_id\":\"op-1-chunk-0\","
              "\"step\":\"chunked_upload\"}}");
}

// Test escaping survives a write and read back
TEST_F(FailureLogTest, EscapesRoundTrip) {
    FailureRecord rec;
    rec.timestamp = from_epoch_ms(1700000000007);
    rec.saga_id = "saga-\"quoted\"";
    rec.kind = FailureKind::CriticalFailure;
    rec.detail = {{"error", "line1\nline2\ttab \\ back \x01 ctl"}, {"name", "caf\xc3\xa9"}};

    auto parsed = FailureRecord::from_json(rec.to_json());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->saga_id, rec.saga_id);
    EXPECT_EQ(parsed->kind, rec.kind);
    EXPECT_EQ(parsed->detail, rec.detail);
    EXPECT_EQ(parsed->timestamp, rec.timestamp);
}

// Test unicode escapes written by other tools decode to UTF-8
TEST_F(FailureLogTest, UnicodeEscapes) {
    auto parsed = FailureRecord::from_json(
        "{\"timestamp\":\"2025-01-01T00:00:00Z\",\"saga_id\":\"s\",\"kind\":\"rollback_alert\","
        "\"detail\":{\"a\":\"\\u00e9\",\"b\":\"\\ud83d\\ude00\"}}");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->detail.at("a"), "\xc3\xa9");
    EXPECT_EQ(parsed->detail.at("b"), "\xf0\x9f\x98\x80");
}

// Test malformed input is rejected
TEST_F(FailureLogTest, RejectsMalformed) {
    EXPECT_FALSE(FailureRecord::from_json("").has_value());
    EXPECT_FALSE(FailureRecord::from_json("{}").has_value());
    EXPECT_FALSE(FailureRecord::from_json("not json").has_value());
    EXPECT_FALSE(FailureRecord::from_json(
        "{\"timestamp\":\"2025-01-01T00:00:00Z\",\"saga_id\":\"s\",\"kind\":\"bogus\",\"detail\":{}}")
        .has_value());
    EXPECT_FALSE(FailureRecord::from_json(
        "{\"timestamp\":\"yesterday\",\"saga_id\":\"s\",\"kind\":\"orphaned_chunk\",\"detail\":{}}")
        .has_value());
}

// Test records append across reopen and malformed lines are skipped
TEST_F(FailureLogTest, AppendOnlyAcrossReopen) {
    auto path = dir.file("logs/failures.jsonl");
    {
        FailureLog log(path);
        log.append("saga-1", FailureKind::OrphanedChunk, {{"resource_id", "c1"}});
    }
    {
        std::ofstream garbage(path, std::ios::app);
        garbage << "{truncated\n";
    }
    FailureLog log(path);
    log.append("saga-2", FailureKind::OrphanedRecord, {{"resource_id", "r1"}});

    auto records = log.read_all();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].saga_id, "saga-1");
    EXPECT_EQ(records[1].saga_id, "saga-2");
    EXPECT_EQ(records[1].kind, FailureKind::OrphanedRecord);
}

// Test concurrent writers never interleave lines
TEST_F(FailureLogTest, ConcurrentAppends) {
    auto path = dir.file("failures.jsonl");
    FailureLog shared(path);
    FailureLog second(path);    // a second descriptor on the same file

    const int threads = 8;
    const int per_thread = 100;
    const std::string padding(300, 'x');

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            FailureLog& log = (t % 2) ? second : shared;
            for (int i = 0; i < per_thread; ++i) {
                log.append("saga-" + std::to_string(t), FailureKind::OrphanedChunk,
                           {{"i", std::to_string(i)}, {"pad", padding}});
            }
        });
    }
    for (auto& w : workers) w.join();

    auto records = shared.read_all();
    ASSERT_EQ(records.size(), static_cast<size_t>(threads * per_thread));

    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& rec : records) {
        EXPECT_EQ(rec.detail.at("pad"), padding);
        seen.emplace(rec.saga_id, rec.detail.at("i"));
    }
    EXPECT_EQ(seen.size(), records.size());
}

// Test kind names
TEST_F(FailureLogTest, KindNames) {
    for (auto kind : {FailureKind::OrphanedChunk, FailureKind::OrphanedRecord,
                      FailureKind::RollbackAlert, FailureKind::CriticalFailure}) {
        EXPECT_EQ(parse_failure_kind(to_string(kind)), kind);
    }
    EXPECT_FALSE(parse_failure_kind("orphan").has_value());
}
