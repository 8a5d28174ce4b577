// =============================================================================
// Chunk Uploader Tests
// =============================================================================

#include <gtest/gtest.h>
#include "polystore/chunk_uploader.hpp"
#include "polystore/blake3.hpp"
#include "polystore/error.hpp"
#include "test_helpers.hpp"
#include <chrono>

using namespace polystore;
using namespace std::chrono_literals;

namespace {

// Size grows after a transient read failure, as if the file were rewritten
class ShiftingSource : public SourceArtifact {
public:
    explicit ShiftingSource(Bytes data) : data_(std::move(data)) {}

    uint64_t size() const override { return reads_ >= 2 ? data_.size() + 10 : data_.size(); }
    Bytes read(uint64_t offset, uint64_t length) const override {
        if (++reads_ == 2) throw IOError("transient read failure");
        return Bytes(data_.begin() + offset, data_.begin() + offset + length);
    }
    bool available() const override { return true; }
    std::string describe() const override { return "shifting"; }

private:
    Bytes data_;
    mutable int reads_ = 0;
};

} // anonymous namespace

class ChunkUploaderTest : public ::testing::Test {
protected:
    test_support::FlakyChunkStore store;
    ChunkUploader uploader{store};
};

// Test a clean upload splits the source into ordered chunks
TEST_F(ChunkUploaderTest, CleanUpload) {
    Bytes data = test_support::make_bytes(10000);
    MemorySource src(data, "clean");

    std::vector<UploadProgress> events;
    auto r = uploader.upload(src, 4096, 3, 0ms, [&](const UploadProgress& p) { events.push_back(p); });
    ASSERT_TRUE(r.ok()) << r.signal().describe();

    const UploadResult& up = r.value();
    ASSERT_EQ(up.chunks.size(), 3u);
    EXPECT_EQ(up.bytes_written, 10000u);
    EXPECT_EQ(up.attempts, 1);
    EXPECT_TRUE(up.attempt_errors.empty());
    EXPECT_EQ(store.size(), 3u);

    for (size_t i = 0; i < up.chunks.size(); ++i) {
        const ChunkRecord& c = up.chunks[i];
        EXPECT_EQ(c.index, i);
        EXPECT_EQ(c.offset, i * 4096);
        EXPECT_EQ(c.chunk_id, ChunkUploader::chunk_id(up.operation_id, i));
        EXPECT_EQ(c.storage_ref, "mem://" + c.chunk_id);
        EXPECT_EQ(c.digest, Blake3Hasher::hash(store.get(c.chunk_id).value()));
    }
    EXPECT_EQ(up.chunks[2].size, 10000u - 2 * 4096);

    // One event per chunk plus the completion event
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].current_chunk, 1u);
    EXPECT_EQ(events.back().status, UploadStatus::Completed);
    EXPECT_DOUBLE_EQ(events.back().percent_complete, 100.0);
    EXPECT_EQ(events.back().transferred_bytes, 10000u);
}

// Test an empty source uploads zero chunks
TEST_F(ChunkUploaderTest, EmptySource) {
    MemorySource src(Bytes{}, "empty");
    auto r = uploader.upload(src, 1024, 3, 0ms);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value().chunks.empty());
    EXPECT_EQ(store.put_calls(), 0);
}

// Test a retry resumes after the last accepted chunk
TEST_F(ChunkUploaderTest, RetryResumesFromLastChunk) {
    store.fail_puts = {3};
    MemorySource src(test_support::make_bytes(5000), "resume");

    auto r = uploader.upload(src, 1000, 3, 0ms);
    ASSERT_TRUE(r.ok()) << r.signal().describe();

    EXPECT_EQ(r.value().attempts, 2);
    ASSERT_EQ(r.value().attempt_errors.size(), 1u);
    EXPECT_NE(r.value().attempt_errors[0].find("attempt 1/3"), std::string::npos);
    EXPECT_EQ(r.value().chunks.size(), 5u);

    // Chunks 0 and 1 were not sent again
    EXPECT_EQ(store.put_calls(), 6);
    EXPECT_EQ(store.size(), 5u);
}

// Test the retry bound escalates to max_retries_exceeded
TEST_F(ChunkUploaderTest, MaxRetriesExceeded) {
    store.fail_puts = {1, 2, 3};
    MemorySource src(test_support::make_bytes(3000), "flaky");

    auto r = uploader.upload(src, 1000, 3, 0ms);
    ASSERT_FALSE(r.ok());

    const RollbackSignal& s = r.signal();
    EXPECT_EQ(s.reason, RollbackReason::MaxRetriesExceeded);
    EXPECT_EQ(s.attempts, 3);
    EXPECT_EQ(s.attempt_errors.size(), 3u);
    EXPECT_NE(s.last_error.find("injected put failure #3"), std::string::npos);
    EXPECT_FALSE(s.operation_id.empty());

    auto progress = uploader.get_progress(s.operation_id);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, UploadStatus::Failed);
}

// Test the configured delay separates attempts
TEST_F(ChunkUploaderTest, RetryDelayApplied) {
    store.fail_puts = {1};
    MemorySource src(test_support::make_bytes(100), "delayed");

    auto start = std::chrono::steady_clock::now();
    auto r = uploader.upload(src, 1000, 2, 30ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(r.ok());
    EXPECT_GE(elapsed, 30ms);
}

// Test a missing source escalates without retrying
TEST_F(ChunkUploaderTest, SourceNotFoundEscalatesImmediately) {
    MemorySource src(test_support::make_bytes(100), "gone");
    src.set_available(false);

    auto r = uploader.upload(src, 10, 5, 0ms);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.signal().reason, RollbackReason::SourceNotFound);
    EXPECT_EQ(r.signal().attempts, 1);
    EXPECT_EQ(store.put_calls(), 0);
}

// Test a source that vanishes mid-transfer is not retried
TEST_F(ChunkUploaderTest, SourceLostMidUpload) {
    MemorySource src(test_support::make_bytes(5000), "vanishing");

    auto r = uploader.upload(src, 1000, 5, 0ms, [&](const UploadProgress& p) {
        if (p.current_chunk == 2) src.set_available(false);
    });
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.signal().reason, RollbackReason::SourceNotFound);
    EXPECT_EQ(r.signal().attempts, 1);

    // The partial upload is still registered for cleanup
    EXPECT_EQ(uploader.operation_chunks(r.signal().operation_id).size(), 2u);
}

// Test a source whose size changes between attempts is reported as corrupt bookkeeping
TEST_F(ChunkUploaderTest, SizeChangeIsMetadataCorrupt) {
    ShiftingSource src(test_support::make_bytes(5000));

    auto r = uploader.upload(src, 1000, 5, 0ms);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.signal().reason, RollbackReason::MetadataCorrupt);
    EXPECT_EQ(r.signal().attempts, 2);
    EXPECT_EQ(r.signal().attempt_errors.size(), 2u);
}

// Test the cancellation token stops the transfer between chunks
TEST_F(ChunkUploaderTest, CancelledByToken) {
    CancellationToken token;
    MemorySource src(test_support::make_bytes(5000), "cancel");

    auto r = uploader.upload(src, 1000, 3, 0ms, [&](const UploadProgress& p) {
        if (p.current_chunk == 1) token.cancel();
    }, &token);

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.signal().reason, RollbackReason::Cancelled);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(uploader.get_progress(r.signal().operation_id)->status, UploadStatus::Cancelled);
}

// Test cancel_operation through the registry
TEST_F(ChunkUploaderTest, CancelledByOperationId) {
    MemorySource src(test_support::make_bytes(5000), "cancel-op");

    auto r = uploader.upload(src, 1000, 3, 0ms, [&](const UploadProgress& p) {
        if (p.current_chunk == 3) EXPECT_TRUE(uploader.cancel_operation(p.operation_id));
    });

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.signal().reason, RollbackReason::Cancelled);
    EXPECT_EQ(store.size(), 3u);

    // A finished operation cannot be cancelled again
    EXPECT_FALSE(uploader.cancel_operation(r.signal().operation_id));
    EXPECT_FALSE(uploader.cancel_operation("op-unknown"));
}

// Test registry lookups and cleanup of finished operations
TEST_F(ChunkUploaderTest, OperationRegistry) {
    MemorySource src(test_support::make_bytes(2000), "registry");

    auto a = uploader.upload(src, 1000, 1, 0ms);
    auto b = uploader.upload(src, 1000, 1, 0ms);
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(a.value().operation_id, b.value().operation_id);
    EXPECT_EQ(uploader.operation_count(), 2u);

    auto p = uploader.get_progress(a.value().operation_id);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->chunk_count, 2u);
    EXPECT_EQ(p->status, UploadStatus::Completed);
    EXPECT_FALSE(uploader.get_progress("op-missing").has_value());

    // Too young to drop
    EXPECT_EQ(uploader.cleanup_completed_operations(std::chrono::seconds(3600)), 0u);

    EXPECT_TRUE(uploader.forget_operation(a.value().operation_id));
    EXPECT_FALSE(uploader.forget_operation(a.value().operation_id));
    EXPECT_EQ(uploader.cleanup_completed_operations(std::chrono::seconds(0)), 1u);
    EXPECT_EQ(uploader.operation_count(), 0u);
}

// Test listing operations with and without a status filter
TEST_F(ChunkUploaderTest, ListOperations) {
    MemorySource src(test_support::make_bytes(2000), "listed");
    auto ok = uploader.upload(src, 1000, 1, 0ms);
    store.fail_puts = {3};
    auto failed = uploader.upload(src, 1000, 1, 0ms);
    ASSERT_TRUE(ok.ok());
    ASSERT_FALSE(failed.ok());

    EXPECT_EQ(uploader.list_operations().size(), 2u);

    auto completed = uploader.list_operations(UploadStatus::Completed);
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0].operation_id, ok.value().operation_id);

    auto failures = uploader.list_operations(UploadStatus::Failed);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].operation_id, failed.signal().operation_id);

    EXPECT_TRUE(uploader.list_operations(UploadStatus::Paused).empty());
}

// Test a paused upload stops at a chunk boundary and resumes where it stopped
TEST_F(ChunkUploaderTest, PauseAndResume) {
    Bytes data = test_support::make_bytes(5000);
    MemorySource src(data, "pausable");

    auto first = uploader.upload(src, 1000, 3, 0ms, [&](const UploadProgress& p) {
        if (p.current_chunk == 2) EXPECT_TRUE(uploader.pause_operation(p.operation_id));
    });
    ASSERT_FALSE(first.ok());
    EXPECT_EQ(first.signal().reason, RollbackReason::Paused);

    const std::string op = first.signal().operation_id;
    EXPECT_EQ(uploader.get_progress(op)->status, UploadStatus::Paused);
    EXPECT_EQ(uploader.operation_chunks(op).size(), 2u);
    EXPECT_EQ(store.put_calls(), 2);
    EXPECT_EQ(uploader.list_operations(UploadStatus::Paused).size(), 1u);

    // Already paused
    EXPECT_FALSE(uploader.pause_operation(op));
    EXPECT_FALSE(uploader.pause_operation("op-unknown"));
    // Paused uploads cannot be read back yet
    EXPECT_THROW(uploader.download(op, {}), InvalidArgumentError);

    auto second = uploader.resume(op, src, 3, 0ms);
    ASSERT_TRUE(second.ok()) << second.signal().describe();
    EXPECT_EQ(second.value().operation_id, op);
    ASSERT_EQ(second.value().chunks.size(), 5u);
    EXPECT_EQ(second.value().bytes_written, 5000u);
    EXPECT_EQ(store.put_calls(), 5);
    EXPECT_EQ(uploader.get_progress(op)->status, UploadStatus::Completed);

    // The digest spans chunks from both sessions
    auto back = uploader.download(op, {});
    EXPECT_EQ(back.content_digest, Blake3Hasher::hash(data));
    EXPECT_FALSE(uploader.pause_operation(op));
}

// Test resume rejects operations that are unknown or not paused
TEST_F(ChunkUploaderTest, ResumeRequiresPausedOperation) {
    MemorySource src(test_support::make_bytes(2000), "done");
    auto r = uploader.upload(src, 1000, 1, 0ms);
    ASSERT_TRUE(r.ok());

    EXPECT_THROW(uploader.resume(r.value().operation_id, src, 3, 0ms), InvalidArgumentError);

    auto missing = uploader.resume("op-unknown", src, 3, 0ms);
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.signal().reason, RollbackReason::OperationNotFound);
    EXPECT_EQ(missing.signal().operation_id, "op-unknown");
}

// Test a completed upload reads back byte for byte
TEST_F(ChunkUploaderTest, DownloadReturnsUploadedBytes) {
    Bytes data = test_support::make_bytes(4500);
    MemorySource src(data, "readback");
    auto r = uploader.upload(src, 1000, 1, 0ms);
    ASSERT_TRUE(r.ok());

    Bytes collected;
    std::vector<size_t> sizes;
    auto back = uploader.download(r.value().operation_id, [&](std::span<const uint8_t> chunk) {
        collected.insert(collected.end(), chunk.begin(), chunk.end());
        sizes.push_back(chunk.size());
    });

    EXPECT_EQ(collected, data);
    EXPECT_EQ(sizes, (std::vector<size_t>{1000, 1000, 1000, 1000, 500}));
    EXPECT_EQ(back.bytes, 4500u);
    EXPECT_EQ(back.chunks, 5u);
    EXPECT_EQ(back.operation_id, r.value().operation_id);
    EXPECT_EQ(back.content_digest, Blake3Hasher::hash(data));

    EXPECT_THROW(uploader.download("op-unknown", {}), InvalidArgumentError);
}

// Test read-back fails on a chunk that was altered or lost after upload
TEST_F(ChunkUploaderTest, DownloadDetectsDamage) {
    MemorySource src(test_support::make_bytes(3000), "damaged");
    auto r = uploader.upload(src, 1000, 1, 0ms);
    ASSERT_TRUE(r.ok());
    const auto& chunks = r.value().chunks;

    Bytes altered = test_support::make_bytes(1000, 99);
    store.put(chunks[1].chunk_id, altered);
    EXPECT_THROW(uploader.download(r.value().operation_id, {}), IntegrityError);

    MemorySource other(test_support::make_bytes(3000, 5), "lost");
    auto lost = uploader.upload(other, 1000, 1, 0ms);
    ASSERT_TRUE(lost.ok());
    ASSERT_TRUE(store.remove(lost.value().chunks[2].chunk_id));

    size_t delivered = 0;
    try {
        uploader.download(lost.value().operation_id, [&](std::span<const uint8_t>) { ++delivered; });
        FAIL() << "expected IntegrityError";
    } catch (const IntegrityError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INTEGRITY_MISMATCH);
        EXPECT_NE(e.message().find("missing"), std::string::npos) << e.message();
    }
    EXPECT_EQ(delivered, 2u);
}

// Test chunk cleanup deletes, then reports already-absent on repeat
TEST_F(ChunkUploaderTest, CleanupChunksIsIdempotent) {
    MemorySource src(test_support::make_bytes(3000), "cleanup");
    auto r = uploader.upload(src, 1000, 1, 0ms);
    ASSERT_TRUE(r.ok());

    auto first = uploader.cleanup_chunks(r.value().operation_id);
    ASSERT_EQ(first.size(), 3u);
    for (const auto& item : first) {
        EXPECT_EQ(item.kind, CompensationItem::Kind::Chunk);
        EXPECT_EQ(item.outcome, CompensationItem::Outcome::Removed);
    }
    EXPECT_EQ(store.size(), 0u);

    int removes = store.remove_calls();
    auto second = uploader.cleanup_chunks(std::span<const ChunkRecord>(r.value().chunks));
    for (const auto& item : second) {
        EXPECT_EQ(item.outcome, CompensationItem::Outcome::AlreadyAbsent);
    }
    EXPECT_EQ(store.remove_calls(), removes);

    EXPECT_TRUE(uploader.cleanup_chunks("op-unknown").empty());
}

// Test refused and silently ignored deletes are reported as failures
TEST_F(ChunkUploaderTest, CleanupChunksReportsFailures) {
    MemorySource src(test_support::make_bytes(3000), "stuck");
    auto r = uploader.upload(src, 1000, 1, 0ms);
    ASSERT_TRUE(r.ok());

    const auto& chunks = r.value().chunks;
    store.refuse_remove = {chunks[0].chunk_id};
    store.ignore_remove = {chunks[1].chunk_id};

    auto items = uploader.cleanup_chunks(std::span<const ChunkRecord>(chunks));
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].outcome, CompensationItem::Outcome::Failed);
    EXPECT_EQ(items[0].error, "chunk store refused delete");
    EXPECT_EQ(items[1].outcome, CompensationItem::Outcome::Failed);
    EXPECT_EQ(items[1].error, "chunk still present after delete");
    EXPECT_EQ(items[2].outcome, CompensationItem::Outcome::Removed);
}

// Test argument validation
TEST_F(ChunkUploaderTest, InvalidArguments) {
    MemorySource src(std::string_view("x"));
    EXPECT_THROW(uploader.upload(src, 0, 3, 0ms), InvalidArgumentError);
    EXPECT_THROW(uploader.upload(src, 10, 0, 0ms), InvalidArgumentError);
}

// Test chunk count arithmetic
TEST_F(ChunkUploaderTest, ExpectedChunkCount) {
    EXPECT_EQ(ChunkUploader::expected_chunk_count(0, 10), 0u);
    EXPECT_EQ(ChunkUploader::expected_chunk_count(10, 10), 1u);
    EXPECT_EQ(ChunkUploader::expected_chunk_count(11, 10), 2u);
    EXPECT_EQ(ChunkUploader::expected_chunk_count(10, 0), 0u);
}
