#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "polystore/blake3.hpp"
#include "polystore/chunk_store.hpp"
#include "polystore/progress.hpp"
#include "polystore/source.hpp"
#include "polystore/step_result.hpp"
#include "polystore/types.hpp"

namespace polystore {

struct ChunkRecord {
    std::string chunk_id;        // <operation id>-chunk-<index>
    uint64_t index = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
    Blake3Hash digest;
    std::string storage_ref;
};

struct UploadResult {
    std::string operation_id;
    std::vector<ChunkRecord> chunks;
    uint64_t bytes_written = 0;
    uint64_t chunk_size = 0;
    int attempts = 0;
    std::vector<std::string> attempt_errors;
};

struct DownloadResult {
    std::string operation_id;
    uint64_t bytes = 0;
    uint64_t chunks = 0;
    Blake3Hash content_digest;
};

// Receives the bytes of one chunk; chunks arrive in index order
using ChunkSink = std::function<void(std::span<const uint8_t>)>;

/**
 * Resumable, retried chunked transfer of a source artifact into a ChunkStore.
 *
 * Every call registers an operation. A retry resumes after the last chunk the
 * store accepted. Source loss and corrupt resume bookkeeping are escalated at
 * once; other failures are retried up to max_attempts with a fixed delay.
 *
 * A paused upload stops at the next chunk boundary and returns a Paused
 * rollback signal; resume() continues it from the first missing chunk.
 */
class ChunkUploader {
public:
    explicit ChunkUploader(ChunkStore& store);

    StepResult<UploadResult> upload(const SourceArtifact& source,
                                    uint64_t chunk_size,
                                    int max_attempts,
                                    std::chrono::milliseconds retry_delay,
                                    const ProgressSink& progress = {},
                                    const CancellationToken* cancel = nullptr);

    /**
     * Continue a paused operation against the same source.
     * Unknown operations return an OperationNotFound signal.
     * @throws InvalidArgumentError if the operation is not paused
     */
    StepResult<UploadResult> resume(const std::string& operation_id,
                                    const SourceArtifact& source,
                                    int max_attempts,
                                    std::chrono::milliseconds retry_delay,
                                    const ProgressSink& progress = {},
                                    const CancellationToken* cancel = nullptr);

    /**
     * Stream a completed upload back out of the chunk store.
     * Each chunk is checked against its recorded digest, and the whole
     * artifact against the digest taken while uploading.
     * @throws InvalidArgumentError if the operation is unknown or not completed
     * @throws IntegrityError if a chunk is missing or its bytes changed
     */
    DownloadResult download(const std::string& operation_id, const ChunkSink& sink) const;

    // Operation registry
    std::optional<UploadProgress> get_progress(const std::string& operation_id) const;
    std::vector<UploadProgress> list_operations(std::optional<UploadStatus> status = std::nullopt) const;
    std::vector<ChunkRecord> operation_chunks(const std::string& operation_id) const;
    bool cancel_operation(const std::string& operation_id);
    bool pause_operation(const std::string& operation_id);
    bool forget_operation(const std::string& operation_id);
    size_t cleanup_completed_operations(std::chrono::seconds max_age = std::chrono::seconds(3600));
    size_t operation_count() const;

    /**
     * Delete every chunk of an operation, verifying each one is gone.
     * A chunk that is already absent is reported as such and not deleted again.
     */
    std::vector<CompensationItem> cleanup_chunks(const std::string& operation_id);
    std::vector<CompensationItem> cleanup_chunks(std::span<const ChunkRecord> chunks);

    ChunkStore& store() { return store_; }

    static std::string chunk_id(const std::string& operation_id, uint64_t index);
    static uint64_t expected_chunk_count(uint64_t size, uint64_t chunk_size);

private:
    struct Operation {
        UploadProgress progress;
        uint64_t chunk_size = 0;
        uint64_t source_size = 0;
        bool sized = false;
        std::vector<ChunkRecord> chunks;
        Blake3Hasher::Incremental content;    // accepted chunks, in order
        std::optional<Blake3Hash> content_digest;
        bool cancel_requested = false;
        bool pause_requested = false;
        TimePoint started;
        std::optional<TimePoint> finished;
    };

    enum class Transfer { Done, Cancelled, Paused };

    StepResult<UploadResult> run(const std::string& operation_id,
                                 const SourceArtifact& source,
                                 int max_attempts,
                                 std::chrono::milliseconds retry_delay,
                                 const ProgressSink& progress,
                                 const CancellationToken* cancel);

    // One attempt, from the first missing chunk to the end or a stop request
    Transfer transfer(const std::string& operation_id,
                      const SourceArtifact& source,
                      const ProgressSink& progress,
                      const CancellationToken* cancel);

    // Caller holds mutex_
    Operation& find_operation(const std::string& operation_id);
    const Operation& find_operation(const std::string& operation_id) const;

    void check_bookkeeping(const std::string& operation_id, uint64_t source_size) const;
    bool cancelled(const std::string& operation_id, const CancellationToken* cancel) const;
    void finish(const std::string& operation_id, UploadStatus status);
    void emit(const ProgressSink& progress, const UploadProgress& snapshot) const;

    ChunkStore& store_;
    mutable std::mutex mutex_;
    std::map<std::string, Operation> operations_;
};

} // namespace polystore
