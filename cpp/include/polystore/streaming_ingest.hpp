#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "polystore/chunk_store.hpp"
#include "polystore/chunk_uploader.hpp"
#include "polystore/compensation_engine.hpp"
#include "polystore/config.hpp"
#include "polystore/failure_log.hpp"
#include "polystore/integrity_verifier.hpp"
#include "polystore/record_store.hpp"
#include "polystore/saga.hpp"
#include "polystore/saga_executor.hpp"
#include "polystore/saga_journal.hpp"
#include "polystore/saga_monitor.hpp"
#include "polystore/source.hpp"

namespace polystore {

constexpr uint64_t SMALL_CHUNK_SIZE = 1 * 1024 * 1024;
constexpr uint64_t DEFAULT_CHUNK_SIZE = 5 * 1024 * 1024;
constexpr uint64_t LARGE_CHUNK_SIZE = 10 * 1024 * 1024;
constexpr uint64_t MAX_CHUNK_SIZE = 50 * 1024 * 1024;

// Downstream stores, written in this order. Null entries are skipped.
struct DownstreamStores {
    DownstreamStore* vector = nullptr;
    DownstreamStore* graph = nullptr;
    DownstreamStore* relational = nullptr;
};

struct SubmitResult {
    bool success = false;
    std::string saga_id;
    std::string status;                         // SagaStatus as text
    std::optional<std::string> document_id;
    bool rollback_performed = false;
    std::optional<std::string> rollback_status; // success | partial_failure
    std::vector<std::string> errors;
    std::vector<std::string> compensation_errors;
    std::string operation_id;
    std::vector<std::string> attempt_failures;
};

/**
 * Entry point for streaming ingest.
 *
 * Owns the streaming-upload saga definition:
 *   validate_source, chunked_upload, verify_integrity, assign_document_id,
 *   insert_vector, insert_graph, insert_relational, finalize
 * and maps each execution to a SubmitResult.
 */
class StreamingIngestService {
public:
    StreamingIngestService(ChunkStore& chunk_store,
                           DownstreamStores stores,
                           FailureLog& failure_log,
                           SagaMonitor& monitor,
                           SagaJournal* journal = nullptr,
                           IngestOptions options = {});

    StreamingIngestService(const StreamingIngestService&) = delete;
    StreamingIngestService& operator=(const StreamingIngestService&) = delete;

    /**
     * @throws InvalidArgumentError if chunk_size is 0 or max_attempts < 1
     */
    SubmitResult submit_streaming_upload(const SourceArtifact& source,
                                         uint64_t chunk_size,
                                         int max_attempts,
                                         const Metadata& metadata = {},
                                         const ProgressSink& progress = {},
                                         const CancellationToken* cancel = nullptr);

    // Chunk size and attempt bound from the service options
    SubmitResult submit_streaming_upload(const SourceArtifact& source,
                                         const Metadata& metadata = {});

    const SagaDefinition& definition() const { return definition_; }
    ChunkUploader& uploader() { return uploader_; }
    const IngestOptions& options() const { return options_; }

private:
    SagaDefinition build_definition();
    SagaStep insert_step(const std::string& role, DownstreamStore* store);

    ChunkStore& chunk_store_;
    DownstreamStores stores_;
    FailureLog& failure_log_;
    SagaMonitor& monitor_;
    SagaJournal* journal_;
    IngestOptions options_;

    ChunkUploader uploader_;
    IntegrityVerifier verifier_;
    CompensationEngine compensation_;
    SagaExecutor executor_;
    SagaDefinition definition_;
};

// "1.50 MB"
std::string format_bytes(uint64_t bytes);
// "42.0s", "2.5m", "1.2h"
std::string format_duration(double seconds);
// Chunk size bounded to [1 MiB, 50 MiB] from memory and network constraints
uint64_t optimal_chunk_size(uint64_t file_size, uint64_t available_memory,
                            double network_mbps = 100.0);

} // namespace polystore
