#include "polystore/streaming_ingest.hpp"

#include <algorithm>
#include <cstdio>

#include "polystore/blake3.hpp"
#include "polystore/error.hpp"
#include "polystore/logging.hpp"

namespace polystore {

namespace {

std::string join(const std::vector<std::string>& parts, const char* sep = "; ") {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += sep;
        out += p;
    }
    return out;
}

StepOutcome ok() {
    return StepOutcome::success();
}

} // anonymous namespace

StreamingIngestService::StreamingIngestService(ChunkStore& chunk_store,
                                               DownstreamStores stores,
                                               FailureLog& failure_log,
                                               SagaMonitor& monitor,
                                               SagaJournal* journal,
                                               IngestOptions options)
    : chunk_store_(chunk_store)
    , stores_(stores)
    , failure_log_(failure_log)
    , monitor_(monitor)
    , journal_(journal)
    , options_(std::move(options))
    , uploader_(chunk_store)
    , verifier_(chunk_store)
    , compensation_(failure_log)
    , executor_(compensation_, &monitor_, journal_)
    , definition_(build_definition()) {}

// =============================================================================
// Saga definition
// =============================================================================

SagaDefinition StreamingIngestService::build_definition() {
    std::vector<SagaStep> steps;

    // Source must exist and be readable before anything is written
    steps.push_back({"validate_source", "Validate source artifact", StepKind::Action,
        [](SagaContext& ctx) -> StepOutcome {
            if (!ctx.source) {
                return StepOutcome::rollback(RollbackReason::StepFailed, "no source artifact");
            }
            if (!ctx.source->available()) {
                return StepOutcome::rollback(RollbackReason::SourceNotFound,
                                             "source not found: " + ctx.source->describe());
            }
            try {
                LOG_INFO("[", ctx.saga_id, "] ingesting ", ctx.source->describe(), " (",
                         format_bytes(ctx.source->size()), ")");
            } catch (const SourceUnavailableError& e) {
                return StepOutcome::rollback(RollbackReason::SourceNotFound, e.message());
            }
            return ok();
        },
        {}, {}});

    steps.push_back({"chunked_upload", "Chunked upload with retry", StepKind::Action,
        [this](SagaContext& ctx) -> StepOutcome {
            auto result = uploader_.upload(*ctx.source, ctx.chunk_size, ctx.max_attempts,
                                           ctx.retry_delay, ctx.progress, &ctx.cancel);
            if (result.ok()) {
                ctx.operation_id = result.value().operation_id;
                ctx.attempt_failures = result.value().attempt_errors;
                ctx.upload = std::move(result.value());
                return ok();
            }

            const RollbackSignal& signal = result.signal();
            ctx.operation_id = signal.operation_id;
            ctx.attempt_failures = signal.attempt_errors;

            // The step never completed, so its compensation will not run:
            // drop whatever part of the upload made it into the store now.
            auto items = uploader_.cleanup_chunks(signal.operation_id);
            auto orphaned = compensation_.record_failures(ctx.saga_id, "chunked_upload", items);
            if (!orphaned.empty()) {
                LOG_ERROR("[", ctx.saga_id, "] ", orphaned.size(),
                          " partial chunk(s) left behind by failed upload");
            }
            return StepOutcome::rollback(signal);
        },
        [this](SagaContext& ctx) -> std::vector<CompensationItem> {
            if (!ctx.upload) return {};
            return uploader_.cleanup_chunks(std::span<const ChunkRecord>(ctx.upload->chunks));
        },
        [this](SagaContext&, const CompensationItem& item) {
            return !chunk_store_.exists(item.resource_id);
        }});

    // Fail-closed: nothing below runs unless every check passes
    steps.push_back({"verify_integrity", "Verify upload integrity", StepKind::Gate,
        [this](SagaContext& ctx) -> StepOutcome {
            if (!ctx.upload) {
                return StepOutcome::rollback(RollbackReason::StepFailed, "no upload to verify");
            }
            try {
                ctx.integrity = verifier_.verify(*ctx.source, *ctx.upload);
            } catch (const SourceUnavailableError& e) {
                return StepOutcome::rollback(RollbackReason::SourceNotFound, e.message());
            }
            if (!ctx.integrity->ok()) {
                RollbackSignal signal;
                signal.reason = RollbackReason::IntegrityMismatch;
                signal.message = ctx.integrity->summary();
                signal.operation_id = ctx.operation_id;
                return StepOutcome::rollback(std::move(signal));
            }
            return ok();
        },
        {}, {}});

    steps.push_back({"assign_document_id", "Assign document id", StepKind::Action,
        [](SagaContext& ctx) -> StepOutcome {
            const std::string digest = ctx.integrity ? ctx.integrity->actual_digest.to_hex() : "";
            ctx.document_id = "doc-" + Blake3Hasher::hash(ctx.saga_id + ":" + digest).to_hex().substr(0, 32);
            LOG_DEBUG("[", ctx.saga_id, "] document id ", ctx.document_id);
            return ok();
        },
        {}, {}});

    if (stores_.vector) steps.push_back(insert_step("vector", stores_.vector));
    if (stores_.graph) steps.push_back(insert_step("graph", stores_.graph));
    if (stores_.relational) steps.push_back(insert_step("relational", stores_.relational));

    steps.push_back({"finalize", "Finalize ingest", StepKind::Action,
        [](SagaContext& ctx) -> StepOutcome {
            std::string stores;
            for (const auto& [role, id] : ctx.record_ids) {
                if (!stores.empty()) stores += ", ";
                stores += role + "=" + id;
            }
            LOG_INFO("[", ctx.saga_id, "] ingested ", ctx.document_id, " (",
                     ctx.upload ? ctx.upload->chunks.size() : 0, " chunks",
                     stores.empty() ? "" : "; ", stores, ")");
            return ok();
        },
        {}, {}});

    return SagaDefinition("streaming_upload", std::move(steps));
}

SagaStep StreamingIngestService::insert_step(const std::string& role, DownstreamStore* store) {
    SagaStep step;
    step.id = "insert_" + role;
    step.name = "Insert into " + role + " store (" + store->name() + ")";
    step.kind = StepKind::Action;

    step.action = [role, store](SagaContext& ctx) -> StepOutcome {
        StoreRecord record;
        record.document_id = ctx.document_id;
        record.saga_id = ctx.saga_id;
        record.source = ctx.source ? ctx.source->describe() : "";
        record.metadata = ctx.metadata;
        if (ctx.integrity) {
            record.content_digest = ctx.integrity->actual_digest;
            record.size_bytes = ctx.integrity->actual_size;
            record.chunk_count = ctx.integrity->actual_chunks;
        }
        if (ctx.upload) {
            for (const auto& c : ctx.upload->chunks) record.chunk_refs.push_back(c.storage_ref);
        }

        // StoreError propagates; the executor turns it into a rollback
        ctx.record_ids[role] = store->insert(record);
        LOG_DEBUG("[", ctx.saga_id, "] ", role, " record ", ctx.record_ids[role]);
        return StepOutcome::success();
    };

    step.compensation = [role, store](SagaContext& ctx) -> std::vector<CompensationItem> {
        auto it = ctx.record_ids.find(role);
        if (it == ctx.record_ids.end()) return {};

        CompensationItem item;
        item.kind = CompensationItem::Kind::Record;
        item.resource_id = it->second;
        try {
            if (!store->exists(item.resource_id)) {
                item.outcome = CompensationItem::Outcome::AlreadyAbsent;
            } else if (store->remove(item.resource_id)) {
                item.outcome = CompensationItem::Outcome::Removed;
            } else {
                item.outcome = CompensationItem::Outcome::Failed;
                item.error = role + " store refused delete";
            }
        } catch (const PolystoreException& e) {
            item.outcome = CompensationItem::Outcome::Failed;
            item.error = e.message();
        } catch (const std::exception& e) {
            item.outcome = CompensationItem::Outcome::Failed;
            item.error = e.what();
        }
        return {item};
    };

    step.verify = [store](SagaContext&, const CompensationItem& item) {
        return !store->exists(item.resource_id);
    };
    return step;
}

// =============================================================================
// Entry point
// =============================================================================

SubmitResult StreamingIngestService::submit_streaming_upload(const SourceArtifact& source,
                                                             uint64_t chunk_size,
                                                             int max_attempts,
                                                             const Metadata& metadata,
                                                             const ProgressSink& progress,
                                                             const CancellationToken* cancel) {
    POLYSTORE_CHECK_ARGUMENT(chunk_size > 0, "chunk_size must be positive");
    POLYSTORE_CHECK_ARGUMENT(max_attempts >= 1, "max_attempts must be at least 1");

    SagaContext ctx;
    ctx.source = &source;
    ctx.chunk_size = chunk_size;
    ctx.max_attempts = max_attempts;
    ctx.retry_delay = options_.retry_delay;
    ctx.metadata = metadata;
    ctx.progress = progress;
    if (cancel) ctx.cancel = *cancel;

    SagaExecutionResult exec = executor_.execute(definition_, ctx);
    // The saga outcome carries everything callers need; drop the upload bookkeeping
    if (!ctx.operation_id.empty()) {
        uploader_.forget_operation(ctx.operation_id);
    }

    SubmitResult result;
    result.success = exec.succeeded();
    result.saga_id = exec.saga_id;
    result.status = to_string(exec.status);
    if (result.success) {
        result.document_id = ctx.document_id;
    } else {
        result.rollback_performed = true;
        result.rollback_status = exec.status == SagaStatus::Compensated ? "success" : "partial_failure";
    }
    result.errors = exec.errors;
    result.compensation_errors = exec.compensation_errors;
    result.operation_id = ctx.operation_id;
    result.attempt_failures = ctx.attempt_failures;

    if (exec.status == SagaStatus::CompensationFailed) {
        try {
            failure_log_.append(exec.saga_id, FailureKind::CriticalFailure,
                                {{"status", "REQUIRES_MANUAL_CLEANUP"},
                                 {"source", source.describe()},
                                 {"operation_id", ctx.operation_id},
                                 {"errors", join(exec.errors)},
                                 {"compensation_errors", join(exec.compensation_errors)}});
        } catch (const std::exception& e) {
            LOG_ERROR("[", exec.saga_id, "] could not write manual-cleanup record: ", e.what());
        }
    }

    return result;
}

SubmitResult StreamingIngestService::submit_streaming_upload(const SourceArtifact& source,
                                                             const Metadata& metadata) {
    return submit_streaming_upload(source, options_.chunk_size, options_.max_attempts, metadata);
}

// =============================================================================
// Helpers
// =============================================================================

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    char buf[32];
    for (const char* unit : units) {
        if (value < 1024.0) {
            std::snprintf(buf, sizeof(buf), "%.2f %s", value, unit);
            return buf;
        }
        value /= 1024.0;
    }
    std::snprintf(buf, sizeof(buf), "%.2f PB", value);
    return buf;
}

std::string format_duration(double seconds) {
    char buf[32];
    if (seconds < 60) {
        std::snprintf(buf, sizeof(buf), "%.1fs", seconds);
    } else if (seconds < 3600) {
        std::snprintf(buf, sizeof(buf), "%.1fm", seconds / 60);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1fh", seconds / 3600);
    }
    return buf;
}

uint64_t optimal_chunk_size(uint64_t /*file_size*/, uint64_t available_memory, double network_mbps) {
    uint64_t chunk = DEFAULT_CHUNK_SIZE;

    // At most 10% of available memory per chunk
    chunk = std::min(chunk, available_memory / 10);

    if (network_mbps > 500) {
        chunk = std::max(chunk, LARGE_CHUNK_SIZE);
    } else if (network_mbps < 10) {
        chunk = std::min(chunk, SMALL_CHUNK_SIZE);
    }

    return std::max(SMALL_CHUNK_SIZE, std::min(chunk, MAX_CHUNK_SIZE));
}

} // namespace polystore
