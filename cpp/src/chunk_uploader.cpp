#include "polystore/chunk_uploader.hpp"

#include <algorithm>
#include <cstdio>
#include <random>
#include <stdexcept>
#include <thread>

#include "polystore/blake3.hpp"
#include "polystore/error.hpp"
#include "polystore/logging.hpp"

namespace polystore {

namespace {

// Registry entry vanished while an upload was running
class OperationMissing : public std::runtime_error {
public:
    explicit OperationMissing(const std::string& id)
        : std::runtime_error("operation not found: " + id) {}
};

std::string new_operation_id() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng()));
    return std::string("op-") + buf;
}

std::string error_text(const std::exception& e) {
    if (auto* pe = dynamic_cast<const PolystoreException*>(&e)) {
        return pe->message();
    }
    return e.what();
}

bool is_finished(UploadStatus status) {
    return status == UploadStatus::Completed || status == UploadStatus::Failed ||
           status == UploadStatus::Cancelled;
}

} // anonymous namespace

ChunkUploader::ChunkUploader(ChunkStore& store) : store_(store) {}

std::string ChunkUploader::chunk_id(const std::string& operation_id, uint64_t index) {
    return operation_id + "-chunk-" + std::to_string(index);
}

uint64_t ChunkUploader::expected_chunk_count(uint64_t size, uint64_t chunk_size) {
    if (chunk_size == 0) return 0;
    return size / chunk_size + (size % chunk_size ? 1 : 0);
}

// =============================================================================
// Upload with retry and resume
// =============================================================================

StepResult<UploadResult> ChunkUploader::upload(const SourceArtifact& source,
                                               uint64_t chunk_size,
                                               int max_attempts,
                                               std::chrono::milliseconds retry_delay,
                                               const ProgressSink& progress,
                                               const CancellationToken* cancel) {
    POLYSTORE_CHECK_ARGUMENT(chunk_size > 0, "chunk_size must be positive");
    POLYSTORE_CHECK_ARGUMENT(max_attempts >= 1, "max_attempts must be at least 1");

    const std::string op_id = new_operation_id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Operation op;
        op.progress.operation_id = op_id;
        op.chunk_size = chunk_size;
        op.started = Clock::now();
        operations_.emplace(op_id, std::move(op));
    }
    return run(op_id, source, max_attempts, retry_delay, progress, cancel);
}

StepResult<UploadResult> ChunkUploader::resume(const std::string& operation_id,
                                               const SourceArtifact& source,
                                               int max_attempts,
                                               std::chrono::milliseconds retry_delay,
                                               const ProgressSink& progress,
                                               const CancellationToken* cancel) {
    POLYSTORE_CHECK_ARGUMENT(max_attempts >= 1, "max_attempts must be at least 1");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = operations_.find(operation_id);
        if (it == operations_.end()) {
            RollbackSignal signal;
            signal.reason = RollbackReason::OperationNotFound;
            signal.message = "operation not found: " + operation_id;
            signal.operation_id = operation_id;
            return StepResult<UploadResult>::rollback(std::move(signal));
        }
        if (it->second.progress.status != UploadStatus::Paused) {
            throw InvalidArgumentError("operation is not paused", operation_id);
        }
        it->second.pause_requested = false;
    }
    return run(operation_id, source, max_attempts, retry_delay, progress, cancel);
}

StepResult<UploadResult> ChunkUploader::run(const std::string& op_id,
                                            const SourceArtifact& source,
                                            int max_attempts,
                                            std::chrono::milliseconds retry_delay,
                                            const ProgressSink& progress,
                                            const CancellationToken* cancel) {
    uint64_t chunk_size = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = operations_.find(op_id);
        if (it == operations_.end()) {
            return StepResult<UploadResult>::rollback(RollbackReason::OperationNotFound,
                                                      "operation not found: " + op_id);
        }
        chunk_size = it->second.chunk_size;
    }

    std::vector<std::string> attempt_errors;
    std::string last_error;

    auto escalate = [&](RollbackReason reason, const std::string& message, int attempts) {
        UploadStatus status = UploadStatus::Failed;
        if (reason == RollbackReason::Cancelled) status = UploadStatus::Cancelled;
        if (reason == RollbackReason::Paused) status = UploadStatus::Paused;
        finish(op_id, status);
        LOG_WARN("Upload ", op_id, " of ", source.describe(), " escalated: ",
                 to_string(reason), " after ", attempts, " attempt(s): ", message);

        RollbackSignal signal;
        signal.reason = reason;
        signal.message = message;
        signal.operation_id = op_id;
        signal.attempts = attempts;
        signal.last_error = last_error;
        signal.attempt_errors = attempt_errors;
        return StepResult<UploadResult>::rollback(std::move(signal));
    };

    auto record_failure = [&](int attempt, const std::string& message) {
        last_error = message;
        attempt_errors.push_back("attempt " + std::to_string(attempt) + "/" +
                                 std::to_string(max_attempts) + ": " + message);
    };

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (cancelled(op_id, cancel)) {
            return escalate(RollbackReason::Cancelled, "upload cancelled", attempt - 1);
        }

        try {
            if (!source.available()) {
                throw SourceUnavailableError("Source no longer available", source.describe());
            }
            uint64_t size = source.size();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                Operation& op = find_operation(op_id);
                if (!op.sized) {
                    op.source_size = size;
                    op.progress.total_bytes = size;
                    op.progress.chunk_count = expected_chunk_count(size, chunk_size);
                    op.sized = true;
                }
            }
            check_bookkeeping(op_id, size);

            Transfer state = transfer(op_id, source, progress, cancel);
            if (state == Transfer::Cancelled) {
                return escalate(RollbackReason::Cancelled, "upload cancelled", attempt);
            }
            if (state == Transfer::Paused) {
                return escalate(RollbackReason::Paused, "upload paused", attempt);
            }

            UploadResult result;
            result.operation_id = op_id;
            result.chunk_size = chunk_size;
            result.attempts = attempt;
            result.attempt_errors = attempt_errors;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                Operation& op = find_operation(op_id);
                op.content_digest = op.content.finalize();
                result.chunks = op.chunks;
            }
            for (const auto& c : result.chunks) result.bytes_written += c.size;

            finish(op_id, UploadStatus::Completed);
            if (auto final_progress = get_progress(op_id)) {
                emit(progress, *final_progress);
            }

            LOG_INFO("Upload ", op_id, " complete: ", result.chunks.size(), " chunks, ",
                     result.bytes_written, " bytes, ", attempt, " attempt(s)");
            return StepResult<UploadResult>::success(std::move(result));

        } catch (const SourceUnavailableError& e) {
            record_failure(attempt, e.message());
            return escalate(RollbackReason::SourceNotFound, e.message(), attempt);
        } catch (const ChunkMetadataCorruptError& e) {
            record_failure(attempt, e.message());
            return escalate(RollbackReason::MetadataCorrupt, e.message(), attempt);
        } catch (const OperationMissing& e) {
            record_failure(attempt, e.what());
            return escalate(RollbackReason::OperationNotFound, e.what(), attempt);
        } catch (const std::exception& e) {
            record_failure(attempt, error_text(e));
            LOG_WARN("Upload ", op_id, " attempt ", attempt, "/", max_attempts,
                     " failed: ", last_error);
        }

        if (attempt < max_attempts && retry_delay.count() > 0) {
            std::this_thread::sleep_for(retry_delay);
        }
    }

    return escalate(RollbackReason::MaxRetriesExceeded,
                    "gave up after " + std::to_string(max_attempts) + " attempt(s)",
                    max_attempts);
}

ChunkUploader::Transfer ChunkUploader::transfer(const std::string& operation_id,
                                                const SourceArtifact& source,
                                                const ProgressSink& progress,
                                                const CancellationToken* cancel) {
    uint64_t chunk_size = 0;
    uint64_t total = 0;
    uint64_t next_index = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Operation& op = find_operation(operation_id);
        chunk_size = op.chunk_size;
        total = op.source_size;
        next_index = op.chunks.size();
        op.progress.status = UploadStatus::Uploading;
    }

    if (next_index > 0) {
        LOG_INFO("Resuming upload ", operation_id, " at chunk ", next_index);
    }

    const uint64_t count = expected_chunk_count(total, chunk_size);
    const auto session_start = std::chrono::steady_clock::now();
    uint64_t session_bytes = 0;

    for (uint64_t index = next_index; index < count; ++index) {
        if (cancelled(operation_id, cancel)) return Transfer::Cancelled;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (find_operation(operation_id).pause_requested) return Transfer::Paused;
        }

        const uint64_t offset = index * chunk_size;
        const uint64_t length = std::min(chunk_size, total - offset);
        Bytes data = source.read(offset, length);

        ChunkRecord rec;
        rec.chunk_id = chunk_id(operation_id, index);
        rec.index = index;
        rec.offset = offset;
        rec.size = length;
        rec.digest = Blake3Hasher::hash(data);
        rec.storage_ref = store_.put(rec.chunk_id, data);
        session_bytes += length;

        UploadProgress snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Operation& op = find_operation(operation_id);
            op.chunks.push_back(std::move(rec));
            op.content.update(data);

            UploadProgress& p = op.progress;
            p.transferred_bytes = offset + length;
            p.current_chunk = index + 1;
            p.percent_complete = total ? 100.0 * static_cast<double>(p.transferred_bytes) / total : 100.0;

            double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - session_start).count();
            p.bytes_per_second = elapsed > 0 ? session_bytes / elapsed : 0.0;
            p.estimated_seconds_remaining = p.bytes_per_second > 0
                ? (total - p.transferred_bytes) / p.bytes_per_second : 0.0;
            snapshot = p;
        }
        emit(progress, snapshot);
    }
    return Transfer::Done;
}

void ChunkUploader::check_bookkeeping(const std::string& operation_id, uint64_t source_size) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Operation& op = find_operation(operation_id);

    if (op.source_size != source_size) {
        throw ChunkMetadataCorruptError(
            "source size changed from " + std::to_string(op.source_size) +
            " to " + std::to_string(source_size) + " during upload", operation_id);
    }

    const uint64_t expected = expected_chunk_count(source_size, op.chunk_size);
    if (op.chunks.size() > expected) {
        throw ChunkMetadataCorruptError(
            "operation records " + std::to_string(op.chunks.size()) +
            " chunks, source only has " + std::to_string(expected), operation_id);
    }

    for (uint64_t i = 0; i < op.chunks.size(); ++i) {
        const ChunkRecord& c = op.chunks[i];
        const uint64_t offset = i * op.chunk_size;
        const uint64_t size = std::min(op.chunk_size, source_size - offset);
        if (c.index != i || c.offset != offset || c.size != size ||
            c.chunk_id != chunk_id(operation_id, i)) {
            throw ChunkMetadataCorruptError(
                "chunk record " + std::to_string(i) + " is inconsistent", operation_id);
        }
    }
}

// =============================================================================
// Registry
// =============================================================================

ChunkUploader::Operation& ChunkUploader::find_operation(const std::string& operation_id) {
    auto it = operations_.find(operation_id);
    if (it == operations_.end()) throw OperationMissing(operation_id);
    return it->second;
}

const ChunkUploader::Operation& ChunkUploader::find_operation(const std::string& operation_id) const {
    auto it = operations_.find(operation_id);
    if (it == operations_.end()) throw OperationMissing(operation_id);
    return it->second;
}

bool ChunkUploader::cancelled(const std::string& operation_id, const CancellationToken* cancel) const {
    if (cancel && cancel->cancelled()) return true;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = operations_.find(operation_id);
    return it != operations_.end() && it->second.cancel_requested;
}

void ChunkUploader::finish(const std::string& operation_id, UploadStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = operations_.find(operation_id);
    if (it == operations_.end()) return;

    Operation& op = it->second;
    op.progress.status = status;
    if (status == UploadStatus::Paused) return;
    op.finished = Clock::now();
    if (status == UploadStatus::Completed) {
        op.progress.transferred_bytes = op.source_size;
        op.progress.current_chunk = op.chunks.size();
        op.progress.percent_complete = 100.0;
        op.progress.estimated_seconds_remaining = 0.0;
    }
}

void ChunkUploader::emit(const ProgressSink& progress, const UploadProgress& snapshot) const {
    if (!progress) return;
    try {
        progress(snapshot);
    } catch (const std::exception& e) {
        LOG_WARN("Progress sink for ", snapshot.operation_id, " threw: ", e.what());
    }
}

std::optional<UploadProgress> ChunkUploader::get_progress(const std::string& operation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = operations_.find(operation_id);
    if (it == operations_.end()) return std::nullopt;
    return it->second.progress;
}

std::vector<ChunkRecord> ChunkUploader::operation_chunks(const std::string& operation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = operations_.find(operation_id);
    if (it == operations_.end()) return {};
    return it->second.chunks;
}

std::vector<UploadProgress> ChunkUploader::list_operations(std::optional<UploadStatus> status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UploadProgress> out;
    for (const auto& [id, op] : operations_) {
        if (!status || op.progress.status == *status) out.push_back(op.progress);
    }
    return out;
}

bool ChunkUploader::pause_operation(const std::string& operation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = operations_.find(operation_id);
    if (it == operations_.end()) return false;
    const UploadStatus status = it->second.progress.status;
    if (is_finished(status) || status == UploadStatus::Paused) return false;
    it->second.pause_requested = true;
    LOG_INFO("Pause requested for upload ", operation_id);
    return true;
}

bool ChunkUploader::cancel_operation(const std::string& operation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = operations_.find(operation_id);
    if (it == operations_.end() || is_finished(it->second.progress.status)) return false;
    it->second.cancel_requested = true;
    return true;
}

bool ChunkUploader::forget_operation(const std::string& operation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_.erase(operation_id) > 0;
}

size_t ChunkUploader::cleanup_completed_operations(std::chrono::seconds max_age) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    size_t removed = 0;
    for (auto it = operations_.begin(); it != operations_.end();) {
        const Operation& op = it->second;
        if (op.finished && is_finished(op.progress.status) && now - *op.finished >= max_age) {
            it = operations_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        LOG_DEBUG("Dropped ", removed, " finished upload operation(s)");
    }
    return removed;
}

size_t ChunkUploader::operation_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_.size();
}

// =============================================================================
// Read-back
// =============================================================================

DownloadResult ChunkUploader::download(const std::string& operation_id, const ChunkSink& sink) const {
    std::vector<ChunkRecord> chunks;
    Blake3Hash expected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = operations_.find(operation_id);
        if (it == operations_.end()) {
            throw InvalidArgumentError("unknown operation", operation_id);
        }
        const Operation& op = it->second;
        if (op.progress.status != UploadStatus::Completed || !op.content_digest) {
            throw InvalidArgumentError(std::string("operation is ") + to_string(op.progress.status) +
                                       ", not completed", operation_id);
        }
        chunks = op.chunks;
        expected = *op.content_digest;
    }

    DownloadResult result;
    result.operation_id = operation_id;
    Blake3Hasher::Incremental whole;

    for (const ChunkRecord& rec : chunks) {
        std::optional<Bytes> data = store_.get(rec.chunk_id);
        if (!data) {
            throw IntegrityError("chunk " + rec.chunk_id + " is missing from the store", operation_id);
        }
        if (data->size() != rec.size || Blake3Hasher::hash(*data) != rec.digest) {
            throw IntegrityError("chunk " + rec.chunk_id + " differs from what was uploaded", operation_id);
        }
        whole.update(*data);
        if (sink) sink(*data);
        result.bytes += data->size();
        ++result.chunks;
    }

    result.content_digest = whole.finalize();
    if (result.content_digest != expected) {
        throw IntegrityError("artifact digest " + result.content_digest.to_hex() +
                             " does not match upload digest " + expected.to_hex(), operation_id);
    }

    LOG_DEBUG("Read back ", operation_id, ": ", result.chunks, " chunks, ", result.bytes, " bytes");
    return result;
}

// =============================================================================
// Chunk cleanup (compensation for chunked_upload)
// =============================================================================

std::vector<CompensationItem> ChunkUploader::cleanup_chunks(const std::string& operation_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (operations_.find(operation_id) == operations_.end()) {
            LOG_WARN("cleanup_chunks: unknown operation ", operation_id);
            return {};
        }
    }
    auto chunks = operation_chunks(operation_id);
    return cleanup_chunks(std::span<const ChunkRecord>(chunks));
}

std::vector<CompensationItem> ChunkUploader::cleanup_chunks(std::span<const ChunkRecord> chunks) {
    std::vector<CompensationItem> items;
    items.reserve(chunks.size());

    for (const ChunkRecord& rec : chunks) {
        CompensationItem item;
        item.kind = CompensationItem::Kind::Chunk;
        item.resource_id = rec.chunk_id;
        try {
            if (!store_.exists(rec.chunk_id)) {
                item.outcome = CompensationItem::Outcome::AlreadyAbsent;
            } else if (!store_.remove(rec.chunk_id)) {
                item.outcome = CompensationItem::Outcome::Failed;
                item.error = "chunk store refused delete";
            } else if (store_.exists(rec.chunk_id)) {
                item.outcome = CompensationItem::Outcome::Failed;
                item.error = "chunk still present after delete";
            } else {
                item.outcome = CompensationItem::Outcome::Removed;
            }
        } catch (const std::exception& e) {
            item.outcome = CompensationItem::Outcome::Failed;
            item.error = error_text(e);
        }

        if (item.outcome == CompensationItem::Outcome::Failed) {
            LOG_WARN("Failed to delete chunk ", rec.chunk_id, ": ", item.error);
        }
        items.push_back(std::move(item));
    }
    return items;
}

} // namespace polystore
