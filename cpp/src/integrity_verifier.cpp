#include "polystore/integrity_verifier.hpp"

#include <algorithm>
#include <sstream>

#include "polystore/blake3.hpp"
#include "polystore/logging.hpp"

namespace polystore {

namespace {

// Source is hashed in pieces of this size when no chunk size was recorded
constexpr uint64_t READ_BLOCK = 1024 * 1024;

} // anonymous namespace

std::string IntegrityReport::summary() const {
    if (ok()) return "integrity ok";

    std::ostringstream out;
    out << "integrity mismatch:";
    if (digest_mismatch) {
        out << " digest " << actual_digest.to_hex().substr(0, 16)
            << " != " << expected_digest.to_hex().substr(0, 16) << ";";
    }
    if (size_mismatch) {
        out << " size " << actual_size << " != " << expected_size << ";";
    }
    if (count_mismatch) {
        out << " chunks " << actual_chunks << " != " << expected_chunks << ";";
    }
    if (!corrupt_chunks.empty()) {
        out << " corrupt chunks [";
        for (size_t i = 0; i < corrupt_chunks.size(); ++i) {
            out << (i ? "," : "") << corrupt_chunks[i];
        }
        out << "];";
    }
    if (!missing_chunks.empty()) {
        out << " missing chunks [";
        for (size_t i = 0; i < missing_chunks.size(); ++i) {
            out << (i ? "," : "") << missing_chunks[i];
        }
        out << "];";
    }
    return out.str();
}

IntegrityVerifier::IntegrityVerifier(const ChunkStore& store) : store_(store) {}

IntegrityReport IntegrityVerifier::verify(const SourceArtifact& source, const UploadResult& upload) const {
    IntegrityReport report;

    // Expected side: the source itself
    report.expected_size = source.size();
    report.expected_chunks = ChunkUploader::expected_chunk_count(report.expected_size, upload.chunk_size);

    const uint64_t block = upload.chunk_size > 0 ? upload.chunk_size : READ_BLOCK;
    Blake3Hasher::Incremental expected;
    for (uint64_t offset = 0; offset < report.expected_size; offset += block) {
        uint64_t length = std::min(block, report.expected_size - offset);
        expected.update(source.read(offset, length));
    }
    report.expected_digest = expected.finalize();

    // Actual side: what the chunk store holds, in index order
    std::vector<const ChunkRecord*> ordered;
    ordered.reserve(upload.chunks.size());
    for (const auto& c : upload.chunks) ordered.push_back(&c);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ChunkRecord* a, const ChunkRecord* b) { return a->index < b->index; });

    Blake3Hasher::Incremental actual;
    for (const ChunkRecord* rec : ordered) {
        auto bytes = store_.get(rec->chunk_id);
        if (!bytes) {
            report.missing_chunks.push_back(rec->index);
            continue;
        }
        if (Blake3Hasher::hash(*bytes) != rec->digest) {
            report.corrupt_chunks.push_back(rec->index);
        }
        actual.update(*bytes);
        report.actual_size += bytes->size();
        ++report.actual_chunks;
    }
    report.actual_digest = actual.finalize();

    report.digest_mismatch = report.actual_digest != report.expected_digest;
    report.size_mismatch = report.actual_size != report.expected_size;
    report.count_mismatch = report.actual_chunks != report.expected_chunks;

    if (report.ok()) {
        LOG_DEBUG("Verified ", upload.operation_id, ": ", report.actual_chunks, " chunks, ",
                  report.actual_size, " bytes");
    } else {
        LOG_WARN("Verification failed for ", upload.operation_id, ": ", report.summary());
    }
    return report;
}

} // namespace polystore
