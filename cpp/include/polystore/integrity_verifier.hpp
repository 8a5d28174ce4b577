#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "polystore/chunk_store.hpp"
#include "polystore/chunk_uploader.hpp"
#include "polystore/source.hpp"
#include "polystore/types.hpp"

namespace polystore {

struct IntegrityReport {
    Blake3Hash expected_digest;
    Blake3Hash actual_digest;
    uint64_t expected_size = 0;
    uint64_t actual_size = 0;
    uint64_t expected_chunks = 0;
    uint64_t actual_chunks = 0;

    bool digest_mismatch = false;
    bool size_mismatch = false;
    bool count_mismatch = false;

    // Chunk indices whose stored bytes disagree with the recorded digest
    std::vector<uint64_t> corrupt_chunks;
    // Chunk indices the store no longer has
    std::vector<uint64_t> missing_chunks;

    bool ok() const {
        return !digest_mismatch && !size_mismatch && !count_mismatch &&
               corrupt_chunks.empty() && missing_chunks.empty();
    }

    std::string summary() const;
};

/**
 * Fail-closed gate between chunk upload and the downstream stores.
 * Read-only: never writes to any store.
 */
class IntegrityVerifier {
public:
    explicit IntegrityVerifier(const ChunkStore& store);

    IntegrityReport verify(const SourceArtifact& source, const UploadResult& upload) const;

private:
    const ChunkStore& store_;
};

} // namespace polystore
