#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "polystore/types.hpp"

namespace polystore {

/**
 * Chunk (object) storage the uploader writes into.
 *
 * put() and get() throw StorageError on transient backend failures.
 * remove() returns false when the chunk could not be deleted.
 */
class ChunkStore {
public:
    virtual ~ChunkStore() = default;

    // Returns a storage reference (key, path, URL) for the stored chunk
    virtual std::string put(const std::string& chunk_id, std::span<const uint8_t> bytes) = 0;
    virtual bool remove(const std::string& chunk_id) = 0;
    virtual std::optional<Bytes> get(const std::string& chunk_id) const = 0;
    virtual bool exists(const std::string& chunk_id) const = 0;
};

class InMemoryChunkStore : public ChunkStore {
public:
    std::string put(const std::string& chunk_id, std::span<const uint8_t> bytes) override;
    bool remove(const std::string& chunk_id) override;
    std::optional<Bytes> get(const std::string& chunk_id) const override;
    bool exists(const std::string& chunk_id) const override;

    size_t size() const;
    std::vector<std::string> ids() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Bytes> chunks_;
};

// One file per chunk under a root directory
class FileChunkStore : public ChunkStore {
public:
    explicit FileChunkStore(std::filesystem::path root);

    std::string put(const std::string& chunk_id, std::span<const uint8_t> bytes) override;
    bool remove(const std::string& chunk_id) override;
    std::optional<Bytes> get(const std::string& chunk_id) const override;
    bool exists(const std::string& chunk_id) const override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path path_for(const std::string& chunk_id) const;

    std::filesystem::path root_;
};

} // namespace polystore
