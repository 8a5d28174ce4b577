#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include "polystore/types.hpp"

namespace polystore {

/**
 * Read-only view of the artifact being ingested.
 *
 * read() throws SourceUnavailableError when the artifact has gone away and
 * IOError on a transient read failure.
 */
class SourceArtifact {
public:
    virtual ~SourceArtifact() = default;

    virtual uint64_t size() const = 0;
    virtual Bytes read(uint64_t offset, uint64_t length) const = 0;
    virtual bool available() const = 0;

    // Human-readable identity for logs and failure records
    virtual std::string describe() const = 0;
};

// Artifact on the local filesystem
class FileSource : public SourceArtifact {
public:
    explicit FileSource(std::filesystem::path path);

    uint64_t size() const override;
    Bytes read(uint64_t offset, uint64_t length) const override;
    bool available() const override;
    std::string describe() const override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Artifact held in memory; tests can flip availability or corrupt bytes
class MemorySource : public SourceArtifact {
public:
    explicit MemorySource(Bytes data, std::string name = "memory");
    MemorySource(std::string_view text, std::string name = "memory");

    uint64_t size() const override;
    Bytes read(uint64_t offset, uint64_t length) const override;
    bool available() const override;
    std::string describe() const override;

    void set_available(bool available);
    void set_byte(uint64_t offset, uint8_t value);

private:
    mutable std::mutex mutex_;
    Bytes data_;
    std::string name_;
    bool available_ = true;
};

} // namespace polystore
