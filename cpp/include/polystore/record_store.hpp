#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "polystore/types.hpp"

namespace polystore {

// What every downstream store receives for one ingested document
struct StoreRecord {
    std::string document_id;
    std::string saga_id;
    std::string source;              // SourceArtifact::describe()
    Blake3Hash content_digest;
    uint64_t size_bytes = 0;
    uint64_t chunk_count = 0;
    std::vector<std::string> chunk_refs;
    Metadata metadata;
};

/**
 * Uniform contract for the vector, graph and relational stores.
 *
 * insert() throws StoreError on failure. remove() returns false if the
 * record could not be deleted; removing an unknown id is not an error.
 */
class DownstreamStore {
public:
    virtual ~DownstreamStore() = default;

    virtual std::string name() const = 0;
    virtual std::string insert(const StoreRecord& record) = 0;
    virtual bool remove(const std::string& record_id) = 0;
    virtual bool exists(const std::string& record_id) const = 0;
};

class InMemoryRecordStore : public DownstreamStore {
public:
    explicit InMemoryRecordStore(std::string name);

    std::string name() const override { return name_; }
    std::string insert(const StoreRecord& record) override;
    bool remove(const std::string& record_id) override;
    bool exists(const std::string& record_id) const override;

    size_t size() const;
    std::optional<StoreRecord> get(const std::string& record_id) const;

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::map<std::string, StoreRecord> records_;
    uint64_t next_id_ = 1;
};

} // namespace polystore
