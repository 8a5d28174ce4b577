#pragma once

/**
 * Vector store on an in-process HNSW index (hnswlib).
 *
 * Each inserted document becomes one point; its record id is the HNSW label.
 * Removal uses hnswlib's mark-delete so the label disappears from searches.
 */

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <hnswlib/hnswlib.h>

#include "polystore/record_store.hpp"

namespace polystore {

struct HnswConfig {
    size_t dimensions = 64;            // Vector dimensionality
    size_t max_elements = 100000;      // Capacity of the index
    size_t M = 16;                     // Bi-directional links per element
    size_t ef_construction = 200;      // Candidate list size during construction
    size_t ef_search = 50;             // Candidate list size during search
};

// Maps a record to its embedding; must return config.dimensions floats
using EmbeddingFunction = std::function<std::vector<float>(const StoreRecord&)>;

class HnswVectorStore : public DownstreamStore {
public:
    // Without an embedding function, digest_embedding() is used
    HnswVectorStore(std::string name, const HnswConfig& config, EmbeddingFunction embed = {});

    std::string name() const override { return name_; }
    std::string insert(const StoreRecord& record) override;
    bool remove(const std::string& record_id) override;
    bool exists(const std::string& record_id) const override;

    // k nearest live records: (record id, L2 distance), closest first
    std::vector<std::pair<std::string, float>> search(const std::vector<float>& query, size_t k) const;

    size_t size() const;
    const HnswConfig& config() const { return config_; }

    // Written next to path then renamed into place
    void save(const std::filesystem::path& path) const;

    /**
     * Replace the index with one written by save(). Removed records stay
     * removed and new ids continue after the highest label in the file.
     * @throws StoreError if the file is unreadable or built for other dimensions
     */
    void load(const std::filesystem::path& path);

    // Unit vector derived from the content digest; identical content maps to the same point
    static std::vector<float> digest_embedding(const StoreRecord& record, size_t dimensions);

private:
    std::string name_;
    HnswConfig config_;
    EmbeddingFunction embed_;

    std::unique_ptr<hnswlib::L2Space> space_;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> index_;

    mutable std::mutex mutex_;
    std::set<hnswlib::labeltype> live_;
    hnswlib::labeltype next_label_ = 1;
};

} // namespace polystore
