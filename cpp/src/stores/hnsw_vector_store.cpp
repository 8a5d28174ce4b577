#include "polystore/stores/hnsw_vector_store.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "polystore/blake3.hpp"
#include "polystore/error.hpp"
#include "polystore/logging.hpp"

namespace polystore {

namespace {

bool parse_label(const std::string& id, hnswlib::labeltype& out) {
    if (id.empty() || id.size() > 19) return false;
    hnswlib::labeltype v = 0;
    for (char c : id) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<hnswlib::labeltype>(c - '0');
    }
    out = v;
    return true;
}

} // anonymous namespace

HnswVectorStore::HnswVectorStore(std::string name, const HnswConfig& config, EmbeddingFunction embed)
    : name_(std::move(name)), config_(config), embed_(std::move(embed)) {
    POLYSTORE_CHECK_ARGUMENT(config_.dimensions > 0, "HNSW dimensions must be positive");
    POLYSTORE_CHECK_ARGUMENT(config_.max_elements > 0, "HNSW max_elements must be positive");

    if (!embed_) {
        const size_t dims = config_.dimensions;
        embed_ = [dims](const StoreRecord& r) { return digest_embedding(r, dims); };
    }

    space_ = std::make_unique<hnswlib::L2Space>(config_.dimensions);
    index_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(
        space_.get(), config_.max_elements, config_.M, config_.ef_construction);
    index_->setEf(config_.ef_search);
}

std::vector<float> HnswVectorStore::digest_embedding(const StoreRecord& record, size_t dimensions) {
    std::vector<float> v(dimensions);

    // Stretch the digest over the vector by rehashing with a counter
    const std::string seed = record.content_digest.to_hex();
    size_t filled = 0;
    for (uint32_t round = 0; filled < dimensions; ++round) {
        Blake3Hash h = Blake3Hasher::hash(seed + ":" + std::to_string(round));
        for (size_t i = 0; i < Blake3Hash::size() && filled < dimensions; ++i) {
            v[filled++] = static_cast<float>(h.bytes[i]) / 127.5f - 1.0f;
        }
    }

    float norm = 0;
    for (float x : v) norm += x * x;
    norm = std::sqrt(norm);
    if (norm > 0) {
        for (float& x : v) x /= norm;
    }
    return v;
}

std::string HnswVectorStore::insert(const StoreRecord& record) {
    std::vector<float> vec = embed_(record);
    if (vec.size() != config_.dimensions) {
        throw StoreError("Embedding has " + std::to_string(vec.size()) + " dimensions, index expects " +
                         std::to_string(config_.dimensions), name_);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const hnswlib::labeltype label = next_label_;
    try {
        index_->addPoint(vec.data(), label);
    } catch (const std::runtime_error& e) {
        throw StoreError(std::string("HNSW insert failed: ") + e.what(), name_);
    }
    ++next_label_;
    live_.insert(label);
    return std::to_string(label);
}

bool HnswVectorStore::remove(const std::string& record_id) {
    hnswlib::labeltype label = 0;
    if (!parse_label(record_id, label)) {
        LOG_WARN("Store ", name_, ": ignoring malformed record id '", record_id, "'");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (live_.count(label) == 0) return true;
    try {
        index_->markDelete(label);
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Store ", name_, ": delete of ", record_id, " failed: ", e.what());
        return false;
    }
    live_.erase(label);
    return true;
}

bool HnswVectorStore::exists(const std::string& record_id) const {
    hnswlib::labeltype label = 0;
    if (!parse_label(record_id, label)) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.count(label) > 0;
}

std::vector<std::pair<std::string, float>> HnswVectorStore::search(const std::vector<float>& query,
                                                                   size_t k) const {
    POLYSTORE_CHECK_ARGUMENT(query.size() == config_.dimensions, "query has wrong dimensionality");

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<std::string, float>> out;
    if (live_.empty() || k == 0) return out;

    auto result = index_->searchKnn(query.data(), std::min(k, live_.size()));
    out.reserve(result.size());
    while (!result.empty()) {
        auto [dist, label] = result.top();
        result.pop();
        out.emplace_back(std::to_string(label), dist);
    }
    // Priority queue pops farthest first
    std::reverse(out.begin(), out.end());
    return out;
}

size_t HnswVectorStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

void HnswVectorStore::save(const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw StoreError("Cannot create index directory: " + ec.message(), name_);
        }
    }

    const std::filesystem::path tmp = path.string() + ".tmp";
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            index_->saveIndex(tmp.string());
        } catch (const std::exception& e) {
            throw StoreError("HNSW save failed: " + std::string(e.what()), name_);
        }
    }

    std::error_code ec;
    if (!std::filesystem::exists(tmp, ec) || std::filesystem::file_size(tmp, ec) == 0) {
        throw StoreError("HNSW save failed: nothing written to " + tmp.string(), name_);
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        throw StoreError("HNSW save failed: " + ec.message(), name_);
    }
    LOG_DEBUG("Store ", name_, ": saved index to ", path.string());
}

void HnswVectorStore::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw StoreError("HNSW index not found: " + path.string(), name_);
    }

    std::unique_ptr<hnswlib::HierarchicalNSW<float>> loaded;
    try {
        loaded = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            space_.get(), path.string(), false, config_.max_elements);
    } catch (const std::exception& e) {
        throw StoreError("HNSW load of " + path.string() + " failed: " + e.what(), name_);
    }

    // Vector bytes per element are fixed when the index is built
    if (loaded->label_offset_ - loaded->offsetData_ != space_->get_data_size()) {
        throw StoreError("HNSW index " + path.string() + " was built for other dimensions than " +
                         std::to_string(config_.dimensions), name_);
    }
    loaded->setEf(config_.ef_search);

    std::set<hnswlib::labeltype> live;
    hnswlib::labeltype highest = 0;
    for (const auto& [label, internal_id] : loaded->label_lookup_) {
        if (!loaded->isMarkedDeleted(internal_id)) live.insert(label);
        highest = std::max(highest, label);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    index_ = std::move(loaded);
    live_ = std::move(live);
    next_label_ = highest + 1;
    LOG_INFO("Store ", name_, ": loaded ", live_.size(), " vector(s) from ", path.string());
}

} // namespace polystore
