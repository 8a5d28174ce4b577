#include "polystore/chunk_store.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

#include "polystore/error.hpp"
#include "polystore/logging.hpp"

namespace polystore {

// =============================================================================
// InMemoryChunkStore
// =============================================================================

std::string InMemoryChunkStore::put(const std::string& chunk_id, std::span<const uint8_t> bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_[chunk_id] = Bytes(bytes.begin(), bytes.end());
    return "mem://" + chunk_id;
}

bool InMemoryChunkStore::remove(const std::string& chunk_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.erase(chunk_id);
    return true;
}

std::optional<Bytes> InMemoryChunkStore::get(const std::string& chunk_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chunks_.find(chunk_id);
    if (it == chunks_.end()) return std::nullopt;
    return it->second;
}

bool InMemoryChunkStore::exists(const std::string& chunk_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.count(chunk_id) > 0;
}

size_t InMemoryChunkStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

std::vector<std::string> InMemoryChunkStore::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(chunks_.size());
    for (const auto& [id, bytes] : chunks_) out.push_back(id);
    return out;
}

// =============================================================================
// FileChunkStore
// =============================================================================

FileChunkStore::FileChunkStore(std::filesystem::path root) : root_(std::move(root)) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw IOError("Cannot create chunk directory: " + ec.message(), root_.string());
    }
}

std::filesystem::path FileChunkStore::path_for(const std::string& chunk_id) const {
    if (chunk_id.empty() || chunk_id.find('/') != std::string::npos ||
        chunk_id.find('\\') != std::string::npos || chunk_id == "." || chunk_id == "..") {
        throw InvalidArgumentError("Invalid chunk id: '" + chunk_id + "'");
    }
    return root_ / (chunk_id + ".chunk");
}

std::string FileChunkStore::put(const std::string& chunk_id, std::span<const uint8_t> bytes) {
    auto target = path_for(chunk_id);
    auto tmp = target;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw StorageError("Cannot open chunk file for writing", tmp.string());
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            throw StorageError("Write failed", tmp.string());
        }
    }

    // Rename so readers never see a half-written chunk
    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw StorageError("Cannot publish chunk: " + ec.message(), target.string());
    }
    return target.string();
}

bool FileChunkStore::remove(const std::string& chunk_id) {
    std::error_code ec;
    std::filesystem::remove(path_for(chunk_id), ec);
    if (ec) {
        LOG_WARN("Failed to delete chunk ", chunk_id, ": ", ec.message());
        return false;
    }
    return true;
}

std::optional<Bytes> FileChunkStore::get(const std::string& chunk_id) const {
    auto path = path_for(chunk_id);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return std::nullopt;

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw StorageError("Cannot open chunk file", path.string());
    }
    Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw StorageError("Read failed", path.string());
    }
    return data;
}

bool FileChunkStore::exists(const std::string& chunk_id) const {
    std::error_code ec;
    return std::filesystem::exists(path_for(chunk_id), ec);
}

} // namespace polystore
