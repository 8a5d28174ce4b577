#include "polystore/source.hpp"

#include <fstream>
#include <system_error>

#include "polystore/error.hpp"

namespace polystore {

// =============================================================================
// FileSource
// =============================================================================

FileSource::FileSource(std::filesystem::path path) : path_(std::move(path)) {}

uint64_t FileSource::size() const {
    std::error_code ec;
    auto n = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw SourceUnavailableError("Cannot stat source: " + ec.message(), path_.string());
    }
    return n;
}

Bytes FileSource::read(uint64_t offset, uint64_t length) const {
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        throw SourceUnavailableError("Cannot open source", path_.string());
    }

    in.seekg(static_cast<std::streamoff>(offset));
    if (!in) {
        throw IOError("Seek failed at offset " + std::to_string(offset), path_.string());
    }

    Bytes buf(length);
    in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(length));
    auto got = static_cast<uint64_t>(in.gcount());
    if (got != length) {
        throw IOError("Short read: wanted " + std::to_string(length) +
                      " bytes at offset " + std::to_string(offset) +
                      ", got " + std::to_string(got), path_.string());
    }
    return buf;
}

bool FileSource::available() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_, ec);
}

std::string FileSource::describe() const {
    return path_.string();
}

// =============================================================================
// MemorySource
// =============================================================================

MemorySource::MemorySource(Bytes data, std::string name)
    : data_(std::move(data)), name_(std::move(name)) {}

MemorySource::MemorySource(std::string_view text, std::string name)
    : data_(text.begin(), text.end()), name_(std::move(name)) {}

uint64_t MemorySource::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!available_) {
        throw SourceUnavailableError("Source is gone", name_);
    }
    return data_.size();
}

Bytes MemorySource::read(uint64_t offset, uint64_t length) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!available_) {
        throw SourceUnavailableError("Source is gone", name_);
    }
    if (offset > data_.size() || length > data_.size() - offset) {
        throw IOError("Read past end: offset " + std::to_string(offset) +
                      " length " + std::to_string(length), name_);
    }
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return Bytes(first, first + static_cast<std::ptrdiff_t>(length));
}

bool MemorySource::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

std::string MemorySource::describe() const {
    return name_;
}

void MemorySource::set_available(bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = available;
}

void MemorySource::set_byte(uint64_t offset, uint8_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (offset >= data_.size()) {
        throw InvalidArgumentError("Offset out of range: " + std::to_string(offset), name_);
    }
    data_[offset] = value;
}

} // namespace polystore
