#include "polystore/blake3.hpp"

#include <blake3.h>

// Chunk and artifact digests via the official BLAKE3 library, unkeyed mode.

static_assert(BLAKE3_OUT_LEN == 32, "Blake3Hash holds a 32-byte digest");

namespace polystore {

Blake3Hash Blake3Hasher::hash(std::span<const uint8_t> data) noexcept {
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data.data(), data.size());

    Blake3Hash result;
    blake3_hasher_finalize(&hasher, result.bytes.data(), BLAKE3_OUT_LEN);
    return result;
}

Blake3Hash Blake3Hasher::hash(std::string_view str) noexcept {
    return hash(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

struct Blake3Hasher::Incremental::Impl {
    blake3_hasher hasher;
    uint64_t bytes = 0;
};

Blake3Hasher::Incremental::Incremental() noexcept
    : impl_(std::make_unique<Impl>()) {
    blake3_hasher_init(&impl_->hasher);
}

Blake3Hasher::Incremental::~Incremental() = default;

Blake3Hasher::Incremental::Incremental(Incremental&&) noexcept = default;
Blake3Hasher::Incremental& Blake3Hasher::Incremental::operator=(Incremental&&) noexcept = default;

void Blake3Hasher::Incremental::update(std::span<const uint8_t> data) noexcept {
    blake3_hasher_update(&impl_->hasher, data.data(), data.size());
    impl_->bytes += data.size();
}

void Blake3Hasher::Incremental::update(std::string_view str) noexcept {
    update(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

// Finalizing does not consume the state, more input may follow
Blake3Hash Blake3Hasher::Incremental::finalize() const noexcept {
    Blake3Hash result;
    blake3_hasher_finalize(&impl_->hasher, result.bytes.data(), BLAKE3_OUT_LEN);
    return result;
}

uint64_t Blake3Hasher::Incremental::bytes_hashed() const noexcept {
    return impl_->bytes;
}

void Blake3Hasher::Incremental::reset() noexcept {
    blake3_hasher_init(&impl_->hasher);
    impl_->bytes = 0;
}

} // namespace polystore
