#pragma once

#include "polystore/types.hpp"
#include <span>
#include <string_view>
#include <memory>

namespace polystore {

/**
 * BLAKE3 hashing for chunk and artifact digests
 *
 * Used for:
 * 1. Per-chunk digest recorded in ChunkRecord at upload time
 * 2. Whole-artifact digest compared by the integrity gate
 *    (source bytes vs. concatenated stored chunks)
 */
class Blake3Hasher {
public:
    /**
     * Hash arbitrary data
     * @param data Input bytes
     * @return 32-byte BLAKE3 hash
     */
    static Blake3Hash hash(std::span<const uint8_t> data) noexcept;

    /**
     * Hash a string
     */
    static Blake3Hash hash(std::string_view str) noexcept;

    /**
     * Incremental hasher for streaming data
     */
    class Incremental {
    public:
        Incremental() noexcept;
        ~Incremental();

        Incremental(const Incremental&) = delete;
        Incremental& operator=(const Incremental&) = delete;
        Incremental(Incremental&&) noexcept;
        Incremental& operator=(Incremental&&) noexcept;

        void update(std::span<const uint8_t> data) noexcept;
        void update(std::string_view str) noexcept;
        Blake3Hash finalize() const noexcept;
        uint64_t bytes_hashed() const noexcept;
        void reset() noexcept;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };
};

} // namespace polystore
