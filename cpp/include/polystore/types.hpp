#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace polystore {

using Bytes = std::vector<uint8_t>;
using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock>;

// Caller-supplied document metadata (title, category, ...)
using Metadata = std::map<std::string, std::string>;

// BLAKE3 hash (32 bytes). Content digest for chunks and whole artifacts.
struct Blake3Hash {
    std::array<uint8_t, 32> bytes;

    constexpr Blake3Hash() noexcept : bytes{} {}

    explicit Blake3Hash(const uint8_t* data) noexcept {
        std::memcpy(bytes.data(), data, 32);
    }

    bool operator==(const Blake3Hash& other) const noexcept {
        return bytes == other.bytes;
    }

    bool operator!=(const Blake3Hash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Blake3Hash& other) const noexcept {
        return bytes < other.bytes;
    }

    // Hex string representation
    std::string to_hex() const {
        static constexpr char hex_chars[] = "0123456789abcdef";
        std::string result;
        result.reserve(64);
        for (uint8_t b : bytes) {
            result.push_back(hex_chars[b >> 4]);
            result.push_back(hex_chars[b & 0x0F]);
        }
        return result;
    }

    static Blake3Hash from_hex(std::string_view hex) {
        Blake3Hash result;
        if (hex.size() != 64) return result;

        for (size_t i = 0; i < 32; ++i) {
            auto hex_to_nibble = [](char c) -> uint8_t {
                if (c >= '0' && c <= '9') return c - '0';
                if (c >= 'a' && c <= 'f') return 10 + c - 'a';
                if (c >= 'A' && c <= 'F') return 10 + c - 'A';
                return 0;
            };
            result.bytes[i] = (hex_to_nibble(hex[i*2]) << 4) | hex_to_nibble(hex[i*2+1]);
        }
        return result;
    }

    constexpr const uint8_t* data() const noexcept { return bytes.data(); }
    constexpr uint8_t* data() noexcept { return bytes.data(); }
    static constexpr size_t size() noexcept { return 32; }

    // Check if zero (uninitialized)
    constexpr bool is_zero() const noexcept {
        for (uint8_t b : bytes) if (b != 0) return false;
        return true;
    }
};

// Milliseconds since epoch, used by the journal and failure log
inline int64_t to_epoch_ms(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

// ISO-8601 UTC with millisecond precision, e.g. 2025-10-02T12:00:00.123Z
std::string format_iso8601(TimePoint t);

} // namespace polystore
