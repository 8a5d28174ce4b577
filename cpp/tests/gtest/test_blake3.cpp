// =============================================================================
// Blake3 Hash Tests
// =============================================================================

#include <gtest/gtest.h>
#include "polystore/blake3.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <utility>
#include <vector>

using namespace polystore;

class Blake3Test : public ::testing::Test {};

// Test empty input against the published BLAKE3 vector
TEST_F(Blake3Test, EmptyInputKnownVector) {
    auto hash = Blake3Hasher::hash(std::string_view(""));
    EXPECT_EQ(hash.to_hex(), "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
    EXPECT_FALSE(hash.is_zero());
}

// Official test vectors: input byte i is (i % 251)
TEST_F(Blake3Test, OfficialVectors) {
    const std::pair<size_t, const char*> vectors[] = {
        {1,    "2d3adedff11b61f14c886e35afa036736dcd87a74d27b5c1510225d0f592e213"},
        {1023, "10108970eeda3eb932baac1428c7a2163b0e924c9a9e25b35bba72b28f70bd11"},
        {1024, "42214739f095a406f3fc83deb889744ac00df831c10daa55189b5d121c855af7"},
        {1025, "d00278ae47eb27b34faecf67b4fe263f82d5412916c1ffd97c8cb7fb814b8444"},
        {2049, "5f4d72f40d7a5f82b15ca2b2e44b1de3c2ef86c426c95c1af0b6879522563030"},
        {8193, "bab6c09cb8ce8cf459261398d2e7aef35700bf488116ceb94a36d0f5f1b7bc3b"},
    };
    for (const auto& [len, hex] : vectors) {
        Bytes input(len);
        for (size_t i = 0; i < len; ++i) input[i] = static_cast<uint8_t>(i % 251);

        EXPECT_EQ(Blake3Hasher::hash(input).to_hex(), hex) << "length " << len;

        // Same digest when fed in uneven pieces
        Blake3Hasher::Incremental inc;
        for (size_t off = 0; off < len; off += 333) {
            inc.update(std::span<const uint8_t>(input.data() + off, std::min<size_t>(333, len - off)));
        }
        EXPECT_EQ(inc.finalize().to_hex(), hex) << "length " << len;
    }
}

// Test determinism - same input gives same output
TEST_F(Blake3Test, Deterministic) {
    Bytes data = {0x48, 0x65, 0x6c, 0x6c, 0x6f};
    EXPECT_EQ(Blake3Hasher::hash(data), Blake3Hasher::hash(data));
    EXPECT_EQ(Blake3Hasher::hash(std::string_view("Hello")), Blake3Hasher::hash(data));
}

// Test avalanche effect - one bit flips most of the digest
TEST_F(Blake3Test, AvalancheEffect) {
    Bytes a = {0x00, 0x00, 0x00, 0x00};
    Bytes b = {0x00, 0x00, 0x00, 0x01};

    auto ha = Blake3Hasher::hash(a);
    auto hb = Blake3Hasher::hash(b);

    int diff = 0;
    for (size_t i = 0; i < 32; ++i) {
        if (ha.bytes[i] != hb.bytes[i]) diff++;
    }
    EXPECT_GT(diff, 16);
}

// Test hex round trip
TEST_F(Blake3Test, HexConversion) {
    auto hash = Blake3Hasher::hash(std::string_view("A"));
    std::string hex = hash.to_hex();
    EXPECT_EQ(hex.length(), 64u);
    EXPECT_EQ(Blake3Hash::from_hex(hex), hash);

    // Malformed input yields the zero hash
    EXPECT_TRUE(Blake3Hash::from_hex("abc").is_zero());
}

// Test incremental hashing matches one-shot across chunk boundaries
TEST_F(Blake3Test, IncrementalMatchesOneShot) {
    for (size_t size : {0u, 1u, 1023u, 1024u, 1025u, 4096u, 100000u}) {
        Bytes data = test_support::make_bytes(size, static_cast<uint32_t>(size));
        auto expected = Blake3Hasher::hash(data);

        for (size_t piece : {1u, 7u, 1024u, 5000u}) {
            Blake3Hasher::Incremental inc;
            for (size_t off = 0; off < size; off += piece) {
                size_t n = std::min(piece, size - off);
                inc.update(std::span<const uint8_t>(data.data() + off, n));
            }
            EXPECT_EQ(inc.bytes_hashed(), size);
            EXPECT_EQ(inc.finalize(), expected) << "size " << size << " piece " << piece;
        }
    }
}

// Test reset returns the hasher to the empty state
TEST_F(Blake3Test, IncrementalReset) {
    Blake3Hasher::Incremental inc;
    inc.update(std::string_view("some data"));
    inc.reset();
    EXPECT_EQ(inc.bytes_hashed(), 0u);
    EXPECT_EQ(inc.finalize(), Blake3Hasher::hash(std::string_view("")));
}
