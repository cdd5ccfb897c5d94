#pragma once

/// @file hash.hpp
/// @author Aleksandr Loshkarev
/// @brief Fast hashing of object keys scoped by nesting depth.
///
/// wyhash-inspired mixing: one multiply per 8-byte word, sub-word loads for
/// short keys (typical JSON keys are 4-20 bytes). The nesting depth of the
/// owning object is folded into the seed so that equal keys in different
/// open objects land in different buckets.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

namespace serdex::detail {

/// @brief Multiply-mix a pair of words into the running state.
inline uint64_t hash_mix(uint64_t h, uint64_t a, uint64_t b) noexcept {
    // Constants from wyhash v4 (public domain, Wang Yi).
    constexpr uint64_t kSeed  = 0xa0761d6478bd642fULL;
    constexpr uint64_t kSeed2 = 0xe7037ed1a0b428dbULL;
    h ^= a;
    h *= kSeed2;
    h ^= b;
    h *= kSeed;
    return h;
}

/// @brief Hash a byte string with a caller-supplied seed.
inline uint64_t hash_bytes(const char* data, size_t len, uint64_t seed) noexcept {
    constexpr uint64_t kSeed  = 0xa0761d6478bd642fULL;
    constexpr uint64_t kSeed2 = 0xe7037ed1a0b428dbULL;

    uint64_t h = (seed ^ kSeed) ^ (len * kSeed2);

    if (len <= 8) {
        uint64_t a = 0, b = 0;
        if (len >= 4) {
            std::memcpy(&a, data, 4);
            std::memcpy(&b, data + len - 4, 4);
        } else if (len > 0) {
            a = static_cast<uint64_t>(static_cast<unsigned char>(data[0])) << 16
              | static_cast<uint64_t>(static_cast<unsigned char>(data[len >> 1])) << 8
              | static_cast<uint64_t>(static_cast<unsigned char>(data[len - 1]));
        }
        h = hash_mix(h, a, b);
    } else {
        const char* p = data;
        size_t rem = len;
        while (rem > 16) {
            uint64_t a, b;
            std::memcpy(&a, p, 8);
            std::memcpy(&b, p + 8, 8);
            h = hash_mix(h, a, b);
            p += 16;
            rem -= 16;
        }
        // Final 9-16 bytes (overlapping with the previous block)
        uint64_t a, b;
        std::memcpy(&a, data + len - 16 + (len < 16 ? 16 - len : 0), 8);
        std::memcpy(&b, data + len - 8, 8);
        h = hash_mix(h, a, b);
    }

    // Final avalanche
    h ^= h >> 32;
    h *= kSeed;
    h ^= h >> 29;
    return h;
}

/// @brief Hash of an object key within the object open at @p depth.
inline uint64_t key_hash(uint32_t depth, std::string_view key) noexcept {
    return hash_bytes(key.data(), key.size(), static_cast<uint64_t>(depth) * 0x9E3779B97F4A7C15ULL);
}

} // namespace serdex::detail
