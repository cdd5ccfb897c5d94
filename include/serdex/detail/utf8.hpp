#pragma once

/// @file utf8.hpp
/// @author Aleksandr Loshkarev
/// @brief UTF-8 encoding/decoding utilities.
///
/// Used by the text readers and writers at the byte boundary, by the name
/// lookup cursor and by the JSON scanner for \uXXXX escapes:
///   - Encoding a code point to UTF-8 (1-4 bytes)
///   - Decoding UTF-8 to a code point, with strict validation
///   - Surrogate pair handling for \uXXXX escapes

#include <cstdint>
#include <string>

namespace serdex::detail::utf8 {

/// @brief Returned by decode() for a malformed sequence.
inline constexpr uint32_t kInvalid = 0xFFFFFFFFu;

// ─── Code point encoding → UTF-8 ─────────────────────────────────────

/// @brief Encode a code point into a fixed buffer.
/// @return Number of bytes written (1-4), or 0 for an invalid code point.
inline unsigned encode(uint32_t cp, char* buf) noexcept {
    if (cp < 0x80) {
        buf[0] = static_cast<char>(cp);
        return 1;
    } else if (cp < 0x800) {
        buf[0] = static_cast<char>(0xC0 | (cp >> 6));
        buf[1] = static_cast<char>(0x80 | (cp & 0x3F));
        return 2;
    } else if (cp < 0x10000) {
        buf[0] = static_cast<char>(0xE0 | (cp >> 12));
        buf[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buf[2] = static_cast<char>(0x80 | (cp & 0x3F));
        return 3;
    } else if (cp <= 0x10FFFF) {
        buf[0] = static_cast<char>(0xF0 | (cp >> 18));
        buf[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        buf[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buf[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }
    return 0;
}

/// @brief Encodes a code point as UTF-8 and appends it to the string.
inline void encode(uint32_t cp, std::string& out) {
    char buf[4];
    out.append(buf, encode(cp, buf));
}

// ─── UTF-8 decoding → code point ───────────────────────────────────

/// @brief Determines the UTF-8 sequence length from the leading byte.
/// @return 1-4 for a valid byte, 0 for an invalid one.
inline unsigned sequence_length(unsigned char lead) noexcept {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0; // Invalid leading byte
}

/// @brief Combines a lead byte with its continuation bytes.
/// @param lead  Leading byte of the sequence.
/// @param cont  Continuation bytes (len - 1 of them).
/// @param len   Sequence length from sequence_length().
/// @return Code point, or kInvalid for a malformed, overlong, surrogate or
///         out-of-range sequence.
inline uint32_t assemble(unsigned char lead, const unsigned char* cont, unsigned len) noexcept {
    uint32_t cp;
    switch (len) {
        case 1: return lead;
        case 2: cp = lead & 0x1F; break;
        case 3: cp = lead & 0x0F; break;
        case 4: cp = lead & 0x07; break;
        default: return kInvalid;
    }
    for (unsigned i = 0; i + 1 < len; ++i) {
        if ((cont[i] & 0xC0) != 0x80) return kInvalid;
        cp = (cp << 6) | (cont[i] & 0x3F);
    }
    if ((len == 2 && cp < 0x80) ||
        (len == 3 && cp < 0x800) ||
        (len == 4 && cp < 0x10000)) {
        return kInvalid; // Overlong encoding
    }
    if (cp >= 0xD800 && cp <= 0xDFFF) return kInvalid;
    if (cp > 0x10FFFF) return kInvalid;
    return cp;
}

/// @brief Decodes a single UTF-8 sequence.
/// @param ptr  Pointer to the start of the sequence (advanced on success).
/// @param end  Pointer past the end of the buffer.
/// @return Unicode code point, or kInvalid (ptr left unchanged).
inline uint32_t decode(const char*& ptr, const char* end) noexcept {
    auto lead = static_cast<unsigned char>(*ptr);
    unsigned len = sequence_length(lead);
    if (len == 0 || static_cast<size_t>(end - ptr) < len) return kInvalid;
    uint32_t cp = assemble(lead, reinterpret_cast<const unsigned char*>(ptr + 1), len);
    if (cp != kInvalid) ptr += len;
    return cp;
}

// ─── JSON \uXXXX escapes ─────────────────────────────────────────────

inline bool is_high_surrogate(uint32_t u) noexcept { return u >= 0xD800 && u <= 0xDBFF; }
inline bool is_low_surrogate(uint32_t u) noexcept { return u >= 0xDC00 && u <= 0xDFFF; }

/// @brief Combines a surrogate pair into a supplementary-plane code point.
inline uint32_t combine_surrogates(uint32_t high, uint32_t low) noexcept {
    return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
}

/// @brief Value of one hexadecimal digit, or -1.
inline int hex_value(uint32_t c) noexcept {
    if (c >= '0' && c <= '9') return static_cast<int>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<int>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<int>(c - 'A' + 10);
    return -1;
}

} // namespace serdex::detail::utf8
