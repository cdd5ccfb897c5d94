#pragma once

/// @file text_reader.hpp
/// @author Aleksandr Loshkarev
/// @brief Pull-based character sources for text formats.
///
/// A reader decodes UTF-8 into code points and tracks the source position.
/// Readers are duck-typed (like the output adapters in text_writer.hpp);
/// every reader provides:
///
///   char32_t       next();                      // consume, kEndOfInput at end
///   char32_t       peek() const;                // look ahead one character
///   SourceLocation position() const;            // position of peek()
///   bool           read_exact(std::string_view); // consume an ASCII literal
///
/// Implementations:
///   - StringReader: over a std::string_view (zero-copy)
///   - StreamReader: over a std::istream (buffered)
///
/// Malformed UTF-8 is reported by next() as errc::invalid_utf8.

#include "config.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <string_view>

namespace serdex {

/// @brief Returned by next()/peek() at the end of the input.
inline constexpr char32_t kEndOfInput = static_cast<char32_t>(0xFFFFFFFFu);

namespace detail {

/// @brief Advances a line/column position past one decoded character.
inline void advance_location(SourceLocation& loc, char32_t ch, size_t bytes) noexcept {
    loc.offset += bytes;
    if (ch == U'\n') {
        ++loc.line;
        loc.column = 1;
    } else if (ch == U'\t') {
        loc.column += 4;
    } else {
        ++loc.column;
    }
}

} // namespace detail

// =====================================================================
// StringReader
// =====================================================================

/// @brief Reads UTF-8 text from a string that outlives the reader.
class StringReader {
public:
    explicit StringReader(std::string_view text) noexcept
        : ptr_(text.data()), end_(text.data() + text.size()) {}

    char32_t next() {
        if (SERDEX_UNLIKELY(ptr_ == end_)) return kEndOfInput;
        auto lead = static_cast<unsigned char>(*ptr_);
        if (SERDEX_LIKELY(lead < 0x80)) {
            ++ptr_;
            detail::advance_location(loc_, lead, 1);
            return lead;
        }
        const char* start = ptr_;
        uint32_t cp = detail::utf8::decode(ptr_, end_);
        if (cp == detail::utf8::kInvalid) {
            throw DeserializeError(errc::invalid_utf8, loc_);
        }
        detail::advance_location(loc_, cp, static_cast<size_t>(ptr_ - start));
        return cp;
    }

    /// @brief Next character without consuming it. A malformed sequence
    /// peeks as U+FFFD and is reported by the following next().
    char32_t peek() const noexcept {
        if (ptr_ == end_) return kEndOfInput;
        auto lead = static_cast<unsigned char>(*ptr_);
        if (SERDEX_LIKELY(lead < 0x80)) return lead;
        const char* p = ptr_;
        uint32_t cp = detail::utf8::decode(p, end_);
        return cp == detail::utf8::kInvalid ? 0xFFFD : cp;
    }

    [[nodiscard]] SourceLocation position() const noexcept { return loc_; }

    bool read_exact(std::string_view expected) {
        for (char c : expected) {
            if (next() != static_cast<unsigned char>(c)) return false;
        }
        return true;
    }

private:
    const char* ptr_;
    const char* end_;
    SourceLocation loc_;
};

// =====================================================================
// StreamReader
// =====================================================================

/// @brief Reads UTF-8 text from a std::istream through an internal buffer.
class StreamReader {
public:
    explicit StreamReader(std::istream& is) noexcept : is_(&is) {}

    StreamReader(StreamReader&& other) noexcept
        : is_(other.is_), pos_(other.pos_), len_(other.len_), loc_(other.loc_) {
        std::copy(other.buf_, other.buf_ + other.len_, buf_);
        other.pos_ = other.len_ = 0;
    }

    StreamReader(const StreamReader&) = delete;
    StreamReader& operator=(const StreamReader&) = delete;

    char32_t next() {
        if (!fill(1)) return kEndOfInput;
        auto lead = static_cast<unsigned char>(buf_[pos_]);
        if (SERDEX_LIKELY(lead < 0x80)) {
            ++pos_;
            detail::advance_location(loc_, lead, 1);
            return lead;
        }
        unsigned len = detail::utf8::sequence_length(lead);
        if (len == 0 || !fill(len)) {
            throw DeserializeError(errc::invalid_utf8, loc_);
        }
        uint32_t cp = detail::utf8::assemble(
            lead, reinterpret_cast<const unsigned char*>(buf_ + pos_ + 1), len);
        if (cp == detail::utf8::kInvalid) {
            throw DeserializeError(errc::invalid_utf8, loc_);
        }
        pos_ += len;
        detail::advance_location(loc_, cp, len);
        return cp;
    }

    char32_t peek() const {
        if (!fill(1)) return kEndOfInput;
        auto lead = static_cast<unsigned char>(buf_[pos_]);
        if (SERDEX_LIKELY(lead < 0x80)) return lead;
        unsigned len = detail::utf8::sequence_length(lead);
        if (len == 0 || !fill(len)) return 0xFFFD;
        uint32_t cp = detail::utf8::assemble(
            lead, reinterpret_cast<const unsigned char*>(buf_ + pos_ + 1), len);
        return cp == detail::utf8::kInvalid ? 0xFFFD : cp;
    }

    [[nodiscard]] SourceLocation position() const noexcept { return loc_; }

    bool read_exact(std::string_view expected) {
        for (char c : expected) {
            if (next() != static_cast<unsigned char>(c)) return false;
        }
        return true;
    }

private:
    static constexpr size_t kBufSize = 4096;

    /// @brief Ensures at least @p n unread bytes are buffered.
    /// @return false if the stream ends first.
    bool fill(size_t n) const {
        if (SERDEX_LIKELY(len_ - pos_ >= n)) return true;
        // Move the unread tail to the front, then top up.
        size_t tail = len_ - pos_;
        for (size_t i = 0; i < tail; ++i) buf_[i] = buf_[pos_ + i];
        pos_ = 0;
        len_ = tail;
        while (len_ < n && *is_) {
            is_->read(buf_ + len_, static_cast<std::streamsize>(kBufSize - len_));
            len_ += static_cast<size_t>(is_->gcount());
        }
        return len_ >= n;
    }

    std::istream* is_;
    mutable char buf_[kBufSize];
    mutable size_t pos_ = 0;
    mutable size_t len_ = 0;
    SourceLocation loc_;
};

} // namespace serdex
