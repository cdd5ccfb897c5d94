#pragma once

/// @file text_writer.hpp
/// @author Aleksandr Loshkarev
/// @brief Character sinks for text formats.
///
/// Writers are duck-typed; every writer provides:
///
///   void write_char(char32_t ch);        // UTF-8 encodes ch
///   void write_str(std::string_view s);  // s is already UTF-8
///
/// Implementations:
///   - StringWriter: appends to a caller-owned std::string
///   - StreamWriter: buffered output to a std::ostream

#include "config.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"

#include <cstddef>
#include <cstring>
#include <ostream>
#include <string>
#include <string_view>

namespace serdex {

// =====================================================================
// StringWriter
// =====================================================================

/// @brief Appends text to a std::string that outlives the writer.
class StringWriter {
public:
    explicit StringWriter(std::string& out) noexcept : out_(&out) {}

    void write_char(char32_t ch) {
        if (SERDEX_LIKELY(ch < 0x80)) {
            out_->push_back(static_cast<char>(ch));
        } else {
            detail::utf8::encode(static_cast<uint32_t>(ch), *out_);
        }
    }

    void write_str(std::string_view s) {
        out_->append(s.data(), s.size());
    }

private:
    std::string* out_;
};

// =====================================================================
// StreamWriter
// =====================================================================

/// @brief Buffered output to a std::ostream. Flushed on flush() and on
/// destruction; a failed stream is reported by flush() as
/// SerializeError(errc::write_failed).
class StreamWriter {
public:
    explicit StreamWriter(std::ostream& os) noexcept : os_(&os) {}

    StreamWriter(StreamWriter&& other) noexcept
        : os_(other.os_), pos_(other.pos_) {
        std::memcpy(buf_, other.buf_, other.pos_);
        other.pos_ = 0;
        other.os_ = nullptr;
    }

    StreamWriter(const StreamWriter&) = delete;
    StreamWriter& operator=(const StreamWriter&) = delete;
    StreamWriter& operator=(StreamWriter&&) = delete;

    ~StreamWriter() {
        if (os_ && pos_ > 0) {
            os_->write(buf_, static_cast<std::streamsize>(pos_));
        }
    }

    void write_char(char32_t ch) {
        char tmp[4];
        if (SERDEX_LIKELY(ch < 0x80)) {
            if (SERDEX_UNLIKELY(pos_ >= kBufSize)) flush_buffer();
            buf_[pos_++] = static_cast<char>(ch);
            return;
        }
        unsigned n = detail::utf8::encode(static_cast<uint32_t>(ch), tmp);
        write_str(std::string_view(tmp, n));
    }

    void write_str(std::string_view s) {
        if (SERDEX_LIKELY(pos_ + s.size() <= kBufSize)) {
            std::memcpy(buf_ + pos_, s.data(), s.size());
            pos_ += s.size();
        } else {
            write_slow(s);
        }
    }

    /// @brief Pushes buffered text to the stream and checks its state.
    void flush() {
        flush_buffer();
        os_->flush();
        if (!*os_) throw SerializeError("output stream failed");
    }

private:
    static constexpr size_t kBufSize = 8192;

    void flush_buffer() {
        if (pos_ > 0) {
            os_->write(buf_, static_cast<std::streamsize>(pos_));
            pos_ = 0;
            if (!*os_) throw SerializeError("output stream failed");
        }
    }

    SERDEX_NOINLINE void write_slow(std::string_view s) {
        flush_buffer();
        if (s.size() >= kBufSize) {
            os_->write(s.data(), static_cast<std::streamsize>(s.size()));
            if (!*os_) throw SerializeError("output stream failed");
        } else {
            std::memcpy(buf_, s.data(), s.size());
            pos_ = s.size();
        }
    }

    std::ostream* os_;
    size_t pos_ = 0;
    char buf_[kBufSize];
};

} // namespace serdex
