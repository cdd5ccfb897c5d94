#pragma once

/// @file scanner.hpp
/// @author Aleksandr Loshkarev
/// @brief JSON lexical layer over a character reader.
///
/// Scanner<Reader> owns the reader and knows the JSON punctuation:
/// whitespace and comments, entry/item separators, literals, numbers,
/// string bodies and escapes. It has no notion of the outliner stack;
/// the deserializer drives it.

#include "../config.hpp"
#include "../detail/utf8.hpp"
#include "../error.hpp"
#include "../text_reader.hpp"
#include "number.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace serdex::json::detail {

/// @brief Stores number digits as packed nibbles, low nibble first.
/// finish() appends a 0xF terminator nibble.
template <typename String>
struct NibbleBuilder {
    String* target;
    int pending = -1;

    bool push_digit(uint8_t digit) {
        if (pending >= 0) {
            target->push_back(static_cast<char>(pending | (digit << 4)));
            pending = -1;
        } else {
            pending = digit;
        }
        return true;
    }

    void finish() {
        if (pending >= 0) {
            target->push_back(static_cast<char>(pending | 0xF0));
            pending = -1;
        } else {
            target->push_back(static_cast<char>(0xFF));
        }
    }
};

template <typename Reader>
class Scanner {
public:
    Scanner(Reader reader, bool allow_comments)
        : reader_(std::move(reader)), allow_comments_(allow_comments) {}

    [[nodiscard]] char32_t peek() const { return reader_.peek(); }
    char32_t next() { return reader_.next(); }
    [[nodiscard]] SourceLocation position() const { return reader_.position(); }
    bool read_exact(std::string_view s) { return reader_.read_exact(s); }

    [[noreturn]] void fail(errc code, SourceLocation pos) const {
        throw DeserializeError(code, pos);
    }

    // ─── Whitespace and punctuation ───────────────────────────────────

    void skip_whitespace() {
        for (;;) {
            char32_t ch = reader_.peek();
            if (is_space(ch)) {
                reader_.next();
            } else if (ch == U'/' && allow_comments_) {
                reader_.next();
                skip_comment();
            } else {
                return;
            }
        }
    }

    /// @brief Skips past `{` ... `"` and returns the position of the quote,
    /// or past `}` and returns nullopt.
    std::optional<SourceLocation> skip_to_first_entry() {
        for (;;) {
            SourceLocation pos = reader_.position();
            char32_t ch = reader_.next();
            if (is_space(ch)) continue;
            if (ch == U'/' && allow_comments_) {
                skip_comment();
            } else if (ch == U'"') {
                return pos;
            } else if (ch == U'}') {
                return std::nullopt;
            } else {
                fail(unexpected(ch), pos);
            }
        }
    }

    /// @brief Skips past `,` and the opening quote of the next key
    /// (returning its position), or past `}` (returning nullopt).
    std::optional<SourceLocation> skip_to_next_entry() {
        for (;;) {
            SourceLocation pos = reader_.position();
            char32_t ch = reader_.next();
            if (is_space(ch)) continue;
            if (ch == U'/' && allow_comments_) {
                skip_comment();
            } else if (ch == U',') {
                break;
            } else if (ch == U'}') {
                return std::nullopt;
            } else {
                fail(unexpected(ch), pos);
            }
        }
        for (;;) {
            SourceLocation pos = reader_.position();
            char32_t ch = reader_.next();
            if (is_space(ch)) continue;
            if (ch == U'/' && allow_comments_) {
                skip_comment();
            } else if (ch == U'"') {
                return pos;
            } else {
                fail(unexpected(ch), pos);
            }
        }
    }

    /// @brief Advances to the start of the first item (true), or past `]`
    /// (false).
    bool skip_to_first_item() {
        for (;;) {
            SourceLocation pos = reader_.position();
            char32_t ch = reader_.peek();
            if (is_space(ch)) {
                reader_.next();
            } else if (ch == U'/' && allow_comments_) {
                reader_.next();
                skip_comment();
            } else if (ch == U']') {
                reader_.next();
                return false;
            } else if (ch == kEndOfInput) {
                fail(errc::unexpected_end_of_input, pos);
            } else {
                return true;
            }
        }
    }

    /// @brief Skips past `,` (true) or `]` (false).
    bool skip_to_next_item() {
        for (;;) {
            SourceLocation pos = reader_.position();
            char32_t ch = reader_.next();
            if (is_space(ch)) continue;
            if (ch == U'/' && allow_comments_) {
                skip_comment();
            } else if (ch == U',') {
                return true;
            } else if (ch == U']') {
                return false;
            } else {
                fail(unexpected(ch), pos);
            }
        }
    }

    void skip_past_colon() {
        for (;;) {
            SourceLocation pos = reader_.position();
            char32_t ch = reader_.next();
            if (is_space(ch)) continue;
            if (ch == U'/' && allow_comments_) {
                skip_comment();
            } else if (ch == U':') {
                return;
            } else {
                fail(unexpected(ch), pos);
            }
        }
    }

    void read_eof() {
        if (reader_.peek() != kEndOfInput) {
            fail(errc::unexpected_character, reader_.position());
        }
    }

    // ─── Literals ─────────────────────────────────────────────────────

    bool read_bool() {
        SourceLocation pos = reader_.position();
        char32_t ch = reader_.next();
        if (ch == U't') {
            if (!reader_.read_exact("rue")) fail(errc::invalid_literal, pos);
            return true;
        }
        if (ch == U'f') {
            if (!reader_.read_exact("alse")) fail(errc::invalid_literal, pos);
            return false;
        }
        fail(ch == kEndOfInput ? errc::unexpected_end_of_input : errc::expected_bool, pos);
    }

    void read_null() {
        SourceLocation pos = reader_.position();
        char32_t ch = reader_.next();
        if (ch == U'n') {
            if (!reader_.read_exact("ull")) fail(errc::invalid_literal, pos);
            return;
        }
        fail(ch == kEndOfInput ? errc::unexpected_end_of_input : errc::expected_null, pos);
    }

    // ─── Numbers ──────────────────────────────────────────────────────

    template <typename T>
    T read_number() {
        SourceLocation pos = reader_.position();
        typename Num<T>::Builder builder;
        auto [negate, exp] = read_number_into(builder);
        auto value = Num<T>::from_builder(builder, negate, exp);
        if (!value) fail(errc::number_overflow, pos);
        return *value;
    }

    /// @brief Reads a number, feeding its significant digits to @p builder.
    /// @return (negate, base-10 exponent)
    ///
    /// A leading `0` is a complete integer part: in "0123" the number is
    /// "0" and "123" is left in the stream.
    template <typename Builder>
    std::pair<bool, int32_t> read_number_into(Builder& builder) {
        const SourceLocation pos = reader_.position();
        bool negate = false;

        // Integral part
        char32_t ch = reader_.next();
        if (ch == U'-') {
            negate = true;
            ch = reader_.next();
        }
        if (ch != U'0') {
            if (!is_digit(ch)) {
                fail(ch == kEndOfInput ? errc::unexpected_end_of_input : errc::expected_number, pos);
            }
            push_digit(builder, ch, pos);
            while (is_digit(reader_.peek())) {
                push_digit(builder, reader_.next(), pos);
            }
        }

        int32_t decimal_exp = 0;
        if (reader_.peek() == U'.') {
            reader_.next();
            decimal_exp = read_fraction(builder, pos);
        }

        char32_t la = reader_.peek();
        if (la == U'e' || la == U'E') {
            reader_.next();
            return {negate, read_exponent(decimal_exp, pos)};
        }
        return {negate, decimal_exp};
    }

    // ─── Strings ──────────────────────────────────────────────────────

    /// @brief Decodes the escape sequence following a backslash.
    char32_t read_escape_sequence() {
        SourceLocation pos = reader_.position();
        char32_t ch = reader_.next();
        switch (ch) {
            case U'"':  return U'"';
            case U'\\': return U'\\';
            case U'/':  return U'/';
            case U'b':  return U'\b';
            case U'f':  return U'\f';
            case U'n':  return U'\n';
            case U'r':  return U'\r';
            case U't':  return U'\t';
            case U'u':  return read_unicode_escape(pos);
            case kEndOfInput:
                fail(errc::unexpected_end_of_input, reader_.position());
            default:
                fail(errc::unrecognized_escape, pos);
        }
    }

    /// @brief Next character of a string body (escapes decoded), or nullopt
    /// after consuming the closing quote.
    std::optional<char32_t> next_str_char() {
        SourceLocation pos = reader_.position();
        char32_t ch = reader_.next();
        if (ch == U'"') return std::nullopt;
        if (ch == U'\\') return read_escape_sequence();
        if (ch == kEndOfInput) fail(errc::unexpected_end_of_input, pos);
        return ch;
    }

    /// @brief Reads the rest of a string body as UTF-8 into @p data.
    template <typename String>
    void read_str_bytes_into(String& data) {
        while (auto ch = next_str_char()) {
            append_utf8(data, *ch);
        }
    }

    /// @brief Reads the rest of an entry key. Returns true if it equals
    /// @p expected; otherwise appends the actual key to @p data.
    template <typename String>
    bool read_key_or_match(std::string_view expected, String& data) {
        size_t matched = 0;
        for (;;) {
            auto ch = next_str_char();
            if (!ch) {
                if (matched == expected.size()) return true;
                data.append(expected.data(), matched);
                return false;
            }
            char buf[4];
            unsigned n = serdex::detail::utf8::encode(static_cast<uint32_t>(*ch), buf);
            if (matched + n <= expected.size() &&
                std::memcmp(expected.data() + matched, buf, n) == 0) {
                matched += n;
                continue;
            }
            data.append(expected.data(), matched);
            data.append(buf, n);
            read_str_bytes_into(data);
            return false;
        }
    }

    template <typename String>
    static void append_utf8(String& data, char32_t ch) {
        char buf[4];
        unsigned n = serdex::detail::utf8::encode(static_cast<uint32_t>(ch), buf);
        data.append(buf, n);
    }

private:
    // ─── Number parts ─────────────────────────────────────────────────

    template <typename Builder>
    void push_digit(Builder& builder, char32_t ch, SourceLocation pos) const {
        if (!builder.push_digit(static_cast<uint8_t>(ch - U'0'))) {
            fail(errc::number_overflow, pos);
        }
    }

    /// @brief Reads the digits after '.'.
    /// @return Minus the number of fraction digits.
    template <typename Builder>
    int32_t read_fraction(Builder& builder, SourceLocation pos) {
        char32_t ch = reader_.next();
        if (!is_digit(ch)) {
            fail(ch == kEndOfInput ? errc::unexpected_end_of_input : errc::expected_number, pos);
        }
        int32_t decimal_exp = -1;
        push_digit(builder, ch, pos);
        while (is_digit(reader_.peek())) {
            --decimal_exp;
            push_digit(builder, reader_.next(), pos);
        }
        return decimal_exp;
    }

    /// @brief Reads the exponent after 'e' and adds @p decimal_exp to it.
    int32_t read_exponent(int32_t decimal_exp, SourceLocation pos) {
        UnsignedBuilder<uint32_t> exp_builder;
        bool negate_exp = false;
        char32_t ch = reader_.next();
        if (ch == U'+' || ch == U'-') {
            negate_exp = (ch == U'-');
            ch = reader_.next();
        }
        if (!is_digit(ch)) {
            fail(ch == kEndOfInput ? errc::unexpected_end_of_input : errc::expected_number, pos);
        }
        exp_builder.push_digit(static_cast<uint8_t>(ch - U'0'));
        while (is_digit(reader_.peek())) {
            push_digit(exp_builder, reader_.next(), pos);
        }
        int64_t exp = negate_exp ? -static_cast<int64_t>(exp_builder.value)
                                 : static_cast<int64_t>(exp_builder.value);
        exp += decimal_exp;
        if (exp < std::numeric_limits<int32_t>::min() ||
            exp > std::numeric_limits<int32_t>::max()) {
            fail(errc::number_overflow, pos);
        }
        return static_cast<int32_t>(exp);
    }

    static bool is_space(char32_t ch) noexcept {
        return ch == U' ' || ch == U'\n' || ch == U'\r' || ch == U'\t';
    }

    static bool is_digit(char32_t ch) noexcept {
        return ch >= U'0' && ch <= U'9';
    }

    static errc unexpected(char32_t ch) noexcept {
        return ch == kEndOfInput ? errc::unexpected_end_of_input : errc::unexpected_character;
    }

    /// @brief Advances past a comment; the leading slash is already consumed.
    void skip_comment() {
        SourceLocation pos = reader_.position();
        char32_t ch = reader_.next();
        if (ch == U'/') {
            for (;;) {
                ch = reader_.next();
                if (ch == U'\n') return;
                if (ch == kEndOfInput) fail(errc::unexpected_end_of_input, reader_.position());
            }
        }
        if (ch == U'*') {
            bool star = false;
            for (;;) {
                ch = reader_.next();
                if (ch == kEndOfInput) fail(errc::unexpected_end_of_input, reader_.position());
                if (star && ch == U'/') return;
                star = (ch == U'*');
            }
        }
        fail(unexpected(ch), pos);
    }

    uint32_t read_hex4(SourceLocation pos) {
        uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            char32_t ch = reader_.next();
            if (ch == kEndOfInput) fail(errc::unexpected_end_of_input, reader_.position());
            int v = serdex::detail::utf8::hex_value(static_cast<uint32_t>(ch));
            if (v < 0) fail(errc::invalid_unicode_escape, pos);
            cp = (cp << 4) | static_cast<uint32_t>(v);
        }
        return cp;
    }

    char32_t read_unicode_escape(SourceLocation pos) {
        namespace utf8 = serdex::detail::utf8;
        uint32_t cp = read_hex4(pos);
        if (utf8::is_low_surrogate(cp)) fail(errc::invalid_unicode_escape, pos);
        if (utf8::is_high_surrogate(cp)) {
            if (reader_.next() != U'\\' || reader_.next() != U'u') {
                fail(errc::invalid_unicode_escape, pos);
            }
            uint32_t low = read_hex4(pos);
            if (!utf8::is_low_surrogate(low)) fail(errc::invalid_unicode_escape, pos);
            cp = utf8::combine_surrogates(cp, low);
        }
        return static_cast<char32_t>(cp);
    }

    Reader reader_;
    bool allow_comments_;
};

} // namespace serdex::json::detail
