#pragma once

/// @file serializer.hpp
/// @author Aleksandr Loshkarev
/// @brief Writing half of the Outliner protocol.

#include "detail/utf8.hpp"
#include "outliner.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace serdex {

class Serializer : public virtual Outliner {
public:
    // ─── Scalars (top is a value; popped) ─────────────────────────────

    virtual void put_bool(bool value) = 0;
    virtual void put_i8(int8_t value) = 0;
    virtual void put_i16(int16_t value) = 0;
    virtual void put_i32(int32_t value) = 0;
    virtual void put_i64(int64_t value) = 0;
    virtual void put_u8(uint8_t value) = 0;
    virtual void put_u16(uint16_t value) = 0;
    virtual void put_u32(uint32_t value) = 0;
    virtual void put_u64(uint64_t value) = 0;
    virtual void put_f32(float value) = 0;
    virtual void put_f64(double value) = 0;
    virtual void put_char(char32_t value) = 0;

    // ─── Strings ──────────────────────────────────────────────────────

    /// Top is an opened string: appends one character.
    virtual void append_char(char32_t ch) = 0;

    /// Top is an opened string: appends UTF-8 text.
    virtual void append_str(std::string_view str) {
        const char* p = str.data();
        const char* end = p + str.size();
        while (p < end) {
            uint32_t cp = detail::utf8::decode(p, end);
            if (cp == detail::utf8::kInvalid) {
                cp = 0xFFFD;
                ++p;
            }
            append_char(static_cast<char32_t>(cp));
        }
    }

    /// Top is a value: writes it as a string.
    virtual void put_str(std::string_view str) {
        open_str();
        append_str(str);
        close_str();
    }

    /// Top is a value: writes variant tag @p index (at most @p max_index).
    /// Formats that prefer names write @p name when one is given.
    virtual void put_tag(size_t max_index, size_t index,
                         std::optional<std::string_view> name) = 0;

    /// Top is a value: opens it as a list of exactly @p len items.
    virtual void open_list_sized(size_t len) = 0;
};

} // namespace serdex
