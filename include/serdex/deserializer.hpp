#pragma once

/// @file deserializer.hpp
/// @author Aleksandr Loshkarev
/// @brief Reading half of the Outliner protocol.

#include "error.hpp"
#include "name_map.hpp"
#include "outliner.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace serdex {

class Deserializer : public virtual Outliner {
public:
    // ─── Scalars (top is a value; popped) ─────────────────────────────

    virtual bool     get_bool() = 0;
    virtual int8_t   get_i8() = 0;
    virtual int16_t  get_i16() = 0;
    virtual int32_t  get_i32() = 0;
    virtual int64_t  get_i64() = 0;
    virtual uint8_t  get_u8() = 0;
    virtual uint16_t get_u16() = 0;
    virtual uint32_t get_u32() = 0;
    virtual uint64_t get_u64() = 0;
    virtual float    get_f32() = 0;
    virtual double   get_f64() = 0;

    /// Reads a string consisting of exactly one character.
    virtual char32_t get_char() = 0;

    // ─── Strings ──────────────────────────────────────────────────────

    /// Top is an opened string: returns its next character, or nullopt
    /// after popping the string once it is exhausted.
    virtual std::optional<char32_t> next_char() = 0;

    /// Top is an opened string: reads the remaining characters and pops it.
    virtual std::string flush_str() {
        std::string str;
        while (auto ch = next_char()) {
            detail::utf8::encode(static_cast<uint32_t>(*ch), str);
        }
        return str;
    }

    /// Top is an opened string: discards the remaining characters and pops it.
    virtual void skip_str() {
        while (next_char()) {
        }
    }

    /// Top is a value: reads it as a string.
    std::string read_str() {
        open_str();
        return flush_str();
    }

    /// Top is an opened string: resolves the remaining characters against
    /// @p names (without materializing them) and pops it.
    size_t flush_name(NameMap<size_t> names) {
        auto lookup = names.lookup();
        while (auto ch = next_char()) {
            lookup.write_char(*ch);
        }
        if (const size_t* index = lookup.result()) return *index;
        throw error_invalid_name(names);
    }

    /// Top is a value: reads it as one of @p names.
    size_t get_name(NameMap<size_t> names) {
        open_str();
        return flush_name(names);
    }

    /// Top is a value: reads a variant tag, either by name or by index
    /// (at most @p max_index), depending on the format.
    virtual size_t get_tag(size_t max_index, NameMap<size_t> names) = 0;

    // ─── Null / lists ─────────────────────────────────────────────────

    /// Top is a value: pops it and returns true if it is null, otherwise
    /// leaves it in place and returns false.
    virtual bool check_null() = 0;

    /// Top is a value: opens it as a list. Returns the item count if the
    /// format knows it up front.
    virtual std::optional<size_t> open_list() = 0;

    /// Top is an opened list: pushes the next item and returns true, or
    /// pops the list and returns false.
    virtual bool next_item() = 0;

    // ─── Errors ───────────────────────────────────────────────────────
    // Errors are constructed, not thrown, so that callers can clean up
    // the stack first. They are tagged with the most recently consumed
    // position.

    /// Error of any kind at the current error position.
    [[nodiscard]] virtual DeserializeError make_error(errc code, std::string detail = {}) const = 0;

    /// Caller-supplied validation failure.
    [[nodiscard]] DeserializeError error(const std::string& message) const {
        return make_error(errc::custom, message);
    }

    [[nodiscard]] DeserializeError error_invalid_name(NameMap<size_t> names) const {
        std::string msg = "name is not one of the allowed options (";
        bool first = true;
        for (const auto& entry : names) {
            if (!first) msg += ", ";
            first = false;
            msg += '"';
            msg.append(entry.name.data(), entry.name.size());
            msg += '"';
        }
        msg += ')';
        return make_error(errc::invalid_name, std::move(msg));
    }

    [[nodiscard]] DeserializeError error_invalid_index(size_t max_index) const {
        return make_error(errc::invalid_index,
                          "index is greater than the maximum allowed index, " +
                              std::to_string(max_index));
    }

    /// Tagged to the most recently popped list.
    [[nodiscard]] virtual DeserializeError error_missing_item() const = 0;

    /// Tagged to the list at the top of the stack.
    [[nodiscard]] virtual DeserializeError error_extra_item() const = 0;
};

} // namespace serdex
