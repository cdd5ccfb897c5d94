#pragma once

/// @file text_serializer.hpp
/// @author Aleksandr Loshkarev
/// @brief JSON serializer writing text to a character writer.
///
/// Compact output (default):
///   {"name": "Finland"}           ->  { "name": "Finland" }
///   [1, 2, 3], {}, []             ->  [1, 2, 3], {}, []
///
/// Indented output (TextSerializerConfig::indent = "    "):
///   {
///       "name": "Finland",
///       "langs": [
///           "fi",
///           "sv"
///       ],
///       "metadata": {}
///   }
///
/// Usage:
/// @code
///   std::string out;
///   serdex::json::TextSerializer<serdex::StringWriter> s{serdex::StringWriter(out)};
///   serdex::Value<serdex::json::JsonSerializer>::with(s, [](auto v) {
///       auto obj = serdex::json::into_object(std::move(v));
///       obj.entry("pop").put_u32(5500000);
///       std::move(obj).close();
///   });
/// @endcode

#include "../config.hpp"
#include "../text_writer.hpp"
#include "outliner.hpp"

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace serdex::json {

/// @brief Output options for TextSerializer.
struct TextSerializerConfig {
    /// One indentation level (e.g. "\t" or "    "). nullopt writes compact
    /// JSON without line breaks.
    std::optional<std::string_view> indent;

    static TextSerializerConfig compact() noexcept { return {}; }

    static TextSerializerConfig pretty(std::string_view indent = "    ") noexcept {
        TextSerializerConfig c;
        c.indent = indent;
        return c;
    }
};

/// @brief JsonSerializer writing to @p Writer (see text_writer.hpp). The
/// stack initially holds a single value.
template <typename Writer>
class TextSerializer final : public JsonSerializer {
public:
    explicit TextSerializer(Writer writer, TextSerializerConfig config = {})
        : writer_(std::move(writer)), config_(config) {}

    TextSerializer(const TextSerializer&) = delete;
    TextSerializer& operator=(const TextSerializer&) = delete;

    /// @brief Closes the serializer and returns the writer.
    Writer close() && {
        SERDEX_ASSERT(depth_ == 0 && !in_key_, "serializer closed inside an open collection");
        return std::move(writer_);
    }

    [[nodiscard]] const TextSerializerConfig& config() const noexcept { return config_; }

    // ─── Outliner ─────────────────────────────────────────────────────

    [[nodiscard]] bool supports_null() const override { return true; }

    void pop_null() override { writer_.write_str("null"); }

    void open_str() override { writer_.write_char(U'"'); }

    void close_str() override {
        writer_.write_char(U'"');
        if (in_key_) {
            writer_.write_str(": ");
            in_key_ = false;
        }
    }

    void open_struct(std::string_view /*type_name*/) override { open_object(); }

    void push_field(std::string_view name) override { push_entry(name); }

    void close_struct() override { close_object(); }

    void open_tuple(std::string_view /*type_name*/) override { open_list_streaming(); }

    void push_element() override { push_item(); }

    void close_tuple() override { close_list(); }

    void push_item() override {
        if (config_.indent) {
            if (at_first_) {
                at_first_ = false;
            } else {
                writer_.write_char(U',');
            }
            write_newline();
        } else if (at_first_) {
            at_first_ = false;
        } else {
            writer_.write_str(", ");
        }
    }

    void close_list() override {
        SERDEX_ASSERT(depth_ > 0, "no list to close");
        --depth_;
        if (at_first_) {
            at_first_ = false;
        } else if (config_.indent) {
            write_newline();
        }
        writer_.write_char(U']');
    }

    // ─── JsonOutliner ─────────────────────────────────────────────────

    void open_object() override {
        ++depth_;
        at_first_ = true;
        writer_.write_char(U'{');
    }

    void push_entry(std::string_view key) override {
        add_entry();
        append_str(key);
        close_str();
    }

    void close_object() override {
        SERDEX_ASSERT(depth_ > 0, "no object to close");
        --depth_;
        if (at_first_) {
            at_first_ = false;
            writer_.write_char(U'}');
        } else if (config_.indent) {
            write_newline();
            writer_.write_char(U'}');
        } else {
            writer_.write_str(" }");
        }
    }

    // ─── Serializer ───────────────────────────────────────────────────

    void put_bool(bool value) override { writer_.write_str(value ? "true" : "false"); }

    void put_i8(int8_t value) override { write_integer(value); }
    void put_i16(int16_t value) override { write_integer(value); }
    void put_i32(int32_t value) override { write_integer(value); }
    void put_i64(int64_t value) override { write_integer(value); }
    void put_u8(uint8_t value) override { write_integer(value); }
    void put_u16(uint16_t value) override { write_integer(value); }
    void put_u32(uint32_t value) override { write_integer(value); }
    void put_u64(uint64_t value) override { write_integer(value); }

    void put_f32(float value) override { write_float(value); }
    void put_f64(double value) override { write_float(value); }

    void put_char(char32_t value) override {
        open_str();
        append_char(value);
        close_str();
    }

    void append_char(char32_t ch) override {
        switch (ch) {
            case U'"':  writer_.write_str("\\\""); return;
            case U'\\': writer_.write_str("\\\\"); return;
            case U'\b': writer_.write_str("\\b"); return;
            case U'\f': writer_.write_str("\\f"); return;
            case U'\n': writer_.write_str("\\n"); return;
            case U'\r': writer_.write_str("\\r"); return;
            case U'\t': writer_.write_str("\\t"); return;
            default:
                break;
        }
        if (SERDEX_UNLIKELY(ch < 0x20)) {
            static constexpr char kHex[] = "0123456789abcdef";
            char buf[6] = {'\\', 'u', '0', '0',
                           kHex[(ch >> 4) & 0xF], kHex[ch & 0xF]};
            writer_.write_str(std::string_view(buf, sizeof(buf)));
            return;
        }
        writer_.write_char(ch);
    }

    void open_list_sized(size_t /*len*/) override { open_list_streaming(); }

    // ─── JsonSerializer ───────────────────────────────────────────────

    void open_list_streaming() override {
        ++depth_;
        at_first_ = true;
        writer_.write_char(U'[');
    }

    void add_entry() override {
        if (at_first_) {
            at_first_ = false;
        } else {
            writer_.write_char(U',');
        }
        if (config_.indent) {
            write_newline();
        } else {
            writer_.write_char(U' ');
        }
        in_key_ = true;
        writer_.write_char(U'"');
    }

private:
    void write_newline() {
        writer_.write_char(U'\n');
        for (uint32_t i = 0; i < depth_; ++i) {
            writer_.write_str(*config_.indent);
        }
    }

    template <typename T>
    void write_integer(T value) {
        char buf[24];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
        writer_.write_str(std::string_view(buf, static_cast<size_t>(ptr - buf)));
    }

    /// Shortest round-trip form, always with a '.' or exponent. NaN and
    /// infinities have no JSON form and are written as null.
    template <typename T>
    void write_float(T value) {
        if (SERDEX_UNLIKELY(std::isnan(value) || std::isinf(value))) {
            writer_.write_str("null");
            return;
        }
        char buf[40];
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
        size_t len = static_cast<size_t>(ptr - buf);
#else
        int n = std::snprintf(buf, sizeof(buf), "%.*g",
                              std::is_same_v<T, float> ? 9 : 17, static_cast<double>(value));
        size_t len = n > 0 ? static_cast<size_t>(n) : 0;
#endif
        bool has_dot = false;
        for (size_t i = 0; i < len; ++i) {
            if (buf[i] == '.' || buf[i] == 'e' || buf[i] == 'E') {
                has_dot = true;
                break;
            }
        }
        writer_.write_str(std::string_view(buf, len));
        if (!has_dot) writer_.write_str(".0");
    }

    Writer writer_;
    TextSerializerConfig config_;
    uint32_t depth_ = 0;
    bool in_key_ = false;
    bool at_first_ = false;
};

} // namespace serdex::json
