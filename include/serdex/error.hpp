#pragma once

/// @file error.hpp
/// @author Aleksandr Loshkarev
/// @brief Error types for serdex: exceptions + std::error_code system.
///
/// Two disjoint classes of failure:
///   - Data errors (malformed or unexpected input): serdex::errc codes,
///     thrown as DeserializeError with the source position attached.
///   - Protocol violations (misuse of the wrapper handles or the
///     stack machine): fatal, see SERDEX_ASSERT in config.hpp.
///
/// Use json::try_from_str(input) for exception-free deserialization.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace serdex {

// =====================================================================
// Source position
// =====================================================================

/// @brief Position in the source text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning

    friend bool operator==(const SourceLocation& a, const SourceLocation& b) noexcept {
        return a.offset == b.offset;
    }
    friend bool operator!=(const SourceLocation& a, const SourceLocation& b) noexcept {
        return a.offset != b.offset;
    }
    friend bool operator<(const SourceLocation& a, const SourceLocation& b) noexcept {
        return a.offset < b.offset;
    }

    /// @brief "line L, column C".
    [[nodiscard]] std::string to_string() const {
        return "line " + std::to_string(line) + ", column " + std::to_string(column);
    }
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief serdex error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Syntax errors (1-29)
    unexpected_end_of_input = 1,
    unexpected_character    = 2,
    invalid_literal         = 3,
    unrecognized_escape     = 4,
    invalid_unicode_escape  = 5,
    invalid_utf8            = 6,
    max_depth_exceeded      = 7,

    // Type errors (30-49)
    expected_string         = 30,
    expected_number         = 31,
    expected_object         = 32,
    expected_array          = 33,
    expected_bool           = 34,
    expected_null           = 35,
    expected_char           = 36,
    number_overflow         = 37,

    // Shape errors (50-69)
    missing_key             = 50,
    extra_key               = 51,
    key_too_long            = 52,
    missing_items           = 53,
    excess_items            = 54,
    invalid_name            = 55,
    invalid_index           = 56,

    // Caller-supplied validation (70)
    custom                  = 70,

    // Serialization errors (80-99)
    write_failed            = 80,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class serdex_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "serdex";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                      return "success";
            case errc::unexpected_end_of_input: return "unexpected EOF";
            case errc::unexpected_character:    return "unexpected character";
            case errc::invalid_literal:         return "invalid literal";
            case errc::unrecognized_escape:     return "unrecognized escape sequence";
            case errc::invalid_unicode_escape:  return "invalid unicode escape";
            case errc::invalid_utf8:            return "invalid UTF-8 encoding";
            case errc::max_depth_exceeded:      return "maximum nesting depth exceeded";
            case errc::expected_string:         return "expected string";
            case errc::expected_number:         return "expected number";
            case errc::expected_object:         return "expected object";
            case errc::expected_array:          return "expected array";
            case errc::expected_bool:           return "expected bool";
            case errc::expected_null:           return "expected 'null'";
            case errc::expected_char:           return "expected single character";
            case errc::number_overflow:         return "numeric overflow";
            case errc::missing_key:             return "missing object key";
            case errc::extra_key:               return "extra object key";
            case errc::key_too_long:            return "object key too long";
            case errc::missing_items:           return "array has fewer items than expected";
            case errc::excess_items:            return "array has more items than expected";
            case errc::invalid_name:            return "invalid name";
            case errc::invalid_index:           return "invalid index";
            case errc::custom:                  return "validation failed";
            case errc::write_failed:            return "write to output failed";
            default:                            return "unknown serdex error";
        }
    }
};

} // namespace detail

/// @brief Get the serdex error category singleton.
inline const std::error_category& serdex_category() noexcept {
    static const detail::serdex_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from serdex::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), serdex_category()};
}

/// @brief Create an error_condition from serdex::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), serdex_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Data error raised while deserializing, tagged with the position
/// of the most recently consumed token.
///
/// detail() holds the key for missing_key/extra_key, the list of allowed
/// names for invalid_name, and the caller's text for custom errors.
class DeserializeError : public std::system_error {
public:
    DeserializeError(errc code, SourceLocation loc, std::string detail = {})
        : std::system_error(make_error_code(code))
        , message_(format_message(code, loc, detail))
        , location_(loc)
        , detail_(std::move(detail)) {}

    /// @brief "deserialize error at line L, column C: <description>".
    [[nodiscard]] const char* what() const noexcept override {
        return message_.c_str();
    }

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

    /// @brief Supplementary text for the error (may be empty).
    [[nodiscard]] const std::string& detail() const noexcept {
        return detail_;
    }

    /// @brief Shorthand for code() == make_error_code(e).
    [[nodiscard]] bool is(errc e) const noexcept {
        return code() == make_error_code(e);
    }

private:
    static std::string describe(errc code, const std::string& detail) {
        switch (code) {
            case errc::missing_key:
            case errc::extra_key:
                return serdex_category().message(static_cast<int>(code)) +
                       " " + quote(detail);
            case errc::invalid_name:
            case errc::invalid_index:
            case errc::custom:
                if (!detail.empty()) return detail;
                break;
            default:
                break;
        }
        return serdex_category().message(static_cast<int>(code));
    }

    static std::string format_message(errc code, const SourceLocation& loc,
                                      const std::string& detail) {
        return "deserialize error at " + loc.to_string() + ": " +
               describe(code, detail);
    }

    static std::string quote(const std::string& s) {
        std::string out;
        out.reserve(s.size() + 2);
        out.push_back('"');
        for (char c : s) {
            if (c == '"' || c == '\\') out.push_back('\\');
            out.push_back(c);
        }
        out.push_back('"');
        return out;
    }

    std::string message_;
    SourceLocation location_;
    std::string detail_;
};

/// @brief Failure of the output sink while serializing.
class SerializeError : public std::system_error {
public:
    explicit SerializeError(const std::string& msg, errc code = errc::write_failed)
        : std::system_error(make_error_code(code)), message_(msg) {}

    [[nodiscard]] const char* what() const noexcept override {
        return message_.c_str();
    }

private:
    std::string message_;
};

/// @brief Thrown by caller code inside Value::validate_with() to reject a
/// syntactically valid value. Converted to a DeserializeError with
/// errc::custom at the position of the rejected value.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [val, ec, msg] = serdex::json::try_from_str<T>(input);
template <typename T>
struct result {
    T value;
    std::error_code ec;
    std::string message;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace serdex

// Register serdex::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<serdex::errc> : true_type {};
} // namespace std
