#pragma once

/// @file number.hpp
/// @author Aleksandr Loshkarev
/// @brief Exact conversion of decimal (sign, digits, exponent) triples.
///
/// The deserializer feeds digits one at a time into a per-type builder
/// and then scales by a power of ten:
///   - Integers: checked arithmetic. A positive exponent multiplies, a
///     negative one must divide exactly ("1000E-3" is 1, "15.7" is not
///     an integer).
///   - Floats: the digits are re-assembled as "<digits>e<exp>" and
///     converted once with from_chars, which rounds correctly. The sign
///     is applied afterwards so "-0" stays negative zero.

#include "../config.hpp"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

namespace serdex::json::detail {

// =====================================================================
// Builders
// =====================================================================

/// @brief Accumulates decimal digits into an unsigned integer.
template <typename U>
struct UnsignedBuilder {
    U value = 0;

    /// @return false if the next digit would overflow U.
    bool push_digit(uint8_t digit) noexcept {
        constexpr U kMax = std::numeric_limits<U>::max();
        if (value > static_cast<U>((kMax - digit) / 10)) return false;
        value = static_cast<U>(value * 10 + digit);
        return true;
    }
};

/// @brief Collects decimal digits as text for a single float conversion.
struct FloatBuilder {
    std::string digits;

    bool push_digit(uint8_t digit) {
        digits.push_back(static_cast<char>('0' + digit));
        return true;
    }
};

// =====================================================================
// Scaling
// =====================================================================

template <typename U>
std::optional<U> checked_pow10(uint32_t exp) noexcept {
    U pow = 1;
    for (uint32_t i = 0; i < exp; ++i) {
        if (pow > std::numeric_limits<U>::max() / 10) return std::nullopt;
        pow = static_cast<U>(pow * 10);
    }
    return pow;
}

/// @brief value * 10^exp10, or nullopt if the result is not an integer
/// representable in U. Zero scales to zero for any exponent.
template <typename U>
std::optional<U> scale_unsigned(U value, int32_t exp10) noexcept {
    if (value == 0) return U{0};
    if (exp10 >= 0) {
        auto pow = checked_pow10<U>(static_cast<uint32_t>(exp10));
        if (!pow || value > std::numeric_limits<U>::max() / *pow) return std::nullopt;
        return static_cast<U>(value * *pow);
    }
    auto pow = checked_pow10<U>(static_cast<uint32_t>(-static_cast<int64_t>(exp10)));
    if (!pow || value % *pow != 0) return std::nullopt;
    return static_cast<U>(value / *pow);
}

// =====================================================================
// Num: per-type builder and conversion
// =====================================================================

template <typename T, typename = void>
struct Num;

template <typename T>
struct Num<T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T>>> {
    using Builder = UnsignedBuilder<T>;

    static std::optional<T> from_builder(const Builder& b, bool negate, int32_t exp10) noexcept {
        if (negate && b.value != 0) return std::nullopt;
        return scale_unsigned<T>(b.value, exp10);
    }
};

template <typename T>
struct Num<T, std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>>> {
    using Unsigned = std::make_unsigned_t<T>;
    using Builder = UnsignedBuilder<Unsigned>;

    static std::optional<T> from_builder(const Builder& b, bool negate, int32_t exp10) noexcept {
        auto magnitude = scale_unsigned<Unsigned>(b.value, exp10);
        if (!magnitude) return std::nullopt;
        constexpr auto kMax = static_cast<Unsigned>(std::numeric_limits<T>::max());
        if (!negate) {
            if (*magnitude > kMax) return std::nullopt;
            return static_cast<T>(*magnitude);
        }
        if (*magnitude > static_cast<Unsigned>(kMax + 1u)) return std::nullopt;
        if (*magnitude == static_cast<Unsigned>(kMax + 1u)) return std::numeric_limits<T>::min();
        return static_cast<T>(-static_cast<T>(*magnitude));
    }
};

template <typename T>
struct Num<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    using Builder = FloatBuilder;

    static std::optional<T> from_builder(Builder& b, bool negate, int32_t exp10) {
        T res = 0;
        if (!b.digits.empty()) {
            b.digits.push_back('e');
            b.digits += std::to_string(exp10);
            res = parse(b.digits);
        }
        return negate ? -res : res;
    }

private:
    static T parse(const std::string& text) {
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
        T value = 0;
        auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (SERDEX_LIKELY(ec == std::errc{})) return value;
#endif
        // Out of range (or no from_chars): strto* saturates to infinity and
        // rounds tiny values to the nearest subnormal or zero.
        if constexpr (std::is_same_v<T, float>) {
            return std::strtof(text.c_str(), nullptr);
        } else {
            return static_cast<T>(std::strtod(text.c_str(), nullptr));
        }
    }
};

} // namespace serdex::json::detail
