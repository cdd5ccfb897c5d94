#pragma once

/// @file conversion.hpp
/// @author Aleksandr Loshkarev
/// @brief ADL-based mapping of C++ types onto the Outliner protocol.
///
/// A type T is made (de)serializable by providing, in T's namespace:
///
///   template <typename D> void deserialize(serdex::Value<D> v, T& out);
///   template <typename S> void serialize(serdex::Value<S> v, const T& x);
///
/// Struct types may also provide deserialize_content/serialize_content
/// taking a Struct<O>& so that other structs can flatten them
/// (Struct::inline_get / inline_put). SERDEX_DEFINE_STRUCT in define.hpp
/// generates all four.
///
/// Built-in mappings:
///   - bool, int8..int64, uint8..uint64, float, double, char32_t
///   - std::string (and std::string_view / const char* for writing)
///   - std::optional<T>: null when the format has one and T is not itself
///     nullable, otherwise struct "Option" { has_value, value }
///   - std::vector<T>: list
///   - std::array<T, N>, std::pair, std::tuple: tuple

#include "error.hpp"
#include "value.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace serdex {

// =====================================================================
// Nullability
// =====================================================================

/// @brief True for types whose own representation may be null. An
/// optional of such a type cannot use null as its "empty" marker.
template <typename T>
struct is_nullable : std::false_type {};

template <typename T>
struct is_nullable<std::optional<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_nullable_v = is_nullable<T>::value;

// =====================================================================
// Scalars
// =====================================================================

template <typename D> void deserialize(Value<D> v, bool& out)     { out = std::move(v).get_bool(); }
template <typename D> void deserialize(Value<D> v, int8_t& out)   { out = std::move(v).get_i8(); }
template <typename D> void deserialize(Value<D> v, int16_t& out)  { out = std::move(v).get_i16(); }
template <typename D> void deserialize(Value<D> v, int32_t& out)  { out = std::move(v).get_i32(); }
template <typename D> void deserialize(Value<D> v, int64_t& out)  { out = std::move(v).get_i64(); }
template <typename D> void deserialize(Value<D> v, uint8_t& out)  { out = std::move(v).get_u8(); }
template <typename D> void deserialize(Value<D> v, uint16_t& out) { out = std::move(v).get_u16(); }
template <typename D> void deserialize(Value<D> v, uint32_t& out) { out = std::move(v).get_u32(); }
template <typename D> void deserialize(Value<D> v, uint64_t& out) { out = std::move(v).get_u64(); }
template <typename D> void deserialize(Value<D> v, float& out)    { out = std::move(v).get_f32(); }
template <typename D> void deserialize(Value<D> v, double& out)   { out = std::move(v).get_f64(); }
template <typename D> void deserialize(Value<D> v, char32_t& out) { out = std::move(v).get_char(); }
template <typename D> void deserialize(Value<D> v, std::string& out) { out = std::move(v).get_str(); }

template <typename S> void serialize(Value<S> v, bool x)     { std::move(v).put_bool(x); }
template <typename S> void serialize(Value<S> v, int8_t x)   { std::move(v).put_i8(x); }
template <typename S> void serialize(Value<S> v, int16_t x)  { std::move(v).put_i16(x); }
template <typename S> void serialize(Value<S> v, int32_t x)  { std::move(v).put_i32(x); }
template <typename S> void serialize(Value<S> v, int64_t x)  { std::move(v).put_i64(x); }
template <typename S> void serialize(Value<S> v, uint8_t x)  { std::move(v).put_u8(x); }
template <typename S> void serialize(Value<S> v, uint16_t x) { std::move(v).put_u16(x); }
template <typename S> void serialize(Value<S> v, uint32_t x) { std::move(v).put_u32(x); }
template <typename S> void serialize(Value<S> v, uint64_t x) { std::move(v).put_u64(x); }
template <typename S> void serialize(Value<S> v, float x)     { std::move(v).put_f32(x); }
template <typename S> void serialize(Value<S> v, double x)   { std::move(v).put_f64(x); }
template <typename S> void serialize(Value<S> v, char32_t x) { std::move(v).put_char(x); }
template <typename S> void serialize(Value<S> v, const std::string& x) { std::move(v).put_str(x); }
template <typename S> void serialize(Value<S> v, std::string_view x)   { std::move(v).put_str(x); }
template <typename S> void serialize(Value<S> v, const char* x)        { std::move(v).put_str(x); }

// =====================================================================
// std::optional
// =====================================================================

template <typename D, typename T>
void deserialize(Value<D> v, std::optional<T>& out) {
    if (!is_nullable_v<T> && v.supports_null()) {
        if (v.check_null()) {
            out.reset();
        } else {
            out.emplace();
            deserialize(std::move(v), *out);
        }
        return;
    }
    auto s = std::move(v).into_struct("Option");
    if (s.field("has_value").get_bool()) {
        out.emplace();
        deserialize(s.field("value"), *out);
    } else {
        out.reset();
    }
    std::move(s).close();
}

template <typename S, typename T>
void serialize(Value<S> v, const std::optional<T>& x) {
    if (!is_nullable_v<T> && v.supports_null()) {
        if (x) {
            serialize(std::move(v), *x);
        } else {
            std::move(v).put_null();
        }
        return;
    }
    auto s = std::move(v).into_struct("Option");
    s.field("has_value").put_bool(x.has_value());
    if (x) serialize(s.field("value"), *x);
    std::move(s).close();
}

// =====================================================================
// Sequences
// =====================================================================

template <typename D, typename T, typename A>
void deserialize(Value<D> v, std::vector<T, A>& out) {
    out.clear();
    auto list = std::move(v).into_list();
    if (auto len = list.rem_len()) out.reserve(*len);
    while (auto item = list.next()) {
        T elem{};
        deserialize(std::move(*item), elem);
        out.push_back(std::move(elem));
    }
}

template <typename S, typename T, typename A>
void serialize(Value<S> v, const std::vector<T, A>& x) {
    auto list = std::move(v).into_list_sized(x.size());
    for (const auto& elem : x) {
        serialize(list.push(), static_cast<const T&>(elem));
    }
    std::move(list).close();
}

template <typename D, typename T, size_t N>
void deserialize(Value<D> v, std::array<T, N>& out) {
    auto t = std::move(v).into_tuple();
    for (auto& elem : out) {
        deserialize(t.element(), elem);
    }
    std::move(t).close();
}

template <typename S, typename T, size_t N>
void serialize(Value<S> v, const std::array<T, N>& x) {
    auto t = std::move(v).into_tuple();
    for (const auto& elem : x) {
        serialize(t.element(), elem);
    }
    std::move(t).close();
}

// ─── pair / tuple ─────────────────────────────────────────────────────

namespace detail {

template <typename D, typename Tup, size_t... I>
void deserialize_elements(Tuple<D>& t, Tup& out, std::index_sequence<I...>) {
    (deserialize(t.element(), std::get<I>(out)), ...);
}

template <typename S, typename Tup, size_t... I>
void serialize_elements(Tuple<S>& t, const Tup& x, std::index_sequence<I...>) {
    (serialize(t.element(), std::get<I>(x)), ...);
}

} // namespace detail

template <typename D, typename A, typename B>
void deserialize(Value<D> v, std::pair<A, B>& out) {
    auto t = std::move(v).into_tuple();
    detail::deserialize_elements(t, out, std::index_sequence_for<A, B>{});
    std::move(t).close();
}

template <typename S, typename A, typename B>
void serialize(Value<S> v, const std::pair<A, B>& x) {
    auto t = std::move(v).into_tuple();
    detail::serialize_elements(t, x, std::index_sequence_for<A, B>{});
    std::move(t).close();
}

template <typename D, typename... Ts>
void deserialize(Value<D> v, std::tuple<Ts...>& out) {
    auto t = std::move(v).into_tuple();
    detail::deserialize_elements(t, out, std::index_sequence_for<Ts...>{});
    std::move(t).close();
}

template <typename S, typename... Ts>
void serialize(Value<S> v, const std::tuple<Ts...>& x) {
    auto t = std::move(v).into_tuple();
    detail::serialize_elements(t, x, std::index_sequence_for<Ts...>{});
    std::move(t).close();
}

} // namespace serdex
