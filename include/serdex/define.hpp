#pragma once

/// @file define.hpp
/// @author Aleksandr Loshkarev
/// @brief Macros mapping plain structs and enums onto the Outliner protocol.
///
/// @example
/// @code
///   namespace app {
///   struct User { std::string name; int32_t age; bool active; };
///   SERDEX_DEFINE_STRUCT(User, name, age, active)
///
///   enum class Role { admin, guest };
///   SERDEX_DEFINE_ENUM(Role, admin, guest)
///   } // namespace app
///
///   auto u = serdex::json::from_str<app::User>(R"({"age": 30, "name": "A", "active": true})");
/// @endcode
///
/// Both macros must be used at namespace scope, in the namespace of the
/// type, and accept up to 20 members.

#include "conversion.hpp"
#include "error.hpp"
#include "name_map.hpp"
#include "value.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace serdex {

// =====================================================================
// Enum descriptors
// =====================================================================

namespace detail {

template <size_t N>
constexpr FixedNameMap<size_t, N> make_index_map(const std::array<std::string_view, N>& names) {
    std::array<NameEntry<size_t>, N> entries{};
    for (size_t i = 0; i < N; ++i) {
        entries[i] = NameEntry<size_t>{names[i], i};
    }
    return FixedNameMap<size_t, N>(entries);
}

} // namespace detail

/// @brief Names and values of an enumeration, in declaration order. The
/// name table maps each name to its declaration index.
template <typename T, size_t N>
struct EnumDescriptor {
    constexpr EnumDescriptor(std::array<T, N> vals, std::array<std::string_view, N> nms)
        : values(vals), names_by_index(nms), names(detail::make_index_map(nms)) {}

    std::array<T, N> values;
    std::array<std::string_view, N> names_by_index;
    FixedNameMap<size_t, N> names;

    /// @brief Declaration index of @p value, or nullopt if it was not listed.
    [[nodiscard]] constexpr std::optional<size_t> index_of(T value) const noexcept {
        for (size_t i = 0; i < N; ++i) {
            if (values[i] == value) return i;
        }
        return std::nullopt;
    }
};

/// @brief Access to the descriptor generated by SERDEX_DEFINE_ENUM.
template <typename T>
struct EnumTraits {
    static const auto& descriptor() { return serdex_enum_descriptor(T{}); }
    static NameMap<size_t> names() { return descriptor().names; }
    static constexpr size_t size() noexcept {
        return std::tuple_size<decltype(serdex_enum_descriptor(T{}).values)>::value;
    }
};

namespace detail {

template <typename D, typename T>
void deserialize_enum(Value<D> v, T& out) {
    const auto& desc = EnumTraits<T>::descriptor();
    size_t index = std::move(v).get_tag(desc.values.size() - 1, desc.names);
    out = desc.values[index];
}

template <typename S, typename T>
void serialize_enum(Value<S> v, T x) {
    const auto& desc = EnumTraits<T>::descriptor();
    auto index = desc.index_of(x);
    if (!index) {
        throw SerializeError("enum value has no declared name", errc::invalid_index);
    }
    std::move(v).put_tag(desc.values.size() - 1, *index, desc.names_by_index[*index]);
}

} // namespace detail
} // namespace serdex

// =====================================================================
// Preprocessor FOREACH utilities (support up to 20 members)
// =====================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define SERDEX_PP_CAT_I(a, b) a##b
#define SERDEX_PP_CAT(a, b) SERDEX_PP_CAT_I(a, b)

#define SERDEX_PP_NARG(...) \
    SERDEX_PP_ARG_N(__VA_ARGS__, \
    20,19,18,17,16,15,14,13,12,11,10,9,8,7,6,5,4,3,2,1,0)
#define SERDEX_PP_ARG_N( \
    _1,_2,_3,_4,_5,_6,_7,_8,_9,_10, \
    _11,_12,_13,_14,_15,_16,_17,_18,_19,_20, N,...) N

// m(d, x) for each x; d is passed through unchanged.
#define SERDEX_PP_FE_1(m,d,x) m(d,x)
#define SERDEX_PP_FE_2(m,d,x,...) m(d,x) SERDEX_PP_FE_1(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_3(m,d,x,...) m(d,x) SERDEX_PP_FE_2(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_4(m,d,x,...) m(d,x) SERDEX_PP_FE_3(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_5(m,d,x,...) m(d,x) SERDEX_PP_FE_4(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_6(m,d,x,...) m(d,x) SERDEX_PP_FE_5(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_7(m,d,x,...) m(d,x) SERDEX_PP_FE_6(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_8(m,d,x,...) m(d,x) SERDEX_PP_FE_7(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_9(m,d,x,...) m(d,x) SERDEX_PP_FE_8(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_10(m,d,x,...) m(d,x) SERDEX_PP_FE_9(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_11(m,d,x,...) m(d,x) SERDEX_PP_FE_10(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_12(m,d,x,...) m(d,x) SERDEX_PP_FE_11(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_13(m,d,x,...) m(d,x) SERDEX_PP_FE_12(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_14(m,d,x,...) m(d,x) SERDEX_PP_FE_13(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_15(m,d,x,...) m(d,x) SERDEX_PP_FE_14(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_16(m,d,x,...) m(d,x) SERDEX_PP_FE_15(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_17(m,d,x,...) m(d,x) SERDEX_PP_FE_16(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_18(m,d,x,...) m(d,x) SERDEX_PP_FE_17(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_19(m,d,x,...) m(d,x) SERDEX_PP_FE_18(m,d,__VA_ARGS__)
#define SERDEX_PP_FE_20(m,d,x,...) m(d,x) SERDEX_PP_FE_19(m,d,__VA_ARGS__)

#define SERDEX_PP_FOREACH(m,d,...) \
    SERDEX_PP_CAT(SERDEX_PP_FE_, SERDEX_PP_NARG(__VA_ARGS__))(m, d, __VA_ARGS__)

// Member-level macros
#define SERDEX_DETAIL_PUT_FIELD(obj, fld) serialize(serdex_s_.field(#fld), obj.fld);
#define SERDEX_DETAIL_GET_FIELD(obj, fld) deserialize(serdex_s_.field(#fld), obj.fld);
#define SERDEX_DETAIL_ENUM_VALUE(Type, e) Type::e,
#define SERDEX_DETAIL_ENUM_NAME(Type, e) std::string_view(#e),

/// Maps the listed members of @p Type, in order, to struct fields of the
/// same names. Also generates serialize_content / deserialize_content so
/// that @p Type can be flattened into another struct.
#define SERDEX_DEFINE_STRUCT(Type, ...) \
    template <typename SerdexS> \
    void serialize_content(::serdex::Struct<SerdexS>& serdex_s_, const Type& serdex_v_) { \
        SERDEX_PP_FOREACH(SERDEX_DETAIL_PUT_FIELD, serdex_v_, __VA_ARGS__) \
    } \
    template <typename SerdexD> \
    void deserialize_content(::serdex::Struct<SerdexD>& serdex_s_, Type& serdex_v_) { \
        SERDEX_PP_FOREACH(SERDEX_DETAIL_GET_FIELD, serdex_v_, __VA_ARGS__) \
    } \
    template <typename SerdexS> \
    void serialize(::serdex::Value<SerdexS> serdex_val_, const Type& serdex_v_) { \
        auto serdex_s_ = std::move(serdex_val_).into_struct(#Type); \
        serialize_content(serdex_s_, serdex_v_); \
        std::move(serdex_s_).close(); \
    } \
    template <typename SerdexD> \
    void deserialize(::serdex::Value<SerdexD> serdex_val_, Type& serdex_v_) { \
        auto serdex_s_ = std::move(serdex_val_).into_struct(#Type); \
        deserialize_content(serdex_s_, serdex_v_); \
        std::move(serdex_s_).close(); \
    }

/// Maps the listed enumerators of @p Type to tags. Text formats write the
/// enumerator name; the declaration index is accepted on input as well.
#define SERDEX_DEFINE_ENUM(Type, ...) \
    inline const auto& serdex_enum_descriptor(Type) { \
        static constexpr ::serdex::EnumDescriptor<Type, SERDEX_PP_NARG(__VA_ARGS__)> desc( \
            {{ SERDEX_PP_FOREACH(SERDEX_DETAIL_ENUM_VALUE, Type, __VA_ARGS__) }}, \
            {{ SERDEX_PP_FOREACH(SERDEX_DETAIL_ENUM_NAME, Type, __VA_ARGS__) }}); \
        return desc; \
    } \
    template <typename SerdexD> \
    void deserialize(::serdex::Value<SerdexD> serdex_val_, Type& serdex_v_) { \
        ::serdex::detail::deserialize_enum(std::move(serdex_val_), serdex_v_); \
    } \
    template <typename SerdexS> \
    void serialize(::serdex::Value<SerdexS> serdex_val_, const Type& serdex_v_) { \
        ::serdex::detail::serialize_enum(std::move(serdex_val_), serdex_v_); \
    }

// NOLINTEND(cppcoreguidelines-macro-usage)
