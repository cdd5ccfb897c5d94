#pragma once

/// @file value.hpp
/// @author Aleksandr Loshkarev
/// @brief Checked handles over the Outliner protocol.
///
/// Each handle stands for one slot of the outliner stack:
///   - Value<O>:  an unopened value
///   - Struct<O>: an opened struct
///   - Tuple<O>:  an opened tuple
///   - List<O>:   an opened list
///
/// Handles are move-only. Operations that pop the slot are rvalue-qualified,
/// so `std::move(v).get_bool()` reads the value and leaves `v` empty. A
/// child handle borrows its parent's ready flag: the parent may not push
/// another child (or close) until the child has been consumed. Any misuse
/// that slips past the type system is caught by SERDEX_ASSERT.
///
/// Usage:
/// @code
///   auto s = std::move(value).into_struct("Point");
///   int32_t x = s.field("x").get_i32();
///   int32_t y = s.field("y").get_i32();
///   std::move(s).close();
/// @endcode

#include "config.hpp"
#include "deserializer.hpp"
#include "error.hpp"
#include "name_map.hpp"
#include "outliner.hpp"
#include "serializer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace serdex {

namespace detail {

inline constexpr const char* kInvalidStateError = "wrapper is in an invalid state";
inline constexpr const char* kListOverflowError = "list has/expects no more items";
inline constexpr const char* kListUnderflowError =
    "list has/expects more items and may not be closed yet";

} // namespace detail

template <typename O> class Value;
template <typename O> class Struct;
template <typename O> class Tuple;
template <typename O> class List;

// =====================================================================
// Value: an unopened value at the top of the stack
// =====================================================================

/// @brief Handle for a value at the top of the stack of @p O.
///
/// @p done is the parent's flag; it is set once the value has been popped.
template <typename O>
class Value {
public:
    Value(O& source, bool& done) noexcept : source_(&source), done_(&done) {}

    Value(Value&& other) noexcept : source_(other.source_), done_(other.done_) {
        other.source_ = nullptr;
    }

    /// @brief Widens a handle to a base interface (e.g. to Value<Deserializer>).
    template <typename U,
              std::enable_if_t<std::is_base_of_v<O, U> && !std::is_same_v<O, U>, int> = 0>
    Value(Value<U>&& other) noexcept : source_(other.source_), done_(other.done_) {
        other.source_ = nullptr;
    }

    Value(const Value&) = delete;
    Value& operator=(const Value&) = delete;
    Value& operator=(Value&&) = delete;

    /// @brief Runs @p f on a value at the top of @p source and asserts that
    /// @p f consumed it.
    template <typename F>
    static decltype(auto) with(O& source, F&& f) {
        bool done = false;
        if constexpr (std::is_void_v<std::invoke_result_t<F, Value>>) {
            std::forward<F>(f)(Value(source, done));
            SERDEX_ASSERT(done, detail::kInvalidStateError);
        } else {
            auto res = std::forward<F>(f)(Value(source, done));
            SERDEX_ASSERT(done, detail::kInvalidStateError);
            return res;
        }
    }

    /// @brief The underlying outliner.
    [[nodiscard]] O& raw() const noexcept {
        SERDEX_ASSERT(source_ != nullptr, detail::kInvalidStateError);
        return *source_;
    }

    /// @brief Gives up the handle. The caller must pop the value and set
    /// @p done itself, leaving lower stack items untouched.
    [[nodiscard]] std::pair<O*, bool*> into_raw() && noexcept {
        O* source = source_;
        source_ = nullptr;
        return {source, done_};
    }

    [[nodiscard]] bool supports_null() const { return raw().supports_null(); }

    // ─── Compound values ──────────────────────────────────────────────

    Struct<O> into_struct(std::string_view type_name = {}) && {
        O& source = take();
        source.open_struct(type_name);
        return Struct<O>(source, *done_);
    }

    Tuple<O> into_tuple(std::string_view type_name = {}) && {
        O& source = take();
        source.open_tuple(type_name);
        return Tuple<O>(source, *done_);
    }

    /// @brief Opens the value as a list (deserializers).
    List<O> into_list() && {
        O& source = take();
        std::optional<size_t> len = source.open_list();
        return List<O>(source, *done_, len);
    }

    /// @brief Opens the value as a list of exactly @p len items (serializers).
    List<O> into_list_sized(size_t len) && {
        O& source = take();
        source.open_list_sized(len);
        return List<O>(source, *done_, len);
    }

    // ─── Reading ──────────────────────────────────────────────────────

    /// @brief Reads the value through the deserialize() customization point.
    template <typename T>
    T get() && {
        static_assert(std::is_default_constructible_v<T>,
                      "Value::get<T>() requires a default-constructible T");
        T out{};
        deserialize(std::move(*this), out);
        return out;
    }

    /// @brief Pops the value and returns true if it is null. Otherwise the
    /// handle stays usable.
    bool check_null() {
        SERDEX_ASSERT(source_ && !*done_, detail::kInvalidStateError);
        if (source_->supports_null() && source_->check_null()) {
            finish();
            return true;
        }
        return false;
    }

    bool get_bool() && { return pop([](O& s) { return s.get_bool(); }); }
    int8_t get_i8() && { return pop([](O& s) { return s.get_i8(); }); }
    int16_t get_i16() && { return pop([](O& s) { return s.get_i16(); }); }
    int32_t get_i32() && { return pop([](O& s) { return s.get_i32(); }); }
    int64_t get_i64() && { return pop([](O& s) { return s.get_i64(); }); }
    uint8_t get_u8() && { return pop([](O& s) { return s.get_u8(); }); }
    uint16_t get_u16() && { return pop([](O& s) { return s.get_u16(); }); }
    uint32_t get_u32() && { return pop([](O& s) { return s.get_u32(); }); }
    uint64_t get_u64() && { return pop([](O& s) { return s.get_u64(); }); }
    float get_f32() && { return pop([](O& s) { return s.get_f32(); }); }
    double get_f64() && { return pop([](O& s) { return s.get_f64(); }); }
    char32_t get_char() && { return pop([](O& s) { return s.get_char(); }); }
    std::string get_str() && { return pop([](O& s) { return s.read_str(); }); }

    /// @brief Reads an enum tag, by name from @p names or by index up to
    /// @p max_index, depending on the format.
    size_t get_tag(size_t max_index, NameMap<size_t> names) && {
        return pop([&](O& s) { return s.get_tag(max_index, names); });
    }

    /// @brief Runs @p f on this value; a ValidationError thrown by @p f
    /// becomes a custom DeserializeError at the deserializer's position.
    template <typename F>
    decltype(auto) validate_with(F&& f) && {
        O& source = take();
        bool* done = done_;
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<F, Value>>) {
                std::forward<F>(f)(Value(source, *done));
                SERDEX_ASSERT(*done, detail::kInvalidStateError);
            } else {
                auto res = std::forward<F>(f)(Value(source, *done));
                SERDEX_ASSERT(*done, detail::kInvalidStateError);
                return res;
            }
        } catch (const ValidationError& e) {
            throw source.error(e.what());
        }
    }

    // ─── Writing ──────────────────────────────────────────────────────

    /// @brief Writes @p value through the serialize() customization point.
    template <typename T>
    void put(const T& value) && {
        serialize(std::move(*this), value);
    }

    void put_bool(bool v) && { push([&](O& s) { s.put_bool(v); }); }
    void put_i8(int8_t v) && { push([&](O& s) { s.put_i8(v); }); }
    void put_i16(int16_t v) && { push([&](O& s) { s.put_i16(v); }); }
    void put_i32(int32_t v) && { push([&](O& s) { s.put_i32(v); }); }
    void put_i64(int64_t v) && { push([&](O& s) { s.put_i64(v); }); }
    void put_u8(uint8_t v) && { push([&](O& s) { s.put_u8(v); }); }
    void put_u16(uint16_t v) && { push([&](O& s) { s.put_u16(v); }); }
    void put_u32(uint32_t v) && { push([&](O& s) { s.put_u32(v); }); }
    void put_u64(uint64_t v) && { push([&](O& s) { s.put_u64(v); }); }
    void put_f32(float v) && { push([&](O& s) { s.put_f32(v); }); }
    void put_f64(double v) && { push([&](O& s) { s.put_f64(v); }); }
    void put_char(char32_t v) && { push([&](O& s) { s.put_char(v); }); }
    void put_str(std::string_view v) && { push([&](O& s) { s.put_str(v); }); }

    void put_tag(size_t max_index, size_t index,
                 std::optional<std::string_view> name = std::nullopt) && {
        push([&](O& s) { s.put_tag(max_index, index, name); });
    }

    /// @brief Writes null. Only valid when supports_null() is true.
    void put_null() && { push([](O& s) { s.pop_null(); }); }

private:
    template <typename U> friend class Value;

    O& take() {
        SERDEX_ASSERT(source_ && !*done_, detail::kInvalidStateError);
        O& source = *source_;
        source_ = nullptr;
        return source;
    }

    void finish() noexcept {
        *done_ = true;
        source_ = nullptr;
    }

    template <typename F>
    auto pop(F&& f) {
        O& source = take();
        auto res = f(source);
        *done_ = true;
        return res;
    }

    template <typename F>
    void push(F&& f) {
        O& source = take();
        f(source);
        *done_ = true;
    }

    O* source_;
    bool* done_;
};

// =====================================================================
// Struct: an opened struct
// =====================================================================

/// @brief Handle for an opened struct. Fields are pushed by name in
/// declaration order; each returned Value must be consumed before the
/// next field is requested.
template <typename O>
class Struct {
public:
    Struct(O& source, bool& done) noexcept : source_(&source), done_(&done) {}

    Struct(Struct&& other) noexcept
        : source_(other.source_), done_(other.done_), ready_(other.ready_) {
        other.source_ = nullptr;
    }

    Struct(const Struct&) = delete;
    Struct& operator=(const Struct&) = delete;
    Struct& operator=(Struct&&) = delete;

    /// @brief Runs @p f on a struct already opened on @p source and asserts
    /// that @p f closed it.
    template <typename F>
    static decltype(auto) with(O& source, F&& f) {
        bool done = false;
        if constexpr (std::is_void_v<std::invoke_result_t<F, Struct>>) {
            std::forward<F>(f)(Struct(source, done));
            SERDEX_ASSERT(done, detail::kInvalidStateError);
        } else {
            auto res = std::forward<F>(f)(Struct(source, done));
            SERDEX_ASSERT(done, detail::kInvalidStateError);
            return res;
        }
    }

    [[nodiscard]] O& raw() const noexcept {
        SERDEX_ASSERT(source_ != nullptr, detail::kInvalidStateError);
        return *source_;
    }

    /// @brief Pushes field @p name. The name must outlive the outliner.
    Value<O> field(std::string_view name) {
        SERDEX_ASSERT(source_ && ready_, detail::kInvalidStateError);
        ready_ = false;
        source_->push_field(name);
        return Value<O>(*source_, ready_);
    }

    void close() && {
        SERDEX_ASSERT(source_ && ready_, detail::kInvalidStateError);
        source_->close_struct();
        *done_ = true;
        source_ = nullptr;
    }

    /// @brief Reads fields of a flattened T from this struct.
    template <typename T>
    T inline_get() {
        SERDEX_ASSERT(source_ && ready_, detail::kInvalidStateError);
        T out{};
        deserialize_content(*this, out);
        return out;
    }

    /// @brief Writes the fields of @p value into this struct.
    template <typename T>
    void inline_put(const T& value) {
        SERDEX_ASSERT(source_ && ready_, detail::kInvalidStateError);
        serialize_content(*this, value);
    }

private:
    O* source_;
    bool* done_;
    bool ready_ = true;
};

// =====================================================================
// Tuple: an opened tuple
// =====================================================================

/// @brief Handle for an opened tuple. Elements are pushed positionally.
template <typename O>
class Tuple {
public:
    Tuple(O& source, bool& done) noexcept : source_(&source), done_(&done) {}

    Tuple(Tuple&& other) noexcept
        : source_(other.source_), done_(other.done_), ready_(other.ready_) {
        other.source_ = nullptr;
    }

    Tuple(const Tuple&) = delete;
    Tuple& operator=(const Tuple&) = delete;
    Tuple& operator=(Tuple&&) = delete;

    template <typename F>
    static decltype(auto) with(O& source, F&& f) {
        bool done = false;
        if constexpr (std::is_void_v<std::invoke_result_t<F, Tuple>>) {
            std::forward<F>(f)(Tuple(source, done));
            SERDEX_ASSERT(done, detail::kInvalidStateError);
        } else {
            auto res = std::forward<F>(f)(Tuple(source, done));
            SERDEX_ASSERT(done, detail::kInvalidStateError);
            return res;
        }
    }

    [[nodiscard]] O& raw() const noexcept {
        SERDEX_ASSERT(source_ != nullptr, detail::kInvalidStateError);
        return *source_;
    }

    Value<O> element() {
        SERDEX_ASSERT(source_ && ready_, detail::kInvalidStateError);
        ready_ = false;
        source_->push_element();
        return Value<O>(*source_, ready_);
    }

    void close() && {
        SERDEX_ASSERT(source_ && ready_, detail::kInvalidStateError);
        source_->close_tuple();
        *done_ = true;
        source_ = nullptr;
    }

private:
    O* source_;
    bool* done_;
    bool ready_ = true;
};

// =====================================================================
// List: an opened list
// =====================================================================

/// @brief Handle for an opened list. Serializers push() exactly the
/// announced number of items; deserializers call next() until it
/// returns nullopt, which also closes the list.
template <typename O>
class List {
public:
    List(O& source, bool& done, std::optional<size_t> rem_len) noexcept
        : source_(&source), done_(&done), rem_len_(rem_len) {}

    List(List&& other) noexcept
        : source_(other.source_), done_(other.done_), ready_(other.ready_),
          rem_len_(other.rem_len_) {
        other.source_ = nullptr;
    }

    List(const List&) = delete;
    List& operator=(const List&) = delete;
    List& operator=(List&&) = delete;

    [[nodiscard]] O& raw() const noexcept {
        SERDEX_ASSERT(source_ != nullptr, detail::kInvalidStateError);
        return *source_;
    }

    /// @brief Items remaining, if the length is known.
    [[nodiscard]] std::optional<size_t> rem_len() const noexcept { return rem_len_; }

    /// @brief Asserts that another item exists and returns its value.
    Value<O> push() {
        SERDEX_ASSERT(!rem_len_ || *rem_len_ > 0, detail::kListOverflowError);
        SERDEX_ASSERT(source_ && ready_, detail::kInvalidStateError);
        ready_ = false;
        source_->push_item();
        if (rem_len_) --*rem_len_;
        return Value<O>(*source_, ready_);
    }

    /// @brief Next item, or nullopt once the list is exhausted (the list is
    /// then closed and the handle may be dropped).
    std::optional<Value<O>> next() {
        SERDEX_ASSERT(source_ && ready_, detail::kInvalidStateError);
        ready_ = false;
        if (source_->next_item()) {
            if (rem_len_ && *rem_len_ > 0) --*rem_len_;
            return Value<O>(*source_, ready_);
        }
        *done_ = true;
        source_ = nullptr;
        return std::nullopt;
    }

    /// @brief Asserts no items remain and pops the list.
    void close() && {
        SERDEX_ASSERT(source_ && ready_, detail::kInvalidStateError);
        SERDEX_ASSERT(!rem_len_ || *rem_len_ == 0, detail::kListUnderflowError);
        source_->close_list();
        *done_ = true;
        source_ = nullptr;
    }

private:
    O* source_;
    bool* done_;
    bool ready_ = true;
    std::optional<size_t> rem_len_;
};

} // namespace serdex
