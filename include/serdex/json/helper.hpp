#pragma once

/// @file helper.hpp
/// @author Aleksandr Loshkarev
/// @brief JSON-specific checked handles: objects, entries and
/// heterogeneous collections.
///
/// Usage (reading an object with unknown keys):
/// @code
///   auto obj = serdex::json::into_object(std::move(value));
///   while (auto entry = obj.next_entry()) {
///       std::string key = entry->key();
///       int32_t v = std::move(*entry).value().get_i32();
///   }
///   // obj is closed once next_entry() returns nullopt
/// @endcode

#include "../config.hpp"
#include "../value.hpp"
#include "outliner.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace serdex::json {

template <typename O> class Object;
template <typename D> class Entry;
template <typename D> class Collection;

// =====================================================================
// Value helpers
// =====================================================================

/// @brief Asserts that @p value is null and pops it.
template <typename O>
void into_null(Value<O> value) {
    auto [source, done] = std::move(value).into_raw();
    SERDEX_ASSERT(source != nullptr, serdex::detail::kInvalidStateError);
    source->pop_null();
    *done = true;
}

/// @brief Opens @p value as an object.
template <typename O>
Object<O> into_object(Value<O> value) {
    auto [source, done] = std::move(value).into_raw();
    SERDEX_ASSERT(source != nullptr, serdex::detail::kInvalidStateError);
    source->open_object();
    return Object<O>(*source, *done);
}

/// @brief JSON type of the unread @p value.
template <typename D>
ValueType value_type(const Value<D>& value) {
    return value.raw().peek_value_type();
}

/// @brief Pops @p value without decoding it.
template <typename D>
void skip(Value<D> value) {
    auto [source, done] = std::move(value).into_raw();
    SERDEX_ASSERT(source != nullptr, serdex::detail::kInvalidStateError);
    source->skip_value();
    *done = true;
}

/// @brief Opens @p value as an object or an array, whichever it is.
template <typename D>
Collection<D> into_collection(Value<D> value) {
    auto [source, done] = std::move(value).into_raw();
    SERDEX_ASSERT(source != nullptr, serdex::detail::kInvalidStateError);
    if (source->peek_value_type() == ValueType::Object) {
        source->open_object();
        return Collection<D>(Object<D>(*source, *done));
    }
    std::optional<size_t> len = source->open_list();
    return Collection<D>(List<D>(*source, *done, len));
}

/// @brief Opens @p value as a list whose length is not announced.
template <typename S>
List<S> into_list_streaming(Value<S> value) {
    auto [source, done] = std::move(value).into_raw();
    SERDEX_ASSERT(source != nullptr, serdex::detail::kInvalidStateError);
    source->open_list_streaming();
    return List<S>(*source, *done, std::nullopt);
}

// =====================================================================
// Object
// =====================================================================

/// @brief Handle for an opened object on a JsonOutliner.
template <typename O>
class Object {
public:
    Object(O& source, bool& done) noexcept : source_(&source), done_(&done) {}

    Object(Object&& other) noexcept
        : source_(other.source_), done_(other.done_), ready_(other.ready_) {
        other.source_ = nullptr;
    }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;
    Object& operator=(Object&&) = delete;

    [[nodiscard]] O& raw() const noexcept {
        SERDEX_ASSERT(source_ != nullptr, serdex::detail::kInvalidStateError);
        return *source_;
    }

    /// @brief The value of entry @p key. A deserializer requires the entry
    /// to exist; a serializer writes it.
    Value<O> entry(std::string_view key) {
        SERDEX_ASSERT(source_ && ready_, serdex::detail::kInvalidStateError);
        ready_ = false;
        source_->push_entry(key);
        return Value<O>(*source_, ready_);
    }

    /// @brief Asserts that no entries remain and pops the object.
    void close() && {
        SERDEX_ASSERT(source_ && ready_, serdex::detail::kInvalidStateError);
        source_->close_object();
        *done_ = true;
        source_ = nullptr;
    }

    /// @brief The value of entry @p key, or nullopt if the object has none.
    std::optional<Value<O>> try_entry(std::string_view key) {
        SERDEX_ASSERT(source_ && ready_, serdex::detail::kInvalidStateError);
        if (source_->try_push_entry(key)) {
            ready_ = false;
            return Value<O>(*source_, ready_);
        }
        return std::nullopt;
    }

    /// @brief The next unread entry, or nullopt once there are none left.
    /// The object is then closed and must not be used again.
    std::optional<Entry<O>> next_entry() {
        SERDEX_ASSERT(source_ && ready_, serdex::detail::kInvalidStateError);
        ready_ = false;
        if (source_->next_entry()) {
            return Entry<O>(*source_, ready_);
        }
        *done_ = true;
        source_ = nullptr;
        return std::nullopt;
    }

    /// @brief Reads the fields of a flattened T from this object.
    template <typename T>
    T inline_get() {
        SERDEX_ASSERT(source_ && ready_, serdex::detail::kInvalidStateError);
        bool done = false;
        Struct<O> st(*source_, done);
        T out{};
        deserialize_content(st, out);
        return out;
    }

    /// @brief Writes the fields of @p value into this object.
    template <typename T>
    void inline_put(const T& value) {
        SERDEX_ASSERT(source_ && ready_, serdex::detail::kInvalidStateError);
        bool done = false;
        Struct<O> st(*source_, done);
        serialize_content(st, value);
    }

private:
    O* source_;
    bool* done_;
    bool ready_ = true;
};

// =====================================================================
// Entry
// =====================================================================

/// @brief An object entry during iteration: an opened key string with its
/// value beneath it.
template <typename D>
class Entry {
public:
    Entry(D& source, bool& done) noexcept : source_(&source), done_(&done) {}

    Entry(Entry&& other) noexcept
        : source_(other.source_), done_(other.done_), key_read_(other.key_read_) {
        other.source_ = nullptr;
    }

    Entry(const Entry&) = delete;
    Entry& operator=(const Entry&) = delete;
    Entry& operator=(Entry&&) = delete;

    /// @brief The key. May be read at most once.
    std::string key() {
        SERDEX_ASSERT(source_ && !key_read_, serdex::detail::kInvalidStateError);
        key_read_ = true;
        return source_->flush_str();
    }

    /// @brief The value; skips the key if it was not read.
    Value<D> value() && {
        SERDEX_ASSERT(source_ != nullptr, serdex::detail::kInvalidStateError);
        D& source = *source_;
        source_ = nullptr;
        if (!key_read_) source.skip_str();
        return Value<D>(source, *done_);
    }

private:
    D* source_;
    bool* done_;
    bool key_read_ = false;
};

// =====================================================================
// Collection
// =====================================================================

/// @brief An opened object or array, iterated uniformly.
template <typename D>
class Collection {
public:
    explicit Collection(Object<D> object) : inner_(std::in_place_index<0>, std::move(object)) {}
    explicit Collection(List<D> list) : inner_(std::in_place_index<1>, std::move(list)) {}

    [[nodiscard]] bool is_object() const noexcept { return inner_.index() == 0; }

    /// @brief The next entry value (objects) or item (arrays), or nullopt
    /// once there are none left; the collection is then closed.
    std::optional<Value<D>> next() {
        if (auto* object = std::get_if<0>(&inner_)) {
            auto entry = object->next_entry();
            if (!entry) return std::nullopt;
            return std::move(*entry).value();
        }
        return std::get<1>(inner_).next();
    }

private:
    std::variant<Object<D>, List<D>> inner_;
};

} // namespace serdex::json
