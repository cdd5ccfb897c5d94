#pragma once

/// @file outliner.hpp
/// @author Aleksandr Loshkarev
/// @brief JSON extensions of the Outliner protocol.
///
/// JSON adds objects (string-keyed maps) to the generic stack machine:
///
///   - JsonOutliner:     open_object / push_entry / close_object
///   - JsonDeserializer: value type inspection, key lookup, entry
///                       iteration, virtual nulls and skipping
///   - JsonSerializer:   streaming lists and free-form entries
///
/// JsonDeserializer also supplies the standard JSON mapping of the generic
/// struct/list/tag operations: a struct is an object (or a positional
/// array), a tag is a name (or an index).

#include "../deserializer.hpp"
#include "../error.hpp"
#include "../name_map.hpp"
#include "../outliner.hpp"
#include "../serializer.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace serdex::json {

/// @brief JSON value kinds.
enum class ValueType : uint8_t {
    String,
    Number,
    Object,
    Array,
    Bool,
    Null,
};

/// @brief JSON collection kinds.
enum class CollectionType : uint8_t {
    Object,
    Array,
};

inline const char* to_string(ValueType t) noexcept {
    switch (t) {
        case ValueType::String: return "string";
        case ValueType::Number: return "number";
        case ValueType::Object: return "object";
        case ValueType::Array:  return "array";
        case ValueType::Bool:   return "bool";
        case ValueType::Null:   return "null";
    }
    return "unknown";
}

// =====================================================================
// JsonOutliner
// =====================================================================

class JsonOutliner : public virtual Outliner {
public:
    /// Top is a value: asserts it is an object and opens it.
    virtual void open_object() = 0;

    /// Top is an opened object: pushes the value for @p key. A serializer
    /// writes the entry; a deserializer requires it to be present.
    virtual void push_entry(std::string_view key) = 0;

    /// Top is an opened object: asserts no entries remain, closes and pops it.
    virtual void close_object() = 0;
};

// =====================================================================
// JsonDeserializer
// =====================================================================

class JsonDeserializer : public JsonOutliner, public Deserializer {
public:
    /// Top is a value: its JSON type.
    [[nodiscard]] virtual ValueType peek_value_type() const = 0;

    /// Top is an opened collection: its kind.
    [[nodiscard]] virtual CollectionType peek_collection_type() const = 0;

    /// Top is an opened collection: pushes a null that does not appear in
    /// the input. Reading it as anything but null reports @p key missing.
    virtual void push_null(std::optional<std::string_view> key) = 0;

    /// Top is an opened object: pushes the value for @p key and returns
    /// true if the object has that key, otherwise returns false.
    virtual bool try_push_entry(std::string_view key) = 0;

    /// Top is an opened object: pushes the value and then the opened key
    /// of the next unread entry and returns true, or pops the object and
    /// returns false.
    virtual bool next_entry() = 0;

    /// Tagged to the most recently popped item (the object).
    [[nodiscard]] virtual DeserializeError error_missing_entry(std::string key) const = 0;

    /// Tagged to the object at the top of the stack.
    [[nodiscard]] virtual DeserializeError error_extra_entry(std::string key) const = 0;

    /// Top is a value: pops it without decoding it.
    virtual void skip_value() {
        switch (peek_value_type()) {
            case ValueType::String:
                open_str();
                skip_str();
                break;
            case ValueType::Number:
                (void)get_f64();
                break;
            case ValueType::Object:
                open_object();
                skip_object();
                break;
            case ValueType::Array:
                (void)open_list();
                while (next_item()) skip_value();
                break;
            case ValueType::Bool:
                (void)get_bool();
                break;
            case ValueType::Null:
                pop_null();
                break;
        }
    }

    /// Top is an opened object: discards the remaining entries and pops it.
    virtual void skip_object() {
        while (next_entry()) {
            skip_str();
            skip_value();
        }
    }

    // ─── Standard JSON mapping of the generic protocol ────────────────

    size_t get_tag(size_t max_index, NameMap<size_t> names) override {
        if (peek_value_type() == ValueType::String) {
            return get_name(names);
        }
        uint64_t index = get_u64();
        if (index > std::numeric_limits<size_t>::max()) {
            throw error_invalid_index(std::numeric_limits<size_t>::max());
        }
        if (static_cast<size_t>(index) > max_index) {
            throw error_invalid_index(max_index);
        }
        return static_cast<size_t>(index);
    }

    void open_struct(std::string_view /*type_name*/) override {
        switch (peek_value_type()) {
            case ValueType::Object:
                open_object();
                break;
            case ValueType::Array:
                (void)open_list();
                break;
            default:
                // Fails with missing_key on a virtual null, otherwise
                // with expected_object.
                open_object();
                break;
        }
    }

    void push_field(std::string_view name) override {
        if (peek_collection_type() == CollectionType::Object) {
            if (!try_push_entry(name)) push_null(name);
        } else if (!next_item()) {
            throw error_missing_item();
        }
    }

    void close_struct() override {
        if (peek_collection_type() == CollectionType::Object) {
            skip_object();
        } else if (next_item()) {
            skip_value();
            throw error_extra_item();
        }
    }

    void open_tuple(std::string_view /*type_name*/) override {
        (void)open_list();
    }

    void push_element() override { push_item(); }

    void close_tuple() override { close_list(); }

    void push_item() override {
        if (!next_item()) throw error_missing_item();
    }

    void close_list() override {
        if (next_item()) {
            skip_value();
            throw error_extra_item();
        }
    }

    void push_entry(std::string_view key) override {
        if (!try_push_entry(key)) {
            skip_object();
            throw error_missing_entry(std::string(key));
        }
    }

    void close_object() override {
        if (next_entry()) {
            std::string key = flush_str();
            skip_value();
            throw error_extra_entry(std::move(key));
        }
    }
};

// =====================================================================
// JsonSerializer
// =====================================================================

class JsonSerializer : public JsonOutliner, public Serializer {
public:
    /// Top is a value: opens it as a list whose length is not announced.
    virtual void open_list_streaming() = 0;

    /// Top is an opened object: pushes the value and then the opened key
    /// string of a new entry.
    virtual void add_entry() = 0;

    void put_tag(size_t /*max_index*/, size_t index,
                 std::optional<std::string_view> name) override {
        if (name) {
            put_str(*name);
        } else {
            put_u64(static_cast<uint64_t>(index));
        }
    }
};

} // namespace serdex::json
