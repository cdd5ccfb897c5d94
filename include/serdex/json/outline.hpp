#pragma once

/// @file outline.hpp
/// @author Aleksandr Loshkarev
/// @brief Bookkeeping for JSON text that has been read but not yet
/// delivered.
///
/// When a field is requested that has not been reached yet, the entries in
/// front of it are read into the lookback arena:
///
///   - lookback_items: one LookbackItem per buffered value, in document
///     order. Siblings are chained through next_sibling_index; a chain is
///     built in reverse while its container is being read and corrected
///     once the container closes.
///   - lookback_data:  key bytes followed by payload bytes per item
///     (string UTF-8, number digits as nibbles). bool, null and
///     containers carry no payload.
///   - lookback_keys:  key index for the entries of objects currently
///     open on the stack, hashed by (depth, key).
///
/// Containers opened while streaming record the arena size when they are
/// opened and truncate back to it when they are popped, so a fully
/// consumed document leaves the arena empty.

#include "../config.hpp"
#include "../detail/hash.hpp"
#include "../error.hpp"
#include "outliner.hpp"

#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace serdex::json::detail {

inline constexpr size_t kNoIndex = static_cast<size_t>(-1);

inline constexpr const char* kValueAlreadyRead = "value already read";
inline constexpr const char* kNotValue = "top of the deserialization stack is not a value";
inline constexpr const char* kNotCollection =
    "top of the deserialization stack is not an opened collection";
inline constexpr const char* kNotObject = "top of the deserialization stack is not an opened object";
inline constexpr const char* kNotArray = "top of the deserialization stack is not an opened array";
inline constexpr const char* kNotString = "top of the deserialization stack is not an opened string";

/// @brief A buffered value. @c flag is the sign of a Number, whether an
/// Object/Array is non-empty, or the value of a Bool.
struct LookbackValue {
    enum class Kind : uint8_t { String, Number, Object, Array, Bool, Null };

    Kind kind;
    bool flag = false;
    int16_t exp = 0;

    [[nodiscard]] ValueType value_type() const noexcept {
        switch (kind) {
            case Kind::String: return ValueType::String;
            case Kind::Number: return ValueType::Number;
            case Kind::Object: return ValueType::Object;
            case Kind::Array:  return ValueType::Array;
            case Kind::Bool:   return ValueType::Bool;
            case Kind::Null:   return ValueType::Null;
        }
        return ValueType::Null;
    }
};

/// @brief An object entry or array item that was read ahead.
struct LookbackItem {
    SourceLocation pos;                     ///< First character of the value
    size_t data_index;                      ///< Start of key + payload in lookback_data
    size_t next_sibling_index;              ///< kNoIndex if known to be last
    uint32_t key_len_active;                ///< (key length << 1) | in-lookback_keys bit
    std::optional<LookbackValue> value;     ///< nullopt once delivered

    [[nodiscard]] uint32_t key_len() const noexcept { return key_len_active >> 1; }

    [[nodiscard]] std::string_view key(std::string_view data) const noexcept {
        return data.substr(data_index, key_len());
    }
};

/// @brief An opened object or array.
struct StackItem {
    SourceLocation pos;                     ///< The opening brace
    size_t first_child_index;               ///< First candidate child in lookback_items
    CollectionType collection_type;
    bool streaming;                         ///< Opened from the reader (not the arena)
    size_t item_mark;                       ///< Arena sizes when opened (streaming only)
    size_t data_mark;
};

struct LookbackKey {
    uint32_t depth;
    size_t index;
};

/// @brief The payload of a delivered lookback item.
struct TakenValue {
    SourceLocation pos;
    LookbackValue value;
    size_t data_begin;
    size_t data_end;
};

class Outline {
public:
    explicit Outline(std::pmr::memory_resource* mr)
        : stack_items(mr), lookback_items(mr), lookback_keys(mr), lookback_data(mr) {}

    /// @brief Depth of the top container, 0 if the stack is empty.
    [[nodiscard]] uint32_t top_depth() const noexcept {
        return static_cast<uint32_t>(stack_items.size());
    }

    [[nodiscard]] std::string_view data() const noexcept {
        return std::string_view(lookback_data.data(), lookback_data.size());
    }

    /// @brief Takes the value of item @p index; asserts it was not taken yet.
    TakenValue take_value(size_t index) {
        LookbackItem& item = lookback_items[index];
        SERDEX_ASSERT(item.value.has_value(), kValueAlreadyRead);
        LookbackValue value = *item.value;
        item.value.reset();
        size_t begin = item.data_index + item.key_len();
        size_t end = index + 1 < lookback_items.size()
                         ? lookback_items[index + 1].data_index
                         : lookback_data.size();
        return TakenValue{item.pos, value, begin, end};
    }

    /// @brief Appends an item linked (in reverse) to @p last_child_index,
    /// which is updated to the new item.
    void push_item(size_t& last_child_index, SourceLocation pos, size_t data_index,
                   uint32_t key_len_active, LookbackValue value) {
        size_t prev = last_child_index;
        last_child_index = lookback_items.size();
        lookback_items.push_back(LookbackItem{pos, data_index, prev, key_len_active, value});
    }

    void push_container(SourceLocation pos, size_t first_child_index,
                        CollectionType type, bool streaming) {
        stack_items.push_back(StackItem{pos, first_child_index, type, streaming,
                                        lookback_items.size(), lookback_data.size()});
    }

    /// @brief Pops the top container and returns the position of its opening brace.
    SourceLocation pop_container() {
        StackItem top = stack_items.back();
        stack_items.pop_back();
        if (top.streaming) {
            lookback_items.erase(lookback_items.begin() + static_cast<std::ptrdiff_t>(top.item_mark),
                                 lookback_items.end());
            lookback_data.erase(top.data_mark);
        }
        return top.pos;
    }

    // ─── Key index ────────────────────────────────────────────────────

    /// @brief Indexes the key of item @p index and sets its active bit.
    void insert_key(uint32_t depth, size_t index) {
        lookback_items[index].key_len_active |= 1u;
        uint64_t hash = serdex::detail::key_hash(depth, lookback_items[index].key(data()));
        lookback_keys.emplace(hash, LookbackKey{depth, index});
    }

    /// @brief Removes the entry for @p key in the object at @p depth, clears
    /// its active bit and returns its item index.
    std::optional<size_t> remove_key(uint32_t depth, std::string_view key) {
        uint64_t hash = serdex::detail::key_hash(depth, key);
        auto [it, end] = lookback_keys.equal_range(hash);
        for (; it != end; ++it) {
            if (it->second.depth != depth) continue;
            LookbackItem& item = lookback_items[it->second.index];
            if (item.key(data()) == key) {
                size_t index = it->second.index;
                item.key_len_active &= ~1u;
                lookback_keys.erase(it);
                return index;
            }
        }
        return std::nullopt;
    }

    /// @brief Removes the index entry of item @p index and clears its active bit.
    void remove_key_at(uint32_t depth, size_t index) {
        LookbackItem& item = lookback_items[index];
        uint64_t hash = serdex::detail::key_hash(depth, item.key(data()));
        auto [it, end] = lookback_keys.equal_range(hash);
        for (; it != end; ++it) {
            if (it->second.depth == depth && it->second.index == index) {
                lookback_keys.erase(it);
                item.key_len_active &= ~1u;
                return;
            }
        }
        SERDEX_ASSERT(false, "lookback key index is out of sync");
    }

    std::pmr::vector<StackItem> stack_items;
    std::pmr::vector<LookbackItem> lookback_items;
    std::pmr::unordered_multimap<uint64_t, LookbackKey> lookback_keys;
    std::pmr::string lookback_data;
};

/// @brief First child at or after @p first_child_index (following sibling
/// links) whose value is unread; advances @p first_child_index to it.
/// Returns kNoIndex if there is none.
inline size_t first_unread_child(const std::pmr::vector<LookbackItem>& items,
                                 size_t& first_child_index) noexcept {
    size_t child = first_child_index;
    while (child < items.size()) {
        if (items[child].value) {
            first_child_index = child;
            return child;
        }
        child = items[child].next_sibling_index;
    }
    return kNoIndex;
}

/// @brief Reverses a chain of siblings linked backwards from
/// @p last_child_index and clears their temporary entry bits.
/// @return Index of the first sibling.
inline size_t correct_items(std::pmr::vector<LookbackItem>& items, size_t last_child_index) noexcept {
    size_t index = last_child_index;
    size_t prev = items[index].next_sibling_index;
    items[index].next_sibling_index = kNoIndex;
    for (;;) {
        items[index].key_len_active &= ~1u;
        if (prev == kNoIndex) return index;
        size_t next_index = prev;
        prev = items[next_index].next_sibling_index;
        items[next_index].next_sibling_index = index;
        index = next_index;
    }
}

} // namespace serdex::json::detail
