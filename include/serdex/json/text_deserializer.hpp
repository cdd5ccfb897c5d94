#pragma once

/// @file text_deserializer.hpp
/// @author Aleksandr Loshkarev
/// @brief JSON deserializer over a character reader, with out-of-order
/// field access.
///
/// The deserializer streams the input in a single pass. When a struct
/// asks for a field whose entry has not been reached, the entries in
/// front of it are buffered into the lookback arena (outline.hpp) and
/// served later from there, so field order in the document does not
/// need to match declaration order:
///
/// @code
///   serdex::StringReader reader(R"({"b": 2, "a": 1})");
///   serdex::json::TextDeserializer<serdex::StringReader> d(reader);
///   auto [a, b] = serdex::Value<decltype(d)>::with(d, [](auto v) {
///       auto s = std::move(v).into_struct();
///       int32_t a = s.field("a").get_i32();   // buffers "b"
///       int32_t b = s.field("b").get_i32();   // served from the arena
///       std::move(s).close();
///       return std::pair(a, b);
///   });
///   d.close();
/// @endcode
///
/// State machine (top of the outliner stack):
///   - StreamingValue:  a value; the reader is at its first character
///   - LookbackValue:   a value buffered in lookback_items[index]
///   - NullValue:       a virtual null standing in for a missing entry
///   - Collection:      an opened object/array, or the empty stack
///   - StreamingString: an opened string being read from the reader
///   - LookbackString:  an opened string in lookback_data[head, end)
///
/// streaming_depth is the depth of the innermost container still being
/// read from the reader (0 if none). Containers deeper than it were
/// opened from the arena.

#include "../config.hpp"
#include "../detail/utf8.hpp"
#include "../error.hpp"
#include "../name_map.hpp"
#include "../text_reader.hpp"
#include "number.hpp"
#include "outline.hpp"
#include "outliner.hpp"
#include "scanner.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace serdex::json {

/// @brief Input options for TextDeserializer.
struct TextDeserializerConfig {
    /// Accept `//` and `/* */` comments wherever whitespace is allowed.
    bool allow_comments = false;

    /// Maximum nesting depth of objects and arrays.
    uint32_t max_depth = SERDEX_MAX_DEPTH;

    /// Strict RFC 8259 input.
    static TextDeserializerConfig strict() noexcept { return {}; }

    /// The most permissive input accepted.
    static TextDeserializerConfig permissive() noexcept {
        TextDeserializerConfig c;
        c.allow_comments = true;
        return c;
    }
};

namespace detail {

struct DeserializerState {
    enum class Kind : uint8_t {
        StreamingValue,
        LookbackValue,
        NullValue,
        Collection,
        StreamingString,
        LookbackString,
    };

    Kind kind = Kind::StreamingValue;
    bool at_start = false;                   // Collection, NullValue
    bool is_key = false;                     // StreamingString
    uint32_t streaming_depth = 0;            // all but the Streaming* kinds
    size_t index = kNoIndex;                 // LookbackValue
    size_t head_index = 0;                   // LookbackString
    size_t end_index = 0;                    // LookbackString
    size_t value_index = kNoIndex;           // LookbackString of an entry key
    std::optional<std::string_view> key;     // NullValue

    static DeserializerState streaming_value() noexcept { return {}; }

    static DeserializerState lookback_value(size_t index, uint32_t sd) noexcept {
        DeserializerState s;
        s.kind = Kind::LookbackValue;
        s.index = index;
        s.streaming_depth = sd;
        return s;
    }

    static DeserializerState null_value(std::optional<std::string_view> key, bool at_start,
                                        uint32_t sd) noexcept {
        DeserializerState s;
        s.kind = Kind::NullValue;
        s.key = key;
        s.at_start = at_start;
        s.streaming_depth = sd;
        return s;
    }

    static DeserializerState collection(bool at_start, uint32_t sd) noexcept {
        DeserializerState s;
        s.kind = Kind::Collection;
        s.at_start = at_start;
        s.streaming_depth = sd;
        return s;
    }

    static DeserializerState streaming_string(bool is_key) noexcept {
        DeserializerState s;
        s.kind = Kind::StreamingString;
        s.is_key = is_key;
        return s;
    }

    static DeserializerState lookback_string(size_t head, size_t end, size_t value_index,
                                             uint32_t sd) noexcept {
        DeserializerState s;
        s.kind = Kind::LookbackString;
        s.head_index = head;
        s.end_index = end;
        s.value_index = value_index;
        s.streaming_depth = sd;
        return s;
    }
};

} // namespace detail

// =====================================================================
// TextDeserializer
// =====================================================================

/// @brief JsonDeserializer reading JSON text from @p Reader (see
/// text_reader.hpp). The stack initially holds a single value.
template <typename Reader>
class TextDeserializer final : public JsonDeserializer {
    using State = detail::DeserializerState;
    using Kind = detail::DeserializerState::Kind;
    using LookbackValue = detail::LookbackValue;

public:
    explicit TextDeserializer(Reader reader, TextDeserializerConfig config = {},
                              std::pmr::memory_resource* mr = std::pmr::get_default_resource())
        : config_(config)
        , scanner_(std::move(reader), config.allow_comments)
        , outline_(mr) {
        scanner_.skip_whitespace();
        error_pos_ = scanner_.position();
    }

    TextDeserializer(const TextDeserializer&) = delete;
    TextDeserializer& operator=(const TextDeserializer&) = delete;

    /// @brief Verifies that the root value was fully read and that only
    /// whitespace follows it.
    void close() {
        SERDEX_ASSERT(!closed_, "deserializer is already closed");
        SERDEX_ASSERT(state_.kind == Kind::Collection && !state_.at_start &&
                          state_.streaming_depth == 0 && outline_.stack_items.empty(),
                      "deserializer closed before the value was fully read");
        closed_ = true;
        scanner_.skip_whitespace();
        scanner_.read_eof();
    }

    /// @brief Number of values currently held in the lookback arena.
    [[nodiscard]] size_t buffered_items() const noexcept {
        return outline_.lookback_items.size();
    }

    [[nodiscard]] const TextDeserializerConfig& config() const noexcept { return config_; }

    // ─── Outliner ─────────────────────────────────────────────────────

    [[nodiscard]] bool supports_null() const override { return true; }

    void pop_null() override {
        switch (state_.kind) {
            case Kind::StreamingValue:
                state_ = State::collection(false, outline_.top_depth());
                error_pos_ = scanner_.position();
                scanner_.read_null();
                return;
            case Kind::LookbackValue: {
                auto taken = outline_.take_value(state_.index);
                if (taken.value.kind != LookbackValue::Kind::Null) {
                    throw DeserializeError(errc::expected_null, taken.pos);
                }
                state_ = State::collection(false, state_.streaming_depth);
                error_pos_ = taken.pos;
                return;
            }
            case Kind::NullValue:
                state_ = State::collection(state_.at_start, state_.streaming_depth);
                return;
            default:
                violation(detail::kNotValue);
        }
    }

    void open_str() override {
        switch (state_.kind) {
            case Kind::StreamingValue: {
                SourceLocation pos = scanner_.position();
                char32_t ch = scanner_.next();
                if (ch != U'"') {
                    throw DeserializeError(ch == kEndOfInput ? errc::unexpected_end_of_input
                                                             : errc::expected_string,
                                           pos);
                }
                error_pos_ = pos;
                state_ = State::streaming_string(false);
                return;
            }
            case Kind::LookbackValue: {
                auto taken = outline_.take_value(state_.index);
                if (taken.value.kind != LookbackValue::Kind::String) {
                    throw DeserializeError(errc::expected_string, taken.pos);
                }
                error_pos_ = taken.pos;
                state_ = State::lookback_string(taken.data_begin, taken.data_end, detail::kNoIndex,
                                                state_.streaming_depth);
                return;
            }
            case Kind::NullValue:
                throw error_unexpected_virtual_null(state_.key);
            default:
                violation(detail::kNotValue);
        }
    }

    /// Discards any unread characters of the string.
    void close_str() override {
        while (next_char()) {
        }
    }

    // ─── JsonOutliner ─────────────────────────────────────────────────

    void open_object() override {
        switch (state_.kind) {
            case Kind::StreamingValue: {
                SourceLocation pos = scanner_.position();
                char32_t ch = scanner_.next();
                if (ch != U'{') {
                    throw DeserializeError(ch == kEndOfInput ? errc::unexpected_end_of_input
                                                             : errc::expected_object,
                                           pos);
                }
                check_depth(pos);
                outline_.push_container(pos, outline_.lookback_items.size(),
                                        CollectionType::Object, true);
                state_ = State::collection(true, outline_.top_depth());
                return;
            }
            case Kind::LookbackValue: {
                size_t index = state_.index;
                auto taken = outline_.take_value(index);
                if (taken.value.kind != LookbackValue::Kind::Object) {
                    throw DeserializeError(errc::expected_object, taken.pos);
                }
                check_depth(taken.pos);
                state_ = State::collection(true, state_.streaming_depth);
                if (taken.value.flag) {
                    outline_.push_container(taken.pos, index + 1, CollectionType::Object, false);
                    uint32_t depth = outline_.top_depth();
                    size_t child = index + 1;
                    while (child < outline_.lookback_items.size()) {
                        outline_.insert_key(depth, child);
                        child = outline_.lookback_items[child].next_sibling_index;
                    }
                } else {
                    outline_.push_container(taken.pos, detail::kNoIndex,
                                            CollectionType::Object, false);
                }
                return;
            }
            case Kind::NullValue:
                throw error_unexpected_virtual_null(state_.key);
            default:
                violation(detail::kNotValue);
        }
    }

    // ─── Deserializer ─────────────────────────────────────────────────

    bool get_bool() override {
        switch (state_.kind) {
            case Kind::StreamingValue:
                state_ = State::collection(false, outline_.top_depth());
                error_pos_ = scanner_.position();
                return scanner_.read_bool();
            case Kind::LookbackValue: {
                auto taken = outline_.take_value(state_.index);
                if (taken.value.kind != LookbackValue::Kind::Bool) {
                    throw DeserializeError(errc::expected_bool, taken.pos);
                }
                state_ = State::collection(false, state_.streaming_depth);
                error_pos_ = taken.pos;
                return taken.value.flag;
            }
            case Kind::NullValue:
                throw error_unexpected_virtual_null(state_.key);
            default:
                violation(detail::kNotValue);
        }
    }

    int8_t   get_i8() override  { return read_number<int8_t>(); }
    int16_t  get_i16() override { return read_number<int16_t>(); }
    int32_t  get_i32() override { return read_number<int32_t>(); }
    int64_t  get_i64() override { return read_number<int64_t>(); }
    uint8_t  get_u8() override  { return read_number<uint8_t>(); }
    uint16_t get_u16() override { return read_number<uint16_t>(); }
    uint32_t get_u32() override { return read_number<uint32_t>(); }
    uint64_t get_u64() override { return read_number<uint64_t>(); }
    float    get_f32() override { return read_number<float>(); }
    double   get_f64() override { return read_number<double>(); }

    /// Reads a string of exactly one character.
    char32_t get_char() override {
        open_str();
        auto first = next_char();
        if (!first) throw make_error(errc::expected_char);
        if (next_char()) {
            skip_str();
            throw make_error(errc::expected_char);
        }
        return *first;
    }

    std::optional<char32_t> next_char() override {
        switch (state_.kind) {
            case Kind::StreamingString: {
                if (auto ch = scanner_.next_str_char()) return ch;
                if (state_.is_key) {
                    scanner_.skip_past_colon();
                    scanner_.skip_whitespace();
                    state_ = State::streaming_value();
                } else {
                    state_ = State::collection(false, outline_.top_depth());
                }
                return std::nullopt;
            }
            case Kind::LookbackString: {
                if (state_.head_index < state_.end_index) {
                    std::string_view data = outline_.data();
                    const char* begin = data.data() + state_.head_index;
                    const char* p = begin;
                    uint32_t cp = serdex::detail::utf8::decode(p, data.data() + state_.end_index);
                    SERDEX_ASSERT(cp != serdex::detail::utf8::kInvalid,
                                  "lookback string is not valid UTF-8");
                    state_.head_index += static_cast<size_t>(p - begin);
                    return static_cast<char32_t>(cp);
                }
                if (state_.value_index != detail::kNoIndex) {
                    state_ = State::lookback_value(state_.value_index, state_.streaming_depth);
                } else {
                    state_ = State::collection(false, state_.streaming_depth);
                }
                return std::nullopt;
            }
            default:
                violation(detail::kNotString);
        }
    }

    bool check_null() override {
        if (peek_value_type() == ValueType::Null) {
            pop_null();
            return true;
        }
        return false;
    }

    std::optional<size_t> open_list() override {
        switch (state_.kind) {
            case Kind::StreamingValue: {
                SourceLocation pos = scanner_.position();
                char32_t ch = scanner_.next();
                if (ch != U'[') {
                    throw DeserializeError(ch == kEndOfInput ? errc::unexpected_end_of_input
                                                             : errc::expected_array,
                                           pos);
                }
                check_depth(pos);
                outline_.push_container(pos, outline_.lookback_items.size(),
                                        CollectionType::Array, true);
                state_ = State::collection(true, outline_.top_depth());
                return std::nullopt;
            }
            case Kind::LookbackValue: {
                size_t index = state_.index;
                auto taken = outline_.take_value(index);
                if (taken.value.kind != LookbackValue::Kind::Array) {
                    throw DeserializeError(errc::expected_array, taken.pos);
                }
                check_depth(taken.pos);
                outline_.push_container(taken.pos, taken.value.flag ? index + 1 : detail::kNoIndex,
                                        CollectionType::Array, false);
                state_ = State::collection(true, state_.streaming_depth);
                return std::nullopt;
            }
            case Kind::NullValue:
                throw error_unexpected_virtual_null(state_.key);
            default:
                violation(detail::kNotValue);
        }
    }

    bool next_item() override {
        SERDEX_ASSERT(state_.kind == Kind::Collection && !outline_.stack_items.empty(),
                      detail::kNotCollection);
        const uint32_t depth = outline_.top_depth();
        detail::StackItem& info = outline_.stack_items.back();
        SERDEX_ASSERT(info.collection_type == CollectionType::Array, detail::kNotArray);

        if (state_.streaming_depth == depth) {
            bool has_item;
            if (state_.at_start) {
                has_item = scanner_.skip_to_first_item();
            } else if (scanner_.skip_to_next_item()) {
                scanner_.skip_whitespace();
                has_item = true;
            } else {
                has_item = false;
            }
            if (has_item) {
                state_ = State::streaming_value();
                return true;
            }
            error_pos_ = outline_.pop_container();
            state_ = State::collection(false, depth - 1);
            return false;
        }

        size_t index = detail::first_unread_child(outline_.lookback_items, info.first_child_index);
        if (index != detail::kNoIndex) {
            state_ = State::lookback_value(index, state_.streaming_depth);
            return true;
        }
        error_pos_ = outline_.pop_container();
        state_.at_start = false;
        return false;
    }

    [[nodiscard]] DeserializeError make_error(errc code, std::string detail = {}) const override {
        return DeserializeError(code, error_pos_, std::move(detail));
    }

    [[nodiscard]] DeserializeError error_missing_item() const override {
        return make_error(errc::missing_items);
    }

    [[nodiscard]] DeserializeError error_extra_item() const override {
        SERDEX_ASSERT(!outline_.stack_items.empty(), detail::kNotCollection);
        const detail::StackItem& info = outline_.stack_items.back();
        SERDEX_ASSERT(info.collection_type == CollectionType::Array, detail::kNotArray);
        return DeserializeError(errc::excess_items, info.pos);
    }

    // ─── JsonDeserializer ─────────────────────────────────────────────

    [[nodiscard]] ValueType peek_value_type() const override {
        switch (state_.kind) {
            case Kind::StreamingValue:
                switch (scanner_.peek()) {
                    case U'"': return ValueType::String;
                    case U'-': case U'0': case U'1': case U'2': case U'3': case U'4':
                    case U'5': case U'6': case U'7': case U'8': case U'9':
                        return ValueType::Number;
                    case U'{': return ValueType::Object;
                    case U'[': return ValueType::Array;
                    case U't': case U'f': return ValueType::Bool;
                    default: return ValueType::Null;
                }
            case Kind::LookbackValue: {
                const auto& item = outline_.lookback_items[state_.index];
                SERDEX_ASSERT(item.value.has_value(), detail::kValueAlreadyRead);
                return item.value->value_type();
            }
            case Kind::NullValue:
                return ValueType::Null;
            default:
                violation(detail::kNotValue);
        }
    }

    [[nodiscard]] CollectionType peek_collection_type() const override {
        SERDEX_ASSERT(!outline_.stack_items.empty(), detail::kNotCollection);
        return outline_.stack_items.back().collection_type;
    }

    void push_null(std::optional<std::string_view> key) override {
        SERDEX_ASSERT(state_.kind == Kind::Collection, detail::kNotCollection);
        state_ = State::null_value(key, state_.at_start, state_.streaming_depth);
    }

    bool try_push_entry(std::string_view key) override {
        SERDEX_ASSERT(state_.kind == Kind::Collection && !outline_.stack_items.empty(),
                      detail::kNotCollection);
        const uint32_t depth = outline_.top_depth();
        detail::StackItem& info = outline_.stack_items.back();
        SERDEX_ASSERT(info.collection_type == CollectionType::Object, detail::kNotObject);

        // Buffered entries first
        if (detail::first_unread_child(outline_.lookback_items, info.first_child_index) !=
            detail::kNoIndex) {
            if (auto index = outline_.remove_key(depth, key)) {
                state_ = State::lookback_value(*index, state_.streaming_depth);
                return true;
            }
        }

        if (state_.streaming_depth != depth) return false;

        // Stream forward, buffering every entry that does not match
        std::optional<SourceLocation> key_pos =
            state_.at_start ? scanner_.skip_to_first_entry() : scanner_.skip_to_next_entry();
        while (key_pos) {
            size_t data_index = outline_.lookback_data.size();
            bool found = scanner_.read_key_or_match(key, outline_.lookback_data);
            scanner_.skip_past_colon();
            if (found) {
                scanner_.skip_whitespace();
                state_ = State::streaming_value();
                return true;
            }
            uint32_t key_len_active =
                make_key_len_active(outline_.lookback_data.size() - data_index, *key_pos);
            size_t item = read_lookback_value(data_index, key_len_active);
            outline_.insert_key(depth, item);
            key_pos = scanner_.skip_to_next_entry();
        }
        state_.streaming_depth = depth - 1;
        return false;
    }

    bool next_entry() override {
        SERDEX_ASSERT(state_.kind == Kind::Collection && !outline_.stack_items.empty(),
                      detail::kNotCollection);
        const uint32_t depth = outline_.top_depth();
        detail::StackItem& info = outline_.stack_items.back();
        SERDEX_ASSERT(info.collection_type == CollectionType::Object, detail::kNotObject);

        size_t index = detail::first_unread_child(outline_.lookback_items, info.first_child_index);
        if (index != detail::kNoIndex) {
            outline_.remove_key_at(depth, index);
            const detail::LookbackItem& item = outline_.lookback_items[index];
            state_ = State::lookback_string(item.data_index, item.data_index + item.key_len(),
                                            index, state_.streaming_depth);
            return true;
        }

        if (state_.streaming_depth == depth) {
            std::optional<SourceLocation> key_pos =
                state_.at_start ? scanner_.skip_to_first_entry() : scanner_.skip_to_next_entry();
            if (key_pos) {
                error_pos_ = *key_pos;
                state_ = State::streaming_string(true);
                return true;
            }
            state_.streaming_depth = depth - 1;
        }

        error_pos_ = outline_.pop_container();
        state_.at_start = false;
        return false;
    }

    [[nodiscard]] DeserializeError error_missing_entry(std::string key) const override {
        return make_error(errc::missing_key, std::move(key));
    }

    [[nodiscard]] DeserializeError error_extra_entry(std::string key) const override {
        SERDEX_ASSERT(!outline_.stack_items.empty(), detail::kNotCollection);
        const detail::StackItem& info = outline_.stack_items.back();
        SERDEX_ASSERT(info.collection_type == CollectionType::Object, detail::kNotObject);
        return DeserializeError(errc::extra_key, info.pos, std::move(key));
    }

private:
    [[noreturn]] static void violation(const char* message) {
        serdex::detail::protocol_violation(message, __FILE__, __LINE__);
    }

    void check_depth(SourceLocation pos) const {
        if (outline_.top_depth() >= config_.max_depth) {
            throw DeserializeError(errc::max_depth_exceeded, pos);
        }
    }

    static uint32_t make_key_len_active(size_t key_len, SourceLocation key_pos) {
        if (key_len > (std::numeric_limits<uint32_t>::max() >> 1)) {
            throw DeserializeError(errc::key_too_long, key_pos);
        }
        return (static_cast<uint32_t>(key_len) << 1) | 1u;
    }

    /// Reading a virtual null as anything else means its entry was missing.
    [[nodiscard]] DeserializeError error_unexpected_virtual_null(
            std::optional<std::string_view> key) const {
        SourceLocation pos = outline_.stack_items.empty() ? error_pos_
                                                          : outline_.stack_items.back().pos;
        return DeserializeError(errc::missing_key, pos, key ? std::string(*key) : std::string());
    }

    template <typename T>
    T read_number() {
        switch (state_.kind) {
            case Kind::StreamingValue:
                state_ = State::collection(false, outline_.top_depth());
                error_pos_ = scanner_.position();
                return scanner_.template read_number<T>();
            case Kind::LookbackValue: {
                auto taken = outline_.take_value(state_.index);
                if (taken.value.kind != LookbackValue::Kind::Number) {
                    throw DeserializeError(errc::expected_number, taken.pos);
                }
                state_ = State::collection(false, state_.streaming_depth);
                error_pos_ = taken.pos;
                typename detail::Num<T>::Builder builder;
                std::string_view data = outline_.data();
                for (size_t i = taken.data_begin; i < taken.data_end; ++i) {
                    auto byte = static_cast<uint8_t>(data[i]);
                    uint8_t lo = byte & 0xF;
                    if (lo == 0xF) break;
                    if (!builder.push_digit(lo)) throw DeserializeError(errc::number_overflow, taken.pos);
                    uint8_t hi = static_cast<uint8_t>(byte >> 4);
                    if (hi == 0xF) break;
                    if (!builder.push_digit(hi)) throw DeserializeError(errc::number_overflow, taken.pos);
                }
                auto value = detail::Num<T>::from_builder(builder, taken.value.flag, taken.value.exp);
                if (!value) throw DeserializeError(errc::number_overflow, taken.pos);
                return *value;
            }
            case Kind::NullValue:
                throw error_unexpected_virtual_null(state_.key);
            default:
                violation(detail::kNotValue);
        }
    }

    /// Reads the value of an entry (whose key is already in lookback_data
    /// at @p data_index) and everything nested in it into the arena.
    /// Returns the index of the entry's item.
    size_t read_lookback_value(size_t data_index, uint32_t key_len_active) {
        auto& items = outline_.lookback_items;
        auto& data = outline_.lookback_data;
        const uint32_t end_depth = outline_.top_depth();
        uint32_t depth = end_depth;
        size_t last_child_index = detail::kNoIndex;
        CollectionType collection_type = CollectionType::Object;

        auto enter = [&](SourceLocation pos) {
            if (depth + 1 > config_.max_depth) {
                throw DeserializeError(errc::max_depth_exceeded, pos);
            }
            ++depth;
            last_child_index = detail::kNoIndex;
        };

        auto read_key = [&](SourceLocation key_pos) {
            data_index = data.size();
            scanner_.read_str_bytes_into(data);
            // The low bit temporarily marks object entries (as opposed to
            // array items); correct_items() clears it.
            key_len_active = make_key_len_active(data.size() - data_index, key_pos);
            scanner_.skip_past_colon();
        };

        for (;;) {
            scanner_.skip_whitespace();
            const char32_t ch = scanner_.peek();
            const SourceLocation pos = scanner_.position();
            switch (ch) {
                case U'"':
                    scanner_.next();
                    scanner_.read_str_bytes_into(data);
                    outline_.push_item(last_child_index, pos, data_index, key_len_active,
                                       {LookbackValue::Kind::String});
                    break;
                case U'-': case U'0': case U'1': case U'2': case U'3': case U'4':
                case U'5': case U'6': case U'7': case U'8': case U'9': {
                    detail::NibbleBuilder<std::pmr::string> builder{&data};
                    auto [negate, exp] = scanner_.read_number_into(builder);
                    builder.finish();
                    if (exp < std::numeric_limits<int16_t>::min() ||
                        exp > std::numeric_limits<int16_t>::max()) {
                        throw DeserializeError(errc::number_overflow, pos);
                    }
                    outline_.push_item(last_child_index, pos, data_index, key_len_active,
                                       {LookbackValue::Kind::Number, negate,
                                        static_cast<int16_t>(exp)});
                    break;
                }
                case U'{':
                    scanner_.next();
                    if (auto key_pos = scanner_.skip_to_first_entry()) {
                        outline_.push_item(last_child_index, pos, data_index, key_len_active,
                                           {LookbackValue::Kind::Object, true});
                        enter(pos);
                        collection_type = CollectionType::Object;
                        read_key(*key_pos);
                        continue;
                    }
                    outline_.push_item(last_child_index, pos, data_index, key_len_active,
                                       {LookbackValue::Kind::Object, false});
                    break;
                case U'[':
                    scanner_.next();
                    if (scanner_.skip_to_first_item()) {
                        outline_.push_item(last_child_index, pos, data_index, key_len_active,
                                           {LookbackValue::Kind::Array, true});
                        enter(pos);
                        collection_type = CollectionType::Array;
                        data_index = data.size();
                        key_len_active = 0;
                        continue;
                    }
                    outline_.push_item(last_child_index, pos, data_index, key_len_active,
                                       {LookbackValue::Kind::Array, false});
                    break;
                case U't':
                case U'f': {
                    bool value = scanner_.read_bool();
                    outline_.push_item(last_child_index, pos, data_index, key_len_active,
                                       {LookbackValue::Kind::Bool, value});
                    break;
                }
                case U'n':
                    scanner_.read_null();
                    outline_.push_item(last_child_index, pos, data_index, key_len_active,
                                       {LookbackValue::Kind::Null});
                    break;
                case kEndOfInput:
                    throw DeserializeError(errc::unexpected_end_of_input, pos);
                default:
                    throw DeserializeError(errc::unexpected_character, pos);
            }

            // A value was read; close every container it completes.
            bool more = false;
            while (depth > end_depth) {
                if (collection_type == CollectionType::Object) {
                    if (auto key_pos = scanner_.skip_to_next_entry()) {
                        read_key(*key_pos);
                        more = true;
                        break;
                    }
                } else if (scanner_.skip_to_next_item()) {
                    data_index = data.size();
                    key_len_active = 0;
                    more = true;
                    break;
                }
                size_t first_child = detail::correct_items(items, last_child_index);
                size_t parent = first_child - 1;
                --depth;
                last_child_index = parent;
                collection_type = (items[parent].key_len_active & 1u) ? CollectionType::Object
                                                                      : CollectionType::Array;
            }
            if (more) continue;

            items[last_child_index].next_sibling_index = items.size();
            return last_child_index;
        }
    }

    TextDeserializerConfig config_;
    detail::Scanner<Reader> scanner_;
    detail::Outline outline_;
    State state_;
    SourceLocation error_pos_;
    bool closed_ = false;
};

} // namespace serdex::json
