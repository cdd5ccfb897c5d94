#pragma once

/// @file json.hpp
/// @author Aleksandr Loshkarev
/// @brief One-call JSON reading and writing of serdex-mapped types.
///
/// @code
///   struct Point { int32_t x; int32_t y; };
///   SERDEX_DEFINE_STRUCT(Point, x, y)
///
///   auto p = serdex::json::from_str<Point>(R"({"y": 2, "x": 1})");
///   std::string s = serdex::json::to_str(p);   // { "x": 1, "y": 2 }
/// @endcode

#include "../conversion.hpp"
#include "../error.hpp"
#include "../text_reader.hpp"
#include "../text_writer.hpp"
#include "../value.hpp"
#include "helper.hpp"
#include "outliner.hpp"
#include "text_deserializer.hpp"
#include "text_serializer.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace serdex::json {

// ─── Reading ──────────────────────────────────────────────────────────

/// @brief Reads a T from @p reader and requires the input to end after it.
/// @throws DeserializeError on malformed or mismatched input.
template <typename T, typename Reader>
T from_reader(Reader reader, const TextDeserializerConfig& config) {
    TextDeserializer<Reader> d(std::move(reader), config);
    T out = Value<JsonDeserializer>::with(d, [](Value<JsonDeserializer> v) {
        return std::move(v).template get<T>();
    });
    d.close();
    return out;
}

template <typename T>
T from_str(std::string_view text, const TextDeserializerConfig& config = {}) {
    return from_reader<T>(StringReader(text), config);
}

template <typename T>
T from_stream(std::istream& is, const TextDeserializerConfig& config = {}) {
    return from_reader<T>(StreamReader(is), config);
}

/// @brief Exception-free from_str(): on failure the value is
/// default-constructed and the error code and message are set.
template <typename T>
[[nodiscard]] result<T> try_from_str(std::string_view text,
                                     const TextDeserializerConfig& config = {}) {
    try {
        return {from_str<T>(text, config), {}, {}};
    } catch (const DeserializeError& e) {
        return {T{}, e.code(), e.what()};
    }
}

// ─── Writing ──────────────────────────────────────────────────────────

/// @brief Writes @p value to @p writer and returns the writer.
template <typename T, typename Writer>
Writer to_writer(Writer writer, const T& value, const TextSerializerConfig& config) {
    TextSerializer<Writer> s(std::move(writer), config);
    Value<JsonSerializer>::with(s, [&](Value<JsonSerializer> v) {
        std::move(v).put(value);
    });
    return std::move(s).close();
}

template <typename T>
[[nodiscard]] std::string to_str(const T& value, const TextSerializerConfig& config = {}) {
    std::string out;
    to_writer(StringWriter(out), value, config);
    return out;
}

/// @throws SerializeError if the stream fails.
template <typename T>
void to_stream(std::ostream& os, const T& value, const TextSerializerConfig& config = {}) {
    to_writer(StreamWriter(os), value, config).flush();
}

} // namespace serdex::json
