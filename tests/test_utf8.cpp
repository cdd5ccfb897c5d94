/// @file test_utf8.cpp
/// @brief Unit tests for UTF-8 support: escapes, raw text, writing and roundtrip.

#include <serdex/serdex.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace serdex;

// ═══════════════════════════════════════════════════════════════════════════════
// Unicode escape sequences (\uXXXX)
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Utf8Reader, AsciiEscape) {
    // \u0041 = 'A'
    EXPECT_EQ(json::from_str<std::string>(R"("\u0041")"), "A");
}

TEST(Utf8Reader, NullEscape) {
    std::string expected(1, '\0');
    EXPECT_EQ(json::from_str<std::string>(R"("\u0000")"), expected);
}

TEST(Utf8Reader, CyrillicEscape) {
    // \u041F = 'П', UTF-8 0xD0 0x9F
    EXPECT_EQ(json::from_str<std::string>(R"("\u041F")"), "\xD0\x9F");
}

TEST(Utf8Reader, MultipleUnicodeEscapes) {
    EXPECT_EQ(json::from_str<std::string>(R"("\u041F\u0440\u0438\u0432\u0435\u0442")"),
              "Привет");
}

TEST(Utf8Reader, ChineseEscape) {
    EXPECT_EQ(json::from_str<std::string>(R"("\u4F60\u597D")"), "你好");
}

TEST(Utf8Reader, EuroSign) {
    EXPECT_EQ(json::from_str<std::string>(R"("\u20AC")"), "€");
}

TEST(Utf8Reader, SimpleEscapes) {
    EXPECT_EQ(json::from_str<std::string>(R"("\"\\\/\b\f\n\r\t")"), "\"\\/\b\f\n\r\t");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Surrogate pairs (codepoints > U+FFFF)
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Utf8Reader, SurrogatePairEmoji) {
    // U+1F600 = 😀
    EXPECT_EQ(json::from_str<std::string>(R"("\uD83D\uDE00")"), "😀");
}

TEST(Utf8Reader, SurrogatePairMusicalNote) {
    // U+1D11E = 𝄞, UTF-8 F0 9D 84 9E
    EXPECT_EQ(json::from_str<std::string>(R"("\uD834\uDD1E")"), "\xF0\x9D\x84\x9E");
}

TEST(Utf8Reader, MixedEscapesAndText) {
    EXPECT_EQ(json::from_str<std::string>(R"("Hello \u4E16\u754C! \uD83D\uDE00")"),
              "Hello 世界! 😀");
}

TEST(Utf8Reader, CharFromSurrogatePair) {
    EXPECT_EQ(json::from_str<char32_t>(R"("\uD83D\uDE00")"), U'\U0001F600');
}

// ═══════════════════════════════════════════════════════════════════════════════
// Escape errors
// ═══════════════════════════════════════════════════════════════════════════════

namespace {

errc error_of(std::string_view text) {
    try {
        (void)json::from_str<std::string>(text);
    } catch (const DeserializeError& e) {
        return static_cast<errc>(e.code().value());
    }
    return errc::ok;
}

} // namespace

TEST(Utf8Reader, ErrorLoneSurrogateHigh) {
    EXPECT_EQ(error_of(R"("\uD83D")"), errc::invalid_unicode_escape);
}

TEST(Utf8Reader, ErrorLoneSurrogateLow) {
    EXPECT_EQ(error_of(R"("\uDC00")"), errc::invalid_unicode_escape);
}

TEST(Utf8Reader, ErrorInvalidLowSurrogate) {
    EXPECT_EQ(error_of(R"("\uD83D\u0041")"), errc::invalid_unicode_escape);
}

TEST(Utf8Reader, ErrorBadHexDigit) {
    EXPECT_EQ(error_of(R"("\u12G4")"), errc::invalid_unicode_escape);
}

TEST(Utf8Reader, ErrorUnknownEscape) {
    EXPECT_EQ(error_of(R"("\q")"), errc::unrecognized_escape);
}

TEST(Utf8Reader, ErrorInvalidUtf8) {
    const char text[] = {'"', static_cast<char>(0x80), '"', 0};
    EXPECT_EQ(error_of(text), errc::invalid_utf8);
}

TEST(Utf8Reader, ErrorUnterminated) {
    EXPECT_EQ(error_of("\"abc"), errc::unexpected_end_of_input);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Direct UTF-8 in strings (without escape)
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Utf8Reader, DirectUtf8Cyrillic) {
    EXPECT_EQ(json::from_str<std::string>("\"Привет мир\""), "Привет мир");
}

TEST(Utf8Reader, DirectUtf8Emoji) {
    EXPECT_EQ(json::from_str<std::string>("\"Hello 😀🌍\""), "Hello 😀🌍");
}

TEST(Utf8Reader, DirectUtf8Mixed) {
    EXPECT_EQ(json::from_str<std::string>("\"café résumé naïve\""), "café résumé naïve");
}

TEST(Utf8Reader, Utf8ObjectKeysOutOfOrder) {
    std::string text = R"({"имя": "Алиса", "город": "Москва"})";
    json::TextDeserializer<StringReader> d{StringReader(text)};
    Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> v) {
        auto obj = json::into_object(std::move(v));
        EXPECT_EQ(obj.entry("город").get_str(), "Москва");
        EXPECT_EQ(obj.entry("имя").get_str(), "Алиса");
        std::move(obj).close();
    });
    d.close();
}

TEST(Utf8Reader, Utf8KeyWithEscapeMatchesRawKey) {
    std::string text = R"({"\u0438\u043c\u044f": 1, "x": 2})";
    json::TextDeserializer<StringReader> d{StringReader(text)};
    Value<json::JsonDeserializer>::with(d, [](Value<json::JsonDeserializer> v) {
        auto obj = json::into_object(std::move(v));
        EXPECT_EQ(obj.entry("x").get_i32(), 2);
        EXPECT_EQ(obj.entry("имя").get_i32(), 1);
        std::move(obj).close();
    });
    d.close();
}

// ═══════════════════════════════════════════════════════════════════════════════
// UTF-8 writing
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Utf8Writer, PassthroughUtf8) {
    EXPECT_EQ(json::to_str(std::string("Привет 😀")), "\"Привет 😀\"");
}

TEST(Utf8Writer, ControlCharactersEscaped) {
    std::string s;
    s.push_back('\x01');
    s.push_back('\x1f');
    EXPECT_EQ(json::to_str(s), "\"\\u0001\\u001f\"");
}

TEST(Utf8Writer, InvalidInputReplaced) {
    const char raw[] = {'a', static_cast<char>(0xFF), 'b', 0};
    EXPECT_EQ(json::to_str(std::string(raw)), "\"a\xEF\xBF\xBD" "b\"");
}

TEST(Utf8Writer, CharAstral) {
    EXPECT_EQ(json::to_str(U'\U0001F600'), "\"😀\"");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Roundtrip: read -> write -> read
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Utf8Roundtrip, EmojiDirect) {
    std::string v1 = json::from_str<std::string>("\"Hello 😀🌍💩\"");
    std::string v2 = json::from_str<std::string>(json::to_str(v1));
    EXPECT_EQ(v1, v2);
}

TEST(Utf8Roundtrip, UnicodeEscapeToUtf8) {
    std::string v1 = json::from_str<std::string>(R"("\u041F\u0440\u0438\u0432\u0435\u0442")");
    EXPECT_EQ(v1, "Привет");
    EXPECT_EQ(json::from_str<std::string>(json::to_str(v1)), "Привет");
}

TEST(Utf8Roundtrip, EscapedControlCharacters) {
    std::string v1 = "tab\tnewline\nquote\"backslash\\bell\x07";
    EXPECT_EQ(json::from_str<std::string>(json::to_str(v1)), v1);
}

// ═══════════════════════════════════════════════════════════════════════════════
// UTF-8 utilities (detail::utf8)
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Utf8Utils, EncodeAscii) {
    std::string out;
    serdex::detail::utf8::encode('A', out);
    EXPECT_EQ(out, "A");
}

TEST(Utf8Utils, Encode2Byte) {
    std::string out;
    serdex::detail::utf8::encode(0x041F, out); // П
    EXPECT_EQ(out, "\xD0\x9F");
}

TEST(Utf8Utils, Encode3Byte) {
    std::string out;
    serdex::detail::utf8::encode(0x4F60, out); // 你
    EXPECT_EQ(out, "\xE4\xBD\xA0");
}

TEST(Utf8Utils, Encode4Byte) {
    std::string out;
    serdex::detail::utf8::encode(0x1F600, out); // 😀
    EXPECT_EQ(out, "\xF0\x9F\x98\x80");
}

TEST(Utf8Utils, DecodeAscii) {
    const char* p = "A";
    const char* end = p + 1;
    EXPECT_EQ(serdex::detail::utf8::decode(p, end), 0x41u);
    EXPECT_EQ(p, end);
}

TEST(Utf8Utils, Decode4Byte) {
    std::string s = "😀";
    const char* p = s.data();
    const char* end = s.data() + s.size();
    EXPECT_EQ(serdex::detail::utf8::decode(p, end), 0x1F600u);
    EXPECT_EQ(p, end);
}

TEST(Utf8Utils, DecodeLoneContinuation) {
    const char invalid[] = {static_cast<char>(0x80), 0};
    const char* p = invalid;
    EXPECT_EQ(serdex::detail::utf8::decode(p, invalid + 1), serdex::detail::utf8::kInvalid);
}

TEST(Utf8Utils, Surrogates) {
    EXPECT_TRUE(serdex::detail::utf8::is_high_surrogate(0xD83D));
    EXPECT_TRUE(serdex::detail::utf8::is_low_surrogate(0xDE00));
    EXPECT_EQ(serdex::detail::utf8::combine_surrogates(0xD83D, 0xDE00), 0x1F600u);
}

