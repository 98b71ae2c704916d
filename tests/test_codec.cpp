/**
 * @file test_codec.cpp
 * @brief Unit tests for segment escaping (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "jptr/Codec.hpp"

#include <clocale>
#include <string>

using namespace jptr;

// ============================================================================
// Pointer escaping
// ============================================================================

TEST(Escape, PlainTextUnchanged) {
    EXPECT_EQ(escape("plain"), "plain");
    EXPECT_EQ(escape(""), "");
}

TEST(Escape, SlashAndTilde) {
    EXPECT_EQ(escape("a/b"), "a~1b");
    EXPECT_EQ(escape("m~n"), "m~0n");
    EXPECT_EQ(escape("~/"), "~0~1");
}

TEST(Escape, TildeIsEscapedBeforeSlash) {
    // "~1" must not turn into "~01" via a second pass over the output
    EXPECT_EQ(escape("/"), "~1");
    EXPECT_EQ(escape("~1"), "~01");
}

TEST(Unescape, SlashAndTilde) {
    EXPECT_EQ(unescape("a~1b"), "a/b");
    EXPECT_EQ(unescape("m~0n"), "m~n");
}

TEST(Unescape, TildeZeroOneIsNotSlash) {
    EXPECT_EQ(unescape("~01"), "~1");
}

TEST(Unescape, UnknownSequencesPassThrough) {
    EXPECT_EQ(unescape("~2"), "~2");
    EXPECT_EQ(unescape("trailing~"), "trailing~");
}

TEST(Unescape, InvertsEscape) {
    for (const std::string raw : {"", "a", "a/b/c", "~", "~~//", "~0~1", "x~/y"}) {
        EXPECT_EQ(unescape(escape(raw)), raw) << raw;
    }
}

// ============================================================================
// URI component encoding
// ============================================================================

TEST(UriEncode, UnreservedCharactersKept) {
    EXPECT_EQ(uri_encode("azAZ09-_.!~*'()"), "azAZ09-_.!~*'()");
}

TEST(UriEncode, ReservedCharactersEncoded) {
    EXPECT_EQ(uri_encode("my value"), "my%20value");
    EXPECT_EQ(uri_encode("c%d"), "c%25d");
    EXPECT_EQ(uri_encode("k\"l"), "k%22l");
    EXPECT_EQ(uri_encode("a/b"), "a%2Fb");
}

TEST(UriEncode, Utf8BytesEncodedIndividually) {
    EXPECT_EQ(uri_encode("\xC3\xA9"), "%C3%A9");
}

TEST(UriEncode, HighBytesEncodedInAnyLocale) {
    const std::string previous = std::setlocale(LC_CTYPE, nullptr);
    for (const char* name : {"C", "en_US.ISO-8859-1", "de_DE.ISO-8859-1", "C.UTF-8"}) {
        if (!std::setlocale(LC_CTYPE, name)) {
            continue;
        }
        for (int c = 0x80; c <= 0xFF; ++c) {
            const std::string raw(1, static_cast<char>(c));
            EXPECT_EQ(uri_encode(raw).size(), 3u) << name << " byte " << c;
        }
    }
    std::setlocale(LC_CTYPE, previous.c_str());
}

TEST(UriDecode, DecodesPercentSequences) {
    EXPECT_EQ(uri_decode("my%20value"), "my value");
    EXPECT_EQ(uri_decode("%C3%A9"), "\xC3\xA9");
    EXPECT_EQ(uri_decode("a%2fb"), "a/b");
}

TEST(UriDecode, MalformedSequencesPassThrough) {
    EXPECT_EQ(uri_decode("100%"), "100%");
    EXPECT_EQ(uri_decode("%2"), "%2");
    EXPECT_EQ(uri_decode("%zz"), "%zz");
}

TEST(UriDecode, InvertsEncode) {
    for (const std::string raw : {"", "a b", "~0~1", "%", "\xE2\x82\xAC"}) {
        EXPECT_EQ(uri_decode(uri_encode(raw)), raw) << raw;
    }
}
