/**
 * @file Codec.hpp
 * @brief Escaping of individual JSON pointer segments
 *
 * Two layers, applied in this order when building a pointer:
 * 1. Pointer escaping (RFC 6901 section 4): "~" -> "~0", "/" -> "~1"
 * 2. URI percent-encoding (RFC 6901 section 6), only for "#" fragment pointers
 *
 * Decoding runs the layers in reverse: uri_decode() first, then unescape().
 * All functions are pure and accept any input.
 */

#ifndef JPTR_CODEC_HPP
#define JPTR_CODEC_HPP

#include <string>

namespace jptr {

/**
 * @brief Escape a raw property name for use as a pointer segment
 *
 * Examples:
 * - "a/b" → "a~1b"
 * - "m~n" → "m~0n"
 * - "~/" → "~0~1"
 */
std::string escape(const std::string& raw);

/**
 * @brief Decode an escaped pointer segment
 *
 * Replaces "~1" with "/" and then "~0" with "~", so "~01" decodes to "~1"
 * rather than "/". Unrecognized sequences ("~2", trailing "~") are kept.
 */
std::string unescape(const std::string& encoded);

/**
 * @brief Percent-encode a segment as a URI component
 *
 * Leaves A-Z a-z 0-9 and - _ . ! ~ * ' ( ) untouched; every other byte is
 * written as %XX with uppercase hex digits.
 *
 * Examples:
 * - "my value" → "my%20value"
 * - "to~1child" → "to~1child"
 */
std::string uri_encode(const std::string& segment);

/**
 * @brief Decode %XX sequences in a URI component
 *
 * A '%' that is not followed by two hex digits is copied as-is.
 */
std::string uri_decode(const std::string& segment);

} // namespace jptr

#endif // JPTR_CODEC_HPP
