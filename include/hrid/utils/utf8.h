/**
 * @file utf8.h
 * @brief Strict UTF-8 decoding and Unicode character classes
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace hrid {
namespace utils {

/**
 * @brief Decode one code point starting at offset
 *
 * Rejects overlong forms, surrogates, values above U+10FFFF and truncated
 * sequences.
 *
 * @param text Input bytes
 * @param offset Byte offset of the lead byte (must be < text.size())
 * @param codepoint Decoded code point (set on success)
 * @param length Number of bytes consumed (set on success)
 * @return true if a well-formed sequence starts at offset
 */
bool decodeUtf8(std::string_view text, std::size_t offset, char32_t& codepoint, std::size_t& length);

/**
 * @brief Check if string is valid UTF-8
 *
 * @param text Input bytes
 * @param badOffset Receives the offset of the first invalid sequence (optional)
 * @return true if the whole input is well-formed
 */
bool isValidUtf8(std::string_view text, std::size_t* badOffset = nullptr);

/**
 * @brief Encode a code point as UTF-8
 *
 * @return Encoded bytes, or an empty string for surrogates and out-of-range values
 */
std::string encodeUtf8(char32_t codepoint);

/**
 * @brief Unicode White_Space property (PropList.txt)
 */
constexpr bool isUnicodeWhitespace(char32_t cp) noexcept {
    return (cp >= 0x0009 && cp <= 0x000D) ||
           cp == 0x0020 ||
           cp == 0x0085 ||
           cp == 0x00A0 ||
           cp == 0x1680 ||
           (cp >= 0x2000 && cp <= 0x200A) ||
           cp == 0x2028 ||
           cp == 0x2029 ||
           cp == 0x202F ||
           cp == 0x205F ||
           cp == 0x3000;
}

/**
 * @brief Format a code point as "U+XXXX"
 */
std::string codepointToString(char32_t codepoint);

} // namespace utils
} // namespace hrid
