/**
 * @file string_utils.h
 * @brief String helpers for diagnostics and digests
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hrid {
namespace utils {

/**
 * @brief Convert binary data to lowercase hex string
 *
 * @param data Binary data
 * @param len Number of bytes
 * @return Hex string (2 chars per byte)
 */
std::string bytesToHex(const std::uint8_t* data, std::size_t len);

/**
 * @brief Convert binary data to lowercase hex string
 */
std::string bytesToHex(const std::vector<std::uint8_t>& data);

/**
 * @brief Render untrusted text for an error message
 *
 * Cuts the text at a code point boundary no later than maxBytes and appends
 * "..." when anything was cut. Bytes below 0x20, DEL and bytes that are not
 * part of a well-formed UTF-8 sequence are written as \xNN. Double quotes and
 * backslashes get a backslash prefix. The result is wrapped in double quotes.
 *
 * @param text Input text
 * @param maxBytes Maximum number of input bytes echoed
 * @return Quoted, escaped text
 */
std::string escapeForDisplay(std::string_view text, std::size_t maxBytes = 64);

} // namespace utils
} // namespace hrid
