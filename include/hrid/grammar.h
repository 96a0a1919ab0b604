/**
 * @file grammar.h
 * @brief Identifier grammar checker
 *
 * Pure function, no I/O. Decides whether candidate text is a legal
 * identifier: safe as a URL path segment, a file name, or a DNS label,
 * while any other Unicode text is accepted verbatim.
 *
 * Rules, in the order they are checked (first violation is reported):
 *   1. EMPTY               zero bytes
 *   2. INVALID_UTF8        ill-formed UTF-8
 *   3. CONTROL_CHARACTER   any code point below 32
 *   4. RESERVED_CHARACTER  any pattern of reservedPatterns(), in table order;
 *      PATH_TRAVERSAL      the ".." entry of that table
 *   5. WHITESPACE          any Unicode White_Space code point
 */

#pragma once

#include "hrid/types.h"

#include <array>
#include <string_view>

namespace hrid {

/// Number of entries in the reserved pattern table
inline constexpr std::size_t RESERVED_PATTERN_COUNT = 22;

/**
 * @brief Prohibited substrings, in scan order
 *
 * Every entry is a single reserved character except "..", which is reported
 * as Rule::PATH_TRAVERSAL. '%' and '*' are not reserved.
 */
inline constexpr std::array<std::string_view, RESERVED_PATTERN_COUNT> RESERVED_PATTERNS = {
    "/", "..", "~", "$", "`", "&", "|", "=", "^", "{", "}",
    "<", ">", "'", "\"", "\\", "?", ":", "@", "#", "(", ")"
};

/**
 * @brief Validate candidate identifier text
 *
 * @param text Candidate text (UTF-8)
 * @return ValidationResult; valid == true means the text is accepted as is
 */
ValidationResult checkGrammar(std::string_view text);

/**
 * @brief Shorthand for checkGrammar(text).valid
 */
bool isValid(std::string_view text);

/**
 * @brief Reserved pattern table
 */
constexpr const std::array<std::string_view, RESERVED_PATTERN_COUNT>& reservedPatterns() noexcept {
    return RESERVED_PATTERNS;
}

} // namespace hrid
