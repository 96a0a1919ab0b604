/**
 * @file types.h
 * @brief Common types for the hrid library
 *
 * Grammar rules and the validation result struct shared by the grammar
 * checker, the Id wrapper and the serialization adapters.
 */

#pragma once

#include <cstddef>
#include <string>

namespace hrid {

/// @brief Identifier grammar rule that rejected a candidate
enum class Rule {
    NONE,                ///< No rule violated (candidate accepted)
    EMPTY,               ///< Zero-length candidate
    INVALID_UTF8,        ///< Bytes are not well-formed UTF-8
    CONTROL_CHARACTER,   ///< Code point below 32 (NUL, tab, newline, ...)
    RESERVED_CHARACTER,  ///< URL/path punctuation such as '/', '#', '?'
    PATH_TRAVERSAL,      ///< The ".." substring
    WHITESPACE           ///< Any Unicode White_Space code point
};

/// @brief Grammar check result
struct ValidationResult {
    bool valid = true;
    Rule rule = Rule::NONE;
    std::size_t offset = 0;  ///< Byte offset of the violation in the input
    std::string pattern;     ///< Offending character or substring
    std::string message;     ///< Empty when valid
};

/// @brief Convert Rule to string
inline std::string ruleToString(Rule r) {
    switch (r) {
        case Rule::NONE:               return "NONE";
        case Rule::EMPTY:              return "EMPTY";
        case Rule::INVALID_UTF8:       return "INVALID_UTF8";
        case Rule::CONTROL_CHARACTER:  return "CONTROL_CHARACTER";
        case Rule::RESERVED_CHARACTER: return "RESERVED_CHARACTER";
        case Rule::PATH_TRAVERSAL:     return "PATH_TRAVERSAL";
        case Rule::WHITESPACE:         return "WHITESPACE";
    }
    return "UNKNOWN";
}

} // namespace hrid
