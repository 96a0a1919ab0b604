/**
 * @file grammar.cpp
 * @brief Identifier grammar checker implementation
 */

#include "hrid/grammar.h"
#include "hrid/utils/string_utils.h"
#include "hrid/utils/utf8.h"

#include <string>

namespace hrid {

namespace {

constexpr char32_t FIRST_PRINTABLE = 32;

ValidationResult reject(Rule rule, std::size_t offset, std::string pattern, std::string message) {
    ValidationResult result;
    result.valid = false;
    result.rule = rule;
    result.offset = offset;
    result.pattern = std::move(pattern);
    result.message = std::move(message);
    return result;
}

} // namespace

ValidationResult checkGrammar(std::string_view text) {
    if (text.empty()) {
        return reject(Rule::EMPTY, 0, "", "cannot construct an empty Id");
    }

    // Single decoding pass: encoding errors are reported immediately, the
    // first whitespace code point is remembered for the last rule.
    std::size_t whitespaceOffset = std::string_view::npos;
    std::size_t whitespaceLength = 0;
    char32_t whitespace = 0;

    std::size_t i = 0;
    while (i < text.size()) {
        char32_t cp;
        std::size_t len;
        if (!utils::decodeUtf8(text, i, cp, len)) {
            return reject(Rule::INVALID_UTF8, i, std::string(1, text[i]),
                          "Id " + utils::escapeForDisplay(text) +
                          " is not valid UTF-8 at byte " + std::to_string(i));
        }

        if (whitespaceOffset == std::string_view::npos && utils::isUnicodeWhitespace(cp)) {
            whitespaceOffset = i;
            whitespaceLength = len;
            whitespace = cp;
        }
        i += len;
    }

    // UTF-8 never uses bytes below 0x80 inside multi-byte sequences, so a
    // byte scan finds exactly the code points below 32.
    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        const auto b = static_cast<unsigned char>(text[pos]);
        if (b < FIRST_PRINTABLE) {
            return reject(Rule::CONTROL_CHARACTER, pos, std::string(1, text[pos]),
                          "Id " + utils::escapeForDisplay(text) +
                          " contains ASCII control character " + std::to_string(b));
        }
    }

    for (const auto& pattern : RESERVED_PATTERNS) {
        const auto pos = text.find(pattern);
        if (pos == std::string_view::npos) {
            continue;
        }

        const Rule rule = pattern == ".." ? Rule::PATH_TRAVERSAL : Rule::RESERVED_CHARACTER;
        return reject(rule, pos, std::string(pattern),
                      "Id " + utils::escapeForDisplay(text) +
                      " contains disallowed pattern " + utils::escapeForDisplay(pattern));
    }

    if (whitespaceOffset != std::string_view::npos) {
        return reject(Rule::WHITESPACE, whitespaceOffset,
                      std::string(text.substr(whitespaceOffset, whitespaceLength)),
                      "Id " + utils::escapeForDisplay(text) +
                      " is not allowed to contain whitespace " +
                      utils::codepointToString(whitespace));
    }

    return ValidationResult{};
}

bool isValid(std::string_view text) {
    return checkGrammar(text).valid;
}

} // namespace hrid
