/**
 * @file utf8.cpp
 * @brief Strict UTF-8 decoder implementation
 */

#include "hrid/utils/utf8.h"
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace hrid {
namespace utils {

namespace {

bool isContinuation(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

} // namespace

bool decodeUtf8(std::string_view text, std::size_t offset, char32_t& codepoint, std::size_t& length) {
    if (offset >= text.size()) {
        return false;
    }

    const auto lead = static_cast<unsigned char>(text[offset]);
    std::size_t need;
    char32_t cp;
    char32_t minValue;

    if (lead < 0x80) {
        codepoint = lead;
        length = 1;
        return true;
    } else if ((lead & 0xE0) == 0xC0) {
        need = 2;
        cp = lead & 0x1F;
        minValue = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        need = 3;
        cp = lead & 0x0F;
        minValue = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        need = 4;
        cp = lead & 0x07;
        minValue = 0x10000;
    } else {
        return false;
    }

    if (text.size() - offset < need) {
        return false;
    }

    for (std::size_t i = 1; i < need; ++i) {
        const auto b = static_cast<unsigned char>(text[offset + i]);
        if (!isContinuation(b)) {
            return false;
        }
        cp = (cp << 6) | (b & 0x3F);
    }

    // Overlong, surrogate, or beyond the Unicode range
    if (cp < minValue || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
        return false;
    }

    codepoint = cp;
    length = need;
    return true;
}

bool isValidUtf8(std::string_view text, std::size_t* badOffset) {
    std::size_t i = 0;
    while (i < text.size()) {
        char32_t cp;
        std::size_t len;
        if (!decodeUtf8(text, i, cp, len)) {
            if (badOffset) {
                *badOffset = i;
            }
            return false;
        }
        i += len;
    }
    return true;
}

std::string encodeUtf8(char32_t cp) {
    std::string out;

    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp >= 0xD800 && cp <= 0xDFFF) {
        return "";
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }

    return out;
}

std::string codepointToString(char32_t codepoint) {
    std::ostringstream oss;
    oss << "U+" << std::uppercase << std::hex << std::setfill('0')
        << std::setw(4) << static_cast<std::uint32_t>(codepoint);
    return oss.str();
}

} // namespace utils
} // namespace hrid
