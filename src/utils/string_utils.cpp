/**
 * @file string_utils.cpp
 * @brief String helper implementation
 */

#include "hrid/utils/string_utils.h"
#include "hrid/utils/utf8.h"
#include <iomanip>
#include <sstream>

namespace hrid {
namespace utils {

std::string bytesToHex(const std::uint8_t* data, std::size_t len) {
    if (!data || len == 0) {
        return "";
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }

    return oss.str();
}

std::string bytesToHex(const std::vector<std::uint8_t>& data) {
    return bytesToHex(data.data(), data.size());
}

std::string escapeForDisplay(std::string_view text, std::size_t maxBytes) {
    std::ostringstream oss;
    oss << '"' << std::hex << std::setfill('0');

    std::size_t i = 0;
    while (i < text.size()) {
        char32_t cp;
        std::size_t len;
        if (!decodeUtf8(text, i, cp, len)) {
            len = 1;
            cp = 0;
        }

        if (i + len > maxBytes) {
            break;
        }

        const auto b = static_cast<unsigned char>(text[i]);
        if (cp == 0 || b < 0x20 || b == 0x7F) {
            // Invalid sequences and control bytes are escaped one byte at a time
            oss << "\\x" << std::setw(2) << static_cast<int>(b);
            i += 1;
            continue;
        }

        if (b == '"' || b == '\\') {
            oss << '\\' << text[i];
            i += 1;
            continue;
        }

        oss << text.substr(i, len);
        i += len;
    }

    oss << '"';
    if (i < text.size()) {
        oss << "...";
    }
    return oss.str();
}

} // namespace utils
} // namespace hrid
