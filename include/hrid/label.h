/**
 * @file label.h
 * @brief Compile-time constant identifier names
 */

#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace hrid {

/**
 * @brief Static label for a well-known identifier
 *
 * A Label only refers to static text and performs no validation itself;
 * the text is checked when the label is converted into an Id.
 *
 * @code
 * constexpr hrid::Label HELLO = hrid::label("hello");
 * hrid::Id id(HELLO);
 * @endcode
 */
class Label {
private:
    std::string_view id_;

public:
    constexpr explicit Label(std::string_view id) noexcept : id_(id) {}

    [[nodiscard]] constexpr std::string_view getValue() const noexcept {
        return id_;
    }

    [[nodiscard]] std::string toString() const {
        return std::string(id_);
    }

    constexpr bool operator==(const Label& other) const noexcept {
        return id_ == other.id_;
    }

    constexpr bool operator!=(const Label& other) const noexcept {
        return !(*this == other);
    }

    constexpr bool operator<(const Label& other) const noexcept {
        return id_ < other.id_;
    }
};

/**
 * @brief Return a Label with the given static text (unchecked)
 */
constexpr Label label(std::string_view id) noexcept {
    return Label(id);
}

inline std::ostream& operator<<(std::ostream& os, const Label& l) {
    return os << l.getValue();
}

} // namespace hrid
