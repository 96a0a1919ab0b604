/**
 * @file id.h
 * @brief Human-readable identifier value type
 *
 * An Id holds Unicode text that is safe to use as a URL path segment, a
 * file path component or a domain-name label. Every construction path runs
 * the grammar checker (see grammar.h); once built, an Id never changes and
 * may be shared between threads freely.
 */

#pragma once

#include "hrid/exceptions.h"
#include "hrid/label.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace hrid {

/**
 * @brief Validated, immutable identifier
 *
 * Equality, ordering and hashing are those of the underlying text.
 * std::string compares through char_traits<char>, i.e. as unsigned bytes,
 * which for UTF-8 is the same as code point order.
 *
 * Moving leaves the source with empty text, which is not a valid Id. A
 * moved-from Id may only be assigned to or destroyed.
 */
class Id {
private:
    std::string value_;

    explicit Id(std::string value) : value_(std::move(value)) {}

public:
    /**
     * @brief Create from text
     * @throws ValidationError if the text violates the identifier grammar
     */
    static Id of(std::string_view text);

    /**
     * @brief Create from text, std::nullopt if the grammar rejects it
     */
    static std::optional<Id> tryOf(std::string_view text);

    /**
     * @brief Check whether of() would succeed
     */
    static bool canCastFrom(std::string_view text);

    /**
     * @brief Decimal rendering of an unsigned number
     */
    static Id fromNumber(std::uint64_t number);

    /**
     * @brief Validated conversion from a static label
     * @throws ValidationError if the label text is not a legal identifier
     */
    explicit Id(const Label& label);

    /**
     * @brief Get the underlying text
     */
    [[nodiscard]] const std::string& getValue() const noexcept {
        return value_;
    }

    /**
     * @brief Get an owned copy of the underlying text
     */
    [[nodiscard]] std::string toString() const {
        return value_;
    }

    /**
     * @brief Length in bytes
     */
    [[nodiscard]] std::size_t length() const noexcept {
        return value_.length();
    }

    [[nodiscard]] bool startsWith(std::string_view prefix) const noexcept;

    /**
     * @brief Parse the whole text as a decimal unsigned integer
     * @return Number, or std::nullopt if the text is not a number or overflows
     */
    [[nodiscard]] std::optional<std::uint64_t> toNumber() const;

    /**
     * @brief Approximate memory footprint (object plus heap-allocated text)
     */
    [[nodiscard]] std::size_t getSize() const noexcept;

    bool operator==(const Id& other) const noexcept {
        return value_ == other.value_;
    }

    bool operator!=(const Id& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Id& other) const noexcept {
        return value_ < other.value_;
    }

    bool operator<=(const Id& other) const noexcept {
        return !(other < *this);
    }

    bool operator>(const Id& other) const noexcept {
        return other < *this;
    }

    bool operator>=(const Id& other) const noexcept {
        return !(*this < other);
    }
};

// Mixed comparisons with plain text and labels

inline bool operator==(const Id& id, std::string_view text) noexcept {
    return std::string_view(id.getValue()) == text;
}

inline bool operator==(std::string_view text, const Id& id) noexcept {
    return id == text;
}

inline bool operator!=(const Id& id, std::string_view text) noexcept {
    return !(id == text);
}

inline bool operator!=(std::string_view text, const Id& id) noexcept {
    return !(id == text);
}

inline bool operator<(const Id& id, std::string_view text) noexcept {
    return std::string_view(id.getValue()) < text;
}

inline bool operator<(std::string_view text, const Id& id) noexcept {
    return text < std::string_view(id.getValue());
}

inline bool operator==(const Id& id, const Label& l) noexcept {
    return id == l.getValue();
}

inline bool operator==(const Label& l, const Id& id) noexcept {
    return id == l.getValue();
}

inline bool operator!=(const Id& id, const Label& l) noexcept {
    return !(id == l);
}

inline bool operator!=(const Label& l, const Id& id) noexcept {
    return !(id == l);
}

/**
 * @brief Write the identifier text verbatim (no quoting or escaping)
 */
std::ostream& operator<<(std::ostream& os, const Id& id);

} // namespace hrid

// Hash specialization for Id
namespace std {
    template<>
    struct hash<hrid::Id> {
        size_t operator()(const hrid::Id& id) const {
            return hash<string>()(id.getValue());
        }
    };
}
