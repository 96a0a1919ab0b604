/**
 * @file id.cpp
 * @brief Identifier value type implementation
 */

#include "hrid/id.h"
#include "hrid/grammar.h"

#include <charconv>

namespace hrid {

Id Id::of(std::string_view text) {
    ValidationResult result = checkGrammar(text);
    if (!result.valid) {
        throw ValidationError(result, std::string(text));
    }
    return Id(std::string(text));
}

std::optional<Id> Id::tryOf(std::string_view text) {
    if (!isValid(text)) {
        return std::nullopt;
    }
    return Id(std::string(text));
}

bool Id::canCastFrom(std::string_view text) {
    return isValid(text);
}

Id Id::fromNumber(std::uint64_t number) {
    return Id(std::to_string(number));
}

Id::Id(const Label& label) : Id(of(label.getValue())) {}

bool Id::startsWith(std::string_view prefix) const noexcept {
    return std::string_view(value_).substr(0, prefix.size()) == prefix;
}

std::optional<std::uint64_t> Id::toNumber() const {
    std::uint64_t number = 0;
    const char* first = value_.data();
    const char* last = value_.data() + value_.size();

    auto [ptr, ec] = std::from_chars(first, last, number);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return number;
}

std::size_t Id::getSize() const noexcept {
    // Short strings live inside the object; count the buffer anyway
    return sizeof(Id) + value_.capacity();
}

std::ostream& operator<<(std::ostream& os, const Id& id) {
    return os << id.getValue();
}

} // namespace hrid
