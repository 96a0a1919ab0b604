/**
 * @file uuid.cpp
 * @brief libuuid conversions
 */

#include "hrid/uuid.h"

#include <stdexcept>
#include <string>

namespace hrid {

Id fromUuid(const uuid_t uuid) {
    char str[UUID_STRING_LENGTH + 1];
    uuid_unparse_lower(uuid, str);

    return Id::of(str);
}

Id fromUuidString(std::string_view text) {
    // uuid_parse needs a NUL-terminated buffer
    const std::string buffer(text);

    uuid_t uuid;
    if (buffer.length() != UUID_STRING_LENGTH || uuid_parse(buffer.c_str(), uuid) != 0) {
        throw std::invalid_argument("Not a valid UUID: " + buffer);
    }

    return fromUuid(uuid);
}

Id newRandomId() {
    uuid_t uuid;
    uuid_generate_random(uuid);

    return fromUuid(uuid);
}

bool isCanonicalUuid(const Id& id) {
    const std::string& value = id.getValue();
    if (value.length() != UUID_STRING_LENGTH) {
        return false;
    }

    for (std::size_t i = 0; i < value.length(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (value[i] != '-') {
                return false;
            }
        } else {
            char c = value[i];
            if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
                return false;
            }
        }
    }

    return true;
}

bool toUuid(const Id& id, uuid_t out) {
    if (!isCanonicalUuid(id)) {
        return false;
    }
    return uuid_parse(id.getValue().c_str(), out) == 0;
}

} // namespace hrid
