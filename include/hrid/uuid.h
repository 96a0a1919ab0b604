/**
 * @file uuid.h
 * @brief Conversions between Id and UUIDs (libuuid)
 *
 * The canonical UUID text form (36 characters, lowercase hex, hyphenated)
 * is always a legal identifier.
 */

#pragma once

#include "hrid/id.h"

#include <string_view>
#include <uuid/uuid.h>

namespace hrid {

/// Length of the canonical UUID text form
inline constexpr std::size_t UUID_STRING_LENGTH = 36;

/**
 * @brief Identifier for a binary UUID
 *
 * @param uuid 16-byte UUID
 * @return Id with the canonical lowercase hyphenated text
 */
Id fromUuid(const uuid_t uuid);

/**
 * @brief Identifier for a UUID given as text
 *
 * Accepts upper- or lowercase hex; the result is always canonical lowercase.
 *
 * @throws std::invalid_argument if the text is not a UUID
 */
Id fromUuidString(std::string_view text);

/**
 * @brief Identifier for a freshly generated random (v4) UUID
 */
Id newRandomId();

/**
 * @brief Check if the identifier is a UUID in canonical lowercase form
 */
bool isCanonicalUuid(const Id& id);

/**
 * @brief Recover the binary UUID from a canonical UUID identifier
 *
 * @param id Identifier
 * @param out Receives the UUID bytes on success
 * @return false if the identifier is not a canonical UUID
 */
bool toUuid(const Id& id, uuid_t out);

} // namespace hrid
