/**
 * @file json.h
 * @brief JsonCpp encoding of identifiers
 *
 * An Id is encoded as a bare JSON string. Decoding re-runs the grammar
 * checker; invalid text is never coerced or truncated.
 */

#pragma once

#include "hrid/id.h"

#include <string>
#include <string_view>
#include <json/json.h>

namespace hrid {
namespace serde {

/**
 * @brief Encode as a JSON string value
 */
Json::Value toJson(const Id& id);

/**
 * @brief Decode from a JSON value
 * @throws DeserializationError if the value is not a string or fails validation
 */
Id fromJson(const Json::Value& value);

/**
 * @brief Encode as compact JSON text (non-ASCII emitted as raw UTF-8)
 */
std::string encode(const Id& id);

/**
 * @brief Decode from JSON text
 * @throws DeserializationError on malformed JSON, a non-string token, or
 *         text rejected by the grammar
 */
Id decode(std::string_view jsonText);

/**
 * @brief Writer settings used for every encoded token
 */
Json::StreamWriterBuilder compactWriter();

/**
 * @brief Reader settings used for every decoded token
 *
 * Comments and any content after the first value are rejected, so a token
 * is never silently truncated to its leading part.
 */
Json::CharReaderBuilder strictReader();

} // namespace serde
} // namespace hrid
