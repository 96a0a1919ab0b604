/**
 * @file stream.h
 * @brief Streaming encode/decode of identifiers
 *
 * Identifiers travel as JSON string tokens (sequences as JSON arrays) over
 * standard streams. The asynchronous variants run the same operation on a
 * separate task; they only ever wait on the stream's own I/O.
 */

#pragma once

#include "hrid/id.h"

#include <future>
#include <istream>
#include <ostream>
#include <vector>

namespace hrid {
namespace stream {

/**
 * @brief Write one identifier as a JSON string token
 * @throws StreamException if the stream fails
 */
void writeId(std::ostream& os, const Id& id);

/**
 * @brief Read one identifier from a stream holding a single JSON string token
 * @throws DeserializationError on malformed input or a grammar violation
 */
Id readId(std::istream& is);

/**
 * @brief Write identifiers as a JSON array of strings
 * @throws StreamException if the stream fails
 */
void writeIds(std::ostream& os, const std::vector<Id>& ids);

/**
 * @brief Read a JSON array of identifier strings
 *
 * Every element is validated; the error message names the failing index.
 *
 * @throws DeserializationError on malformed input or a grammar violation
 */
std::vector<Id> readIds(std::istream& is);

/**
 * @brief Asynchronous writeId
 *
 * The stream must stay alive until the returned future is ready.
 */
std::future<void> writeIdAsync(std::ostream& os, Id id);

/**
 * @brief Asynchronous readId
 *
 * The stream must stay alive until the returned future is ready. Errors are
 * delivered through the future.
 */
std::future<Id> readIdAsync(std::istream& is);

} // namespace stream
} // namespace hrid
