/**
 * @file stream.cpp
 * @brief Streaming adapter built on JsonCpp stream reader/writer
 */

#include "hrid/stream.h"
#include "hrid/serde/json.h"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace hrid {
namespace stream {

namespace {

void writeValue(std::ostream& os, const Json::Value& value) {
    if (!os) {
        throw StreamException("STREAM_WRITE_FAILED", "output stream is not writable");
    }

    std::unique_ptr<Json::StreamWriter> writer(serde::compactWriter().newStreamWriter());
    writer->write(value, &os);

    if (!os) {
        spdlog::error("[Stream] Failed to write identifier token");
        throw StreamException("STREAM_WRITE_FAILED", "failed to write to output stream");
    }
}

Json::Value readValue(std::istream& is) {
    if (!is) {
        throw StreamException("STREAM_READ_FAILED", "input stream is not readable");
    }

    Json::Value value;
    std::string errs;

    const bool ok = Json::parseFromStream(serde::strictReader(), is, &value, &errs);
    if (is.bad()) {
        spdlog::error("[Stream] Failed to read identifier token");
        throw StreamException("STREAM_READ_FAILED", "failed to read from input stream");
    }
    if (!ok) {
        throw DeserializationError("malformed JSON: " + errs);
    }
    return value;
}

} // namespace

void writeId(std::ostream& os, const Id& id) {
    writeValue(os, serde::toJson(id));
}

Id readId(std::istream& is) {
    return serde::fromJson(readValue(is));
}

void writeIds(std::ostream& os, const std::vector<Id>& ids) {
    Json::Value array(Json::arrayValue);
    for (const auto& id : ids) {
        array.append(serde::toJson(id));
    }
    writeValue(os, array);
}

std::vector<Id> readIds(std::istream& is) {
    const Json::Value value = readValue(is);
    if (!value.isArray()) {
        throw DeserializationError("expected an array of identifiers");
    }

    std::vector<Id> ids;
    ids.reserve(value.size());

    for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
        const Json::Value& element = value[i];
        if (!element.isString()) {
            throw DeserializationError("element " + std::to_string(i) + " is not a string");
        }

        try {
            ids.push_back(Id::of(element.asString()));
        } catch (const ValidationError& e) {
            throw DeserializationError("element " + std::to_string(i) + ": ", e);
        }
    }

    return ids;
}

std::future<void> writeIdAsync(std::ostream& os, Id id) {
    return std::async(std::launch::async, [&os, id = std::move(id)]() {
        writeId(os, id);
    });
}

std::future<Id> readIdAsync(std::istream& is) {
    return std::async(std::launch::async, [&is]() {
        return readId(is);
    });
}

} // namespace stream
} // namespace hrid
