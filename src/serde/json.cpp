/**
 * @file json.cpp
 * @brief JsonCpp adapter implementation
 */

#include "hrid/serde/json.h"

#include <memory>

namespace hrid {
namespace serde {

namespace {

std::string typeName(const Json::Value& value) {
    switch (value.type()) {
        case Json::nullValue:    return "null";
        case Json::intValue:     return "integer";
        case Json::uintValue:    return "unsigned integer";
        case Json::realValue:    return "number";
        case Json::stringValue:  return "string";
        case Json::booleanValue: return "boolean";
        case Json::arrayValue:   return "array";
        case Json::objectValue:  return "object";
    }
    return "unknown";
}

} // namespace

Json::StreamWriterBuilder compactWriter() {
    Json::StreamWriterBuilder builder;
    builder["commentStyle"] = "None";
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return builder;
}

Json::CharReaderBuilder strictReader() {
    Json::CharReaderBuilder builder;
    builder["allowComments"] = false;
    builder["failIfExtra"] = true;
    builder["rejectDupKeys"] = true;
    return builder;
}

Json::Value toJson(const Id& id) {
    return Json::Value(id.getValue());
}

Id fromJson(const Json::Value& value) {
    if (!value.isString()) {
        throw DeserializationError("expected an identifier string, found " + typeName(value));
    }

    try {
        return Id::of(value.asString());
    } catch (const ValidationError& e) {
        throw DeserializationError("", e);
    }
}

std::string encode(const Id& id) {
    return Json::writeString(compactWriter(), toJson(id));
}

Id decode(std::string_view jsonText) {
    std::unique_ptr<Json::CharReader> reader(strictReader().newCharReader());

    Json::Value value;
    std::string errs;
    const char* begin = jsonText.data();
    const char* end = jsonText.data() + jsonText.size();

    if (!reader->parse(begin, end, &value, &errs)) {
        throw DeserializationError("malformed JSON: " + errs);
    }

    return fromJson(value);
}

} // namespace serde
} // namespace hrid
