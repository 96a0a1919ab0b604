/**
 * @file nlohmann.h
 * @brief nlohmann::json support for identifiers
 *
 * Header-only. Id has no default constructor, so conversion goes through
 * an adl_serializer specialization:
 *
 * @code
 * nlohmann::json j = hrid::Id::of("my-service");   // "my-service"
 * auto id = j.get<hrid::Id>();                     // validated
 * @endcode
 */

#pragma once

#include "hrid/id.h"

#include <string>
#include <nlohmann/json.hpp>

namespace nlohmann {

template<>
struct adl_serializer<hrid::Id> {
    static void to_json(json& j, const hrid::Id& id) {
        j = id.getValue();
    }

    /**
     * @throws hrid::DeserializationError if j is not a string or fails validation
     */
    static hrid::Id from_json(const json& j) {
        if (!j.is_string()) {
            throw hrid::DeserializationError(
                std::string("expected an identifier string, found ") + j.type_name());
        }

        try {
            return hrid::Id::of(j.get_ref<const std::string&>());
        } catch (const hrid::ValidationError& e) {
            throw hrid::DeserializationError("", e);
        }
    }
};

} // namespace nlohmann
