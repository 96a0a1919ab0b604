/**
 * @file exceptions.h
 * @brief Exception hierarchy for the hrid library
 *
 * ValidationError is the only content error. The remaining types report
 * collaborator failures (OpenSSL, streams, configuration).
 */

#pragma once

#include "hrid/types.h"

#include <optional>
#include <stdexcept>
#include <string>

namespace hrid {

/**
 * @brief Base exception for all hrid exceptions
 */
class HridException : public std::runtime_error {
private:
    std::string code_;

public:
    HridException(std::string code, const std::string& message)
        : std::runtime_error(message),
          code_(std::move(code)) {}

    /**
     * @brief Get the error code (e.g., "INVALID_ID")
     */
    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }
};

/**
 * @brief Candidate text violates the identifier grammar
 *
 * Carries the violated rule and the offending input verbatim. The what()
 * message echoes a truncated, escaped form of the input.
 */
class ValidationError : public HridException {
private:
    Rule rule_;
    std::string input_;
    std::size_t offset_;

public:
    ValidationError(const ValidationResult& result, std::string input)
        : HridException("INVALID_ID", result.message),
          rule_(result.rule),
          input_(std::move(input)),
          offset_(result.offset) {}

    [[nodiscard]] Rule getRule() const noexcept {
        return rule_;
    }

    /**
     * @brief Get the rejected input, unmodified
     */
    [[nodiscard]] const std::string& getInput() const noexcept {
        return input_;
    }

    /**
     * @brief Byte offset of the violation within the input
     */
    [[nodiscard]] std::size_t getOffset() const noexcept {
        return offset_;
    }
};

/**
 * @brief Decoding an Id from a serialized form failed
 *
 * When the token was well-formed but rejected by the grammar, the underlying
 * ValidationError is attached.
 */
class DeserializationError : public HridException {
private:
    std::optional<ValidationError> cause_;

public:
    explicit DeserializationError(const std::string& message)
        : HridException("DESERIALIZATION_ERROR", "Deserialization error: " + message) {}

    DeserializationError(const std::string& context, const ValidationError& cause)
        : HridException("DESERIALIZATION_ERROR",
                        "Deserialization error: " + context + cause.what()),
          cause_(cause) {}

    /**
     * @brief Get the grammar violation, or nullptr if the token itself was malformed
     */
    [[nodiscard]] const ValidationError* getValidationError() const noexcept {
        return cause_ ? &*cause_ : nullptr;
    }

    [[nodiscard]] Rule getRule() const noexcept {
        return cause_ ? cause_->getRule() : Rule::NONE;
    }
};

/**
 * @brief OpenSSL digest operation failed
 */
class DigestException : public HridException {
public:
    DigestException(std::string code, const std::string& message)
        : HridException(std::move(code), "Digest error: " + message) {}
};

/**
 * @brief Stream read or write failed
 */
class StreamException : public HridException {
public:
    StreamException(std::string code, const std::string& message)
        : HridException(std::move(code), "Stream error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public HridException {
public:
    explicit ConfigException(const std::string& message)
        : HridException("CONFIG_ERROR", "Configuration error: " + message) {}
};

} // namespace hrid
