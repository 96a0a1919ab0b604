/**
 * @file hash.h
 * @brief Stable content hashing of identifiers (OpenSSL EVP)
 *
 * An Id contributes an 8-byte big-endian length followed by its raw UTF-8
 * bytes, so adjacent fields of a composite structure cannot run into each
 * other. The framing is fixed and platform independent.
 */

#pragma once

#include "hrid/id.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <openssl/evp.h>

namespace hrid {

/// @brief Digest algorithms available for content hashing
enum class HashAlgorithm {
    SHA256,
    SHA384,
    SHA512
};

/// @brief Convert HashAlgorithm to string
inline std::string hashAlgorithmToString(HashAlgorithm a) {
    switch (a) {
        case HashAlgorithm::SHA256: return "sha256";
        case HashAlgorithm::SHA384: return "sha384";
        case HashAlgorithm::SHA512: return "sha512";
    }
    return "unknown";
}

/**
 * @brief Parse "sha256", "sha384" or "sha512" (case-insensitive)
 * @throws std::invalid_argument for any other name
 */
HashAlgorithm hashAlgorithmFromString(const std::string& name);

/**
 * @brief Incremental message digest
 *
 * Owns an EVP_MD_CTX. finalize() returns the digest and re-initializes the
 * context, so the same object can hash several messages in sequence.
 */
class Digest {
private:
    struct CtxDeleter { void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); } };

    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
    const EVP_MD* md_;
    HashAlgorithm algorithm_;

    void init();

public:
    /**
     * @throws DigestException if OpenSSL cannot set up the context
     */
    explicit Digest(HashAlgorithm algorithm = HashAlgorithm::SHA256);

    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;
    Digest(Digest&&) noexcept = default;
    Digest& operator=(Digest&&) noexcept = default;

    void update(const std::uint8_t* data, std::size_t length);
    void update(std::string_view data);

    /**
     * @brief Feed an unsigned 64-bit value in big-endian byte order
     */
    void updateU64(std::uint64_t value);

    /**
     * @brief Finish the current message
     * @return Raw digest bytes (size() bytes)
     */
    std::vector<std::uint8_t> finalize();

    /**
     * @brief Digest length in bytes
     */
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] HashAlgorithm getAlgorithm() const noexcept {
        return algorithm_;
    }
};

/**
 * @brief Feed an identifier into a digest (length-prefixed)
 */
void hashInto(Digest& digest, const Id& id);

/**
 * @brief Feed a sequence of identifiers (count-prefixed, each length-prefixed)
 */
void hashInto(Digest& digest, const std::vector<Id>& ids);

/**
 * @brief Content hash of a single identifier
 */
std::vector<std::uint8_t> contentHash(const Id& id, HashAlgorithm algorithm = HashAlgorithm::SHA256);

/**
 * @brief Content hash of a single identifier as lowercase hex
 */
std::string contentHashHex(const Id& id, HashAlgorithm algorithm = HashAlgorithm::SHA256);

} // namespace hrid
