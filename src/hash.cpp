/**
 * @file hash.cpp
 * @brief OpenSSL-backed content hashing
 */

#include "hrid/hash.h"
#include "hrid/utils/string_utils.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <openssl/err.h>
#include <spdlog/spdlog.h>

namespace hrid {

namespace {

const EVP_MD* mdFor(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA256: return EVP_sha256();
        case HashAlgorithm::SHA384: return EVP_sha384();
        case HashAlgorithm::SHA512: return EVP_sha512();
    }
    return nullptr;
}

std::string lastOpenSslError() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return buf;
}

[[noreturn]] void fail(const std::string& code, const std::string& what) {
    std::string detail = what + ": " + lastOpenSslError();
    spdlog::error("[Digest] {}", detail);
    throw DigestException(code, detail);
}

} // namespace

HashAlgorithm hashAlgorithmFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "sha256" || lower == "sha-256") {
        return HashAlgorithm::SHA256;
    } else if (lower == "sha384" || lower == "sha-384") {
        return HashAlgorithm::SHA384;
    } else if (lower == "sha512" || lower == "sha-512") {
        return HashAlgorithm::SHA512;
    }
    throw std::invalid_argument("Unsupported hash algorithm: " + name);
}

Digest::Digest(HashAlgorithm algorithm)
    : ctx_(EVP_MD_CTX_new()),
      md_(mdFor(algorithm)),
      algorithm_(algorithm) {
    if (!ctx_) {
        fail("DIGEST_INIT_ERROR", "Failed to create EVP_MD_CTX");
    }
    init();
}

void Digest::init() {
    if (EVP_DigestInit_ex(ctx_.get(), md_, nullptr) != 1) {
        fail("DIGEST_INIT_ERROR", "Failed to initialize " + hashAlgorithmToString(algorithm_));
    }
}

void Digest::update(const std::uint8_t* data, std::size_t length) {
    if (length == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
        fail("DIGEST_UPDATE_ERROR", "Failed to update " + hashAlgorithmToString(algorithm_));
    }
}

void Digest::update(std::string_view data) {
    update(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

void Digest::updateU64(std::uint64_t value) {
    std::uint8_t bytes[8];
    for (int i = 7; i >= 0; --i) {
        bytes[i] = static_cast<std::uint8_t>(value & 0xFF);
        value >>= 8;
    }
    update(bytes, sizeof(bytes));
}

std::vector<std::uint8_t> Digest::finalize() {
    std::vector<std::uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1) {
        fail("DIGEST_FINAL_ERROR", "Failed to finalize " + hashAlgorithmToString(algorithm_));
    }
    out.resize(len);

    init();
    return out;
}

std::size_t Digest::size() const {
    return static_cast<std::size_t>(EVP_MD_size(md_));
}

void hashInto(Digest& digest, const Id& id) {
    const std::string& value = id.getValue();
    digest.updateU64(static_cast<std::uint64_t>(value.size()));
    digest.update(value);
}

void hashInto(Digest& digest, const std::vector<Id>& ids) {
    digest.updateU64(static_cast<std::uint64_t>(ids.size()));
    for (const auto& id : ids) {
        hashInto(digest, id);
    }
}

std::vector<std::uint8_t> contentHash(const Id& id, HashAlgorithm algorithm) {
    Digest digest(algorithm);
    hashInto(digest, id);
    return digest.finalize();
}

std::string contentHashHex(const Id& id, HashAlgorithm algorithm) {
    return utils::bytesToHex(contentHash(id, algorithm));
}

} // namespace hrid
