#include "auth/credential_hasher.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <format>
#include <stdexcept>

namespace ldapauth {

const CredentialHasher& CredentialHasher::instance() {
    static const CredentialHasher hasher(random_key(32));
    return hasher;
}

CredentialHasher::CredentialHasher(std::vector<uint8_t> key)
    : key_(std::move(key)) {
    if (key_.empty()) {
        throw std::invalid_argument("CredentialHasher key must not be empty");
    }
}

std::vector<uint8_t> CredentialHasher::random_key(size_t byte_count) {
    std::vector<uint8_t> key(byte_count);
    if (RAND_bytes(key.data(), static_cast<int>(byte_count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return key;
}

std::string CredentialHasher::fingerprint(std::string_view credential) const {
    uint8_t digest[SHA256_DIGEST_LENGTH];
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(),
              key_.data(), static_cast<int>(key_.size()),
              reinterpret_cast<const uint8_t*>(credential.data()),
              credential.size(),
              digest, &len)) {
        throw std::runtime_error("HMAC failed");
    }

    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex += std::format("{:02x}", digest[i]);
    }
    return hex;
}

} // namespace ldapauth
