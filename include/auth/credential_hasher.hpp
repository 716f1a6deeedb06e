#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ldapauth {

/**
 * @brief Keyed fingerprints of credentials for use in cache keys
 *
 * HMAC-SHA256 under a random key drawn once per process, so fingerprints
 * held in memory cannot be checked against a password list offline and
 * never match across restarts.
 */
class CredentialHasher {
public:
    /// Process-wide instance with a key from RAND_bytes.
    static const CredentialHasher& instance();

    explicit CredentialHasher(std::vector<uint8_t> key);

    /// Lower-case hex HMAC-SHA256 of the credential.
    [[nodiscard]] std::string fingerprint(std::string_view credential) const;

private:
    static std::vector<uint8_t> random_key(size_t byte_count);

    std::vector<uint8_t> key_;
};

} // namespace ldapauth
