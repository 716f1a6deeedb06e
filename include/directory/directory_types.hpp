#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ldapauth {

enum class SearchScope {
    ONE_LEVEL,
    SUBTREE
};

[[nodiscard]] inline constexpr const char* scope_name(SearchScope scope) {
    return scope == SearchScope::SUBTREE ? "SUBTREE" : "LEVEL";
}

/**
 * @brief One entry returned by a directory search
 *
 * dn is empty when the server returned an entry without a usable
 * distinguished name. Attribute names keep the server's spelling.
 */
struct DirectoryEntry {
    std::optional<std::string> dn;
    std::map<std::string, std::vector<std::string>> attributes;

    /// Values of an attribute, matched case-insensitively. nullptr if absent.
    [[nodiscard]] const std::vector<std::string>* find_attribute(const std::string& name) const;
};

/**
 * @brief Outcome of a search that reached the server
 *
 * succeeded is the protocol result indicator; it is false for a rejected
 * filter or a missing base even though no transport error happened.
 */
struct SearchResult {
    bool succeeded = false;
    std::vector<DirectoryEntry> entries;
    std::string diagnostic;
};

/**
 * @brief Where and how to reach the directory server
 */
struct DirectoryServerOptions {
    std::string uri;
    std::optional<std::string> ca_cert_file;   // absent: library default trust store
    bool start_tls = false;                    // upgrade ldap:// URIs
    std::chrono::milliseconds timeout{5000};   // connect, bind and search bound
    bool ignore_malformed_schema = false;
};

} // namespace ldapauth
