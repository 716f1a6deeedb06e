#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ldapauth::dn {

struct RdnComponent {
    std::string type;
    std::string value;  // unescaped
};

/**
 * @brief Split a distinguished name into its attribute=value components
 *
 * Follows RFC 4514 escaping: "\," "\+" "\\" and "\XX" hex pairs are
 * decoded, unescaped commas and plus signs separate components, whitespace
 * around separators is ignored. Multi-valued RDNs ("cn=a+uid=b") yield one
 * component per attribute.
 *
 * @return nullopt for an empty DN, a component without '=', an empty type or
 *         a dangling escape
 */
[[nodiscard]] std::optional<std::vector<RdnComponent>> parse(std::string_view dn);

/**
 * @brief Value of the first "cn" component (type matched case-insensitively)
 * @return nullopt when the DN is malformed or has no cn component
 */
[[nodiscard]] std::optional<std::string> extract_cn(std::string_view dn);

} // namespace ldapauth::dn
