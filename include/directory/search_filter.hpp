#pragma once

#include <initializer_list>
#include <string>
#include <string_view>

namespace ldapauth::filter {

/// Escape an assertion value per RFC 4515 (*, (, ), \ and NUL).
[[nodiscard]] std::string escape_value(std::string_view value);

/// Parenthesise a filter expression unless it already is: "a=b" -> "(a=b)".
[[nodiscard]] std::string wrap(std::string_view expression);

/// "(attr=<escaped value>)"
[[nodiscard]] std::string equality(std::string_view attribute, std::string_view value);

/// "(&(a)(b)...)" from already-built or bare expressions.
[[nodiscard]] std::string conjunction(std::initializer_list<std::string_view> expressions);

} // namespace ldapauth::filter
