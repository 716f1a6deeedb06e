#include "directory/search_filter.hpp"
#include "core/utils.hpp"

namespace ldapauth::filter {

std::string escape_value(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size() * 2);
    for (const char c : value) {
        switch (c) {
            case '*':  escaped += "\\2a"; break;
            case '(':  escaped += "\\28"; break;
            case ')':  escaped += "\\29"; break;
            case '\\': escaped += "\\5c"; break;
            case '\0': escaped += "\\00"; break;
            default:   escaped += c;
        }
    }
    return escaped;
}

std::string wrap(std::string_view expression) {
    std::string trimmed = utils::trim(expression);
    if (trimmed.size() >= 2 && trimmed.front() == '(' && trimmed.back() == ')') {
        return trimmed;
    }
    return "(" + trimmed + ")";
}

std::string equality(std::string_view attribute, std::string_view value) {
    std::string result = "(";
    result += attribute;
    result += '=';
    result += escape_value(value);
    result += ')';
    return result;
}

std::string conjunction(std::initializer_list<std::string_view> expressions) {
    std::string result = "(&";
    for (const auto expr : expressions) {
        result += wrap(expr);
    }
    result += ')';
    return result;
}

} // namespace ldapauth::filter
