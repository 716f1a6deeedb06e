#include "directory/dn_parser.hpp"
#include "core/utils.hpp"

namespace ldapauth::dn {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Strip unescaped trailing spaces; escaped_end marks how far escapes reached.
void trim_value_end(std::string& value, size_t escaped_end) {
    while (value.size() > escaped_end && value.back() == ' ') {
        value.pop_back();
    }
}

} // anonymous namespace

std::optional<std::vector<RdnComponent>> parse(std::string_view dn) {
    std::vector<RdnComponent> components;
    if (utils::trim(dn).empty()) return std::nullopt;

    size_t i = 0;
    const size_t n = dn.size();

    while (i < n) {
        // Attribute type: everything up to '='
        while (i < n && dn[i] == ' ') ++i;
        const size_t type_start = i;
        while (i < n && dn[i] != '=' && dn[i] != ',' && dn[i] != '+') ++i;
        if (i >= n || dn[i] != '=') return std::nullopt;

        std::string type = utils::trim(dn.substr(type_start, i - type_start));
        if (type.empty()) return std::nullopt;
        ++i;  // skip '='

        // Attribute value: up to the next unescaped separator
        while (i < n && dn[i] == ' ') ++i;
        std::string value;
        size_t escaped_end = 0;
        bool quoted = false;
        if (i < n && dn[i] == '"') {
            quoted = true;
            ++i;
        }

        bool terminated = false;
        while (i < n) {
            const char c = dn[i];
            if (c == '\\') {
                if (i + 1 >= n) return std::nullopt;
                const int hi = hex_value(dn[i + 1]);
                const int lo = (i + 2 < n) ? hex_value(dn[i + 2]) : -1;
                if (hi >= 0 && lo >= 0) {
                    value += static_cast<char>((hi << 4) | lo);
                    i += 3;
                } else {
                    value += dn[i + 1];
                    i += 2;
                }
                escaped_end = value.size();
                continue;
            }
            if (quoted) {
                if (c == '"') {
                    quoted = false;
                    escaped_end = value.size();
                    ++i;
                    continue;
                }
                value += c;
                ++i;
                continue;
            }
            if (c == ',' || c == ';' || c == '+') {
                terminated = true;
                break;
            }
            value += c;
            ++i;
        }
        if (quoted) return std::nullopt;

        trim_value_end(value, escaped_end);
        components.push_back({std::move(type), std::move(value)});

        if (terminated) {
            ++i;  // skip separator
            if (i >= n) return std::nullopt;  // trailing separator
        }
    }

    if (components.empty()) return std::nullopt;
    return components;
}

std::optional<std::string> extract_cn(std::string_view dn) {
    const auto components = parse(dn);
    if (!components) return std::nullopt;

    for (const auto& component : *components) {
        if (utils::iequals(component.type, "cn")) {
            return component.value;
        }
    }
    return std::nullopt;
}

} // namespace ldapauth::dn
