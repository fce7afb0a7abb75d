#include <colloc/core/schemata.hpp>
#include <colloc/core/error.hpp>

#include <bit>
#include <charconv>
#include <string>
#include <system_error>

namespace colloc::core {

namespace {

constexpr char RESOURCE_ID_SEPARATOR = ':';
constexpr char DOMAIN_SEPARATOR = ';';
constexpr char VALUE_SEPARATOR = '=';

template<typename T>
bool parse_whole(std::string_view text, T& out, int base) {
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out, base);
    return ec == std::errc{} && ptr == last;
}

} // anonymous namespace

DomainMap decode_domain_map(std::string_view line) {
    DomainMap domains;

    // Empty line means "no change requested"
    if (line.empty()) {
        return domains;
    }

    const std::string original(line);

    // Drop resource identifier prefix like "mb:"
    if (auto colon = line.find(RESOURCE_ID_SEPARATOR); colon != std::string_view::npos) {
        line.remove_prefix(colon + 1);
    }

    std::size_t start = 0;
    while (true) {
        std::size_t stop = line.find(DOMAIN_SEPARATOR, start);
        std::string_view entry = line.substr(
            start, stop == std::string_view::npos ? std::string_view::npos : stop - start);

        if (entry.empty()) {
            throw ParseError("domain cannot be empty", original);
        }
        auto eq = entry.find(VALUE_SEPARATOR);
        if (eq == std::string_view::npos) {
            throw ParseError("value separator '=' is missing", original);
        }
        std::string_view domain_id = entry.substr(0, eq);
        std::string_view value = entry.substr(eq + 1);
        if (domain_id.empty()) {
            throw ParseError("domain id cannot be empty", original);
        }
        if (value.empty()) {
            throw ParseError("value cannot be empty", original);
        }

        auto [it, inserted] = domains.emplace(std::string(domain_id), std::string(value));
        if (!inserted) {
            throw ParseError("conflicting domain id '" + it->first + "'", original);
        }

        if (stop == std::string_view::npos) {
            break;
        }
        start = stop + 1;
    }

    return domains;
}

unsigned long long parse_hex_mask(std::string_view hex) {
    if (hex.empty()) {
        return 0;
    }
    unsigned long long value = 0;
    if (!parse_whole(hex, value, 16)) {
        throw ParseError("invalid hexadecimal mask", std::string(hex));
    }
    return value;
}

int count_enabled_bits(std::string_view hex) {
    return std::popcount(parse_hex_mask(hex));
}

long long parse_decimal_value(std::string_view value) {
    long long result = 0;
    if (!parse_whole(value, result, 10)) {
        throw ParseError("invalid decimal value", std::string(value));
    }
    return result;
}

} // namespace colloc::core
