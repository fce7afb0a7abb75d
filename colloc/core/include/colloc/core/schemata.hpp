#pragma once

/// @file schemata.hpp
/// @brief Codec for the domain-keyed resource strings of cache/bandwidth partitioning.
///
/// The textual format mirrors one row of the kernel resctrl `schemata`
/// file: `"<resource>:<domain>=<value>(;<domain>=<value>)*"`, for example
/// `"mb:1=20;2=50"`. It is a compatibility boundary and is kept bit-exact.
///
/// Numeric values follow the kernel's own output: bare digits only. A
/// `0x` prefix, a `+` sign or surrounding whitespace is rejected with
/// ParseError rather than tolerated.
///
/// @ingroup core_schemata

#include <string>
#include <string_view>
#include <unordered_map>

namespace colloc::core {

/// @brief Decoded schema row: domain id -> raw partition value.
/// @ingroup core_schemata
using DomainMap = std::unordered_map<std::string, std::string>;

/// @brief Decode one schemata row into its domains.
///
/// The `<resource>:` prefix, if any, is dropped and never reconstructed.
/// An empty line decodes to an empty map ("no change requested").
///
/// @param line Raw schema string such as `"L3:0=ff;1=f0"`.
/// @return Mapping of domain id to raw value.
/// @throws ParseError If an entry lacks `=`, a domain id or value is
///         empty, a domain id repeats, or the line holds no entries.
[[nodiscard]] DomainMap decode_domain_map(std::string_view line);

/// @brief Count the bits set in a hexadecimal mask.
///
/// Turns a cache-way bitmask into the number of ways granted.
///
/// @param hex Hexadecimal digits without prefix (e.g. `"f202"`).
/// @return Population count; 0 for an empty string.
/// @throws ParseError If @p hex contains anything but hexadecimal digits.
[[nodiscard]] int count_enabled_bits(std::string_view hex);

/// @brief Parse a hexadecimal mask into its integer value.
/// @param hex Hexadecimal digits without prefix.
/// @return Integer value of the mask; 0 for an empty string.
/// @throws ParseError If @p hex is not a valid 64-bit hexadecimal number.
[[nodiscard]] unsigned long long parse_hex_mask(std::string_view hex);

/// @brief Parse a decimal partition value (bandwidth percent or MB/s).
///
/// The unit is not carried by the format and is not inferred here.
///
/// @param value Decimal digits, optionally preceded by `-`.
/// @return Parsed integer.
/// @throws ParseError If @p value is not a decimal integer.
[[nodiscard]] long long parse_decimal_value(std::string_view value);

} // namespace colloc::core
