#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace doorsid

{

    bool is_hex_digit(char c);

    /**
     * Parse hex digits (case insensitive), the whole string must be consumed
     * @return nullopt if empty, longer than 16 digits or contains a non-hex character
    */
    std::optional<std::uint64_t> parse_hex(const std::string &str);

    // as above but the string must have exactly 'width' digits
    std::optional<std::uint64_t> parse_hex(const std::string &str, std::size_t width);

    /**
     * Parse a non-empty sequence of decimal digits (no sign, no whitespace)
     * @return nullopt on any other character or on 64-bit overflow
    */
    std::optional<std::uint64_t> parse_decimal(const std::string &str);

    // lowercase hex, zero-padded to 'width' digits
    std::string format_hex(std::uint64_t value, unsigned int width);

    // splits on every occurrence of the separator (empty fields preserved)
    std::vector<std::string> split(const std::string &str, char separator);

    bool starts_with(const std::string &str, const std::string &prefix);
    
}
