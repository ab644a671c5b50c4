#include "conversions.hpp"
#include <limits>

namespace doorsid

{

    static constexpr const char *hex_chars = "0123456789abcdef";

    static int hex_value(char c)
    {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }

    bool is_hex_digit(char c) {
        return hex_value(c) >= 0;
    }

    std::optional<std::uint64_t> parse_hex(const std::string &str)
    {
        if (str.empty() || str.size() > 16) {
            return std::nullopt;
        }
        std::uint64_t result = 0;
        for (char c: str) {
            auto value = hex_value(c);
            if (value < 0) {
                return std::nullopt;
            }
            result = (result << 4) | static_cast<std::uint64_t>(value);
        }
        return result;
    }

    std::optional<std::uint64_t> parse_hex(const std::string &str, std::size_t width)
    {
        if (str.size() != width) {
            return std::nullopt;
        }
        return parse_hex(str);
    }

    std::optional<std::uint64_t> parse_decimal(const std::string &str)
    {
        if (str.empty()) {
            return std::nullopt;
        }
        constexpr auto max_value = std::numeric_limits<std::uint64_t>::max();
        std::uint64_t result = 0;
        for (char c: str) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            std::uint64_t digit = c - '0';
            if (result > (max_value - digit) / 10) {
                return std::nullopt;
            }
            result = result * 10 + digit;
        }
        return result;
    }

    std::string format_hex(std::uint64_t value, unsigned int width)
    {
        std::string result(width, '0');
        for (auto it = result.rbegin(); it != result.rend() && value; ++it) {
            *it = hex_chars[value & 0xf];
            value >>= 4;
        }
        return result;
    }

    std::vector<std::string> split(const std::string &str, char separator)
    {
        std::vector<std::string> result;
        std::string::size_type begin = 0;
        for (;;) {
            auto end = str.find(separator, begin);
            if (end == std::string::npos) {
                result.push_back(str.substr(begin));
                break;
            }
            result.push_back(str.substr(begin, end - begin));
            begin = end + 1;
        }
        return result;
    }

    bool starts_with(const std::string &str, const std::string &prefix) {
        return str.compare(0, prefix.size(), prefix) == 0;
    }

}
