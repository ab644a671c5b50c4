#include "percent_encoding.hpp"

namespace doorsid

{

    static bool is_unreserved(unsigned char c)
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
            || c == '-' || c == '.' || c == '_' || c == '~';
    }

    std::string percent_encode(const std::string &str)
    {
        static constexpr const char *upper_hex = "0123456789ABCDEF";
        std::string result;
        result.reserve(str.size() * 3);
        for (char ch: str) {
            auto c = static_cast<unsigned char>(ch);
            if (is_unreserved(c)) {
                result.push_back(ch);
            } else {
                result.push_back('%');
                result.push_back(upper_hex[c >> 4]);
                result.push_back(upper_hex[c & 0x0f]);
            }
        }
        return result;
    }

}
