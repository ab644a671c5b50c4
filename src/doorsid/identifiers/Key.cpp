#include "Key.hpp"
#include <doorsid/core/utils/conversions.hpp>

namespace doorsid

{

    std::optional<Key> Key::tryParse(const std::string &str)
    {
        auto value = parse_hex(str, HEX_WIDTH);
        if (!value) {
            return std::nullopt;
        }
        return Key(static_cast<std::uint32_t>(*value));
    }

    std::string Key::toString() const {
        return format_hex(m_value, HEX_WIDTH);
    }

    std::ostream &operator<<(std::ostream &os, const Key &key) {
        return os << key.toString();
    }

}
