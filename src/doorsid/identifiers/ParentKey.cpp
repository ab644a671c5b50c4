#include "ParentKey.hpp"
#include <doorsid/core/utils/conversions.hpp>

namespace doorsid

{

    ParentKey::ParentKey(TypeCode type, Key key)
        : m_type(type)
        , m_key(key)
    {
    }

    std::optional<ParentKey> ParentKey::tryParse(const std::string &str)
    {
        // validate the full width first so a bad key digit is not reported as a bad type
        if (!parse_hex(str, HEX_WIDTH)) {
            return std::nullopt;
        }
        auto type = TypeCode::tryParse(str.substr(0, TypeCode::HEX_WIDTH));
        auto key = Key::tryParse(str.substr(TypeCode::HEX_WIDTH));
        if (!type || !key) {
            return std::nullopt;
        }
        return ParentKey(*type, *key);
    }

    std::string ParentKey::toString() const {
        return m_type.toString() + m_key.toString();
    }

    bool ParentKey::operator==(const ParentKey &other) const {
        return m_type == other.m_type && m_key == other.m_key;
    }

    bool ParentKey::operator!=(const ParentKey &other) const {
        return !(*this == other);
    }

    bool ParentKey::operator<(const ParentKey &other) const {
        return m_type < other.m_type || (m_type == other.m_type && m_key < other.m_key);
    }

    std::ostream &operator<<(std::ostream &os, const ParentKey &parent) {
        return os << parent.toString();
    }

}
