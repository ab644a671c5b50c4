#include "ObjectKey.hpp"
#include <doorsid/core/exception/Exceptions.hpp>
#include <doorsid/core/utils/conversions.hpp>

namespace doorsid

{

    ObjectKey::ObjectKey(Type type, Key key)
        : m_type(type)
        , m_key(key)
    {
    }

    ObjectKey ObjectKey::wholeContainer() {
        return ObjectKey(Type::WHOLE_CONTAINER, Key(WHOLE_CONTAINER_VALUE));
    }

    ObjectKey ObjectKey::absolute(Key key)
    {
        if (key.getValue() == WHOLE_CONTAINER_VALUE) {
            THROWF(doorsid::InputException) << "Absolute object key must not be the whole-container value: " << key << THROWF_END;
        }
        return ObjectKey(Type::ABSOLUTE, key);
    }

    std::optional<ObjectKey> ObjectKey::tryParse(const std::string &str)
    {
        if (str.size() != WIRE_WIDTH || !starts_with(str, PREFIX)) {
            return std::nullopt;
        }
        auto key = Key::tryParse(str.substr(2));
        if (!key) {
            return std::nullopt;
        }
        if (key->getValue() == WHOLE_CONTAINER_VALUE) {
            return wholeContainer();
        }
        return ObjectKey(Type::ABSOLUTE, *key);
    }

    Key ObjectKey::getKey() const
    {
        if (m_type != Type::ABSOLUTE) {
            THROWF(doorsid::InternalException) << "Whole-container object key has no absolute key" << THROWF_END;
        }
        return m_key;
    }

    Key ObjectKey::getRawKey() const {
        return m_key;
    }

    std::string ObjectKey::toString() const {
        return PREFIX + m_key.toString();
    }

    bool ObjectKey::operator==(const ObjectKey &other) const {
        return m_type == other.m_type && m_key == other.m_key;
    }

    bool ObjectKey::operator!=(const ObjectKey &other) const {
        return !(*this == other);
    }

    std::ostream &operator<<(std::ostream &os, const ObjectKey &object_key) {
        return os << object_key.toString();
    }

}
