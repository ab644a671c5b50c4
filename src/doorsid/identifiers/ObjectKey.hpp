#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include "Key.hpp"

namespace doorsid

{

    /**
     * The object field of a GUID: either the whole container sentinel (28ffffffff)
     * or an absolute object number (28 + 8 hex digits)
    */
    class ObjectKey
    {
    public:
        enum class Type: std::uint8_t
        {
            WHOLE_CONTAINER = 0,
            ABSOLUTE = 1
        };

        static constexpr const char *PREFIX = "28";
        static constexpr std::uint32_t WHOLE_CONTAINER_VALUE = 0xffffffff;
        static constexpr std::size_t WIRE_WIDTH = 2 + Key::HEX_WIDTH;

        static ObjectKey wholeContainer();

        // InputException if the key is the whole-container sentinel
        static ObjectKey absolute(Key);

        // "28" + 8 hex digits, the sentinel value maps to the whole container
        static std::optional<ObjectKey> tryParse(const std::string &);

        inline Type getType() const {
            return m_type;
        }

        inline bool isWholeContainer() const {
            return m_type == Type::WHOLE_CONTAINER;
        }

        inline bool isAbsolute() const {
            return m_type == Type::ABSOLUTE;
        }

        // absolute object key, InternalException for the whole container
        Key getKey() const;

        // the key as written on the wire (sentinel included)
        Key getRawKey() const;

        std::string toString() const;

        bool operator==(const ObjectKey &other) const;
        bool operator!=(const ObjectKey &other) const;

    private:
        Type m_type;
        Key m_key;

        ObjectKey(Type, Key);
    };

    std::ostream &operator<<(std::ostream &, const ObjectKey &);

}
