#pragma once

#include <optional>
#include <ostream>
#include <string>
#include "TypeCode.hpp"
#include "Key.hpp"

namespace doorsid

{

    // The container reference of a GUID: type byte + 32-bit key (10 hex digits on the wire)
    class ParentKey
    {
    public:
        static constexpr std::size_t HEX_WIDTH = TypeCode::HEX_WIDTH + Key::HEX_WIDTH;

        ParentKey() = default;
        ParentKey(TypeCode, Key);

        // exactly 10 hex digits
        static std::optional<ParentKey> tryParse(const std::string &);

        inline TypeCode getType() const {
            return m_type;
        }

        inline Key getKey() const {
            return m_key;
        }

        std::string toString() const;

        bool operator==(const ParentKey &other) const;
        bool operator!=(const ParentKey &other) const;
        bool operator<(const ParentKey &other) const;

    private:
        TypeCode m_type;
        Key m_key;
    };

    std::ostream &operator<<(std::ostream &, const ParentKey &);

}
