#include "Urn.hpp"
#include "UrnCodec.hpp"
#include <doorsid/core/exception/Exceptions.hpp>

namespace doorsid

{

    static constexpr const char *RATIONAL_TOKEN = "rational";
    static constexpr const char *TELELOGIC_TOKEN = "telelogic";

    char toLetter(UrnKind kind) {
        return static_cast<char>(kind);
    }

    std::optional<UrnKind> urnKindFromLetter(char letter)
    {
        switch (letter) {
            case 'P':
                return UrnKind::PROJECT_ROOT;
            case 'F':
                return UrnKind::FOLDER;
            case 'M':
                return UrnKind::FORMAL_MODULE;
            case 'O':
                return UrnKind::OBJECT;
            default:
                return std::nullopt;
        }
    }

    const char *toToken(UrnScheme scheme)
    {
        switch (scheme) {
            case UrnScheme::RATIONAL:
                return RATIONAL_TOKEN;
            case UrnScheme::TELELOGIC:
                return TELELOGIC_TOKEN;
        }
        THROWF(doorsid::InternalException) << "Invalid URN scheme: " << static_cast<int>(scheme) << THROWF_END;
    }

    std::optional<UrnScheme> urnSchemeFromToken(const std::string &token)
    {
        if (token == RATIONAL_TOKEN) {
            return UrnScheme::RATIONAL;
        }
        if (token == TELELOGIC_TOKEN) {
            return UrnScheme::TELELOGIC;
        }
        return std::nullopt;
    }

    std::ostream &operator<<(std::ostream &os, UrnKind kind) {
        return os << toLetter(kind);
    }

    std::ostream &operator<<(std::ostream &os, UrnScheme scheme) {
        return os << toToken(scheme);
    }

    UrnId::UrnId(Type type, Key key, std::uint64_t abs_no)
        : m_type(type)
        , m_key(key)
        , m_abs_no(abs_no)
    {
    }

    UrnId UrnId::simple(Key key) {
        return UrnId(Type::SIMPLE, key, 0);
    }

    UrnId UrnId::objectRef(std::uint64_t abs_no, Key module_key) {
        return UrnId(Type::OBJECT_REF, module_key, abs_no);
    }

    Key UrnId::getKey() const
    {
        if (m_type != Type::SIMPLE) {
            THROWF(doorsid::InternalException) << "Object URN has no simple key, use getModuleKey" << THROWF_END;
        }
        return m_key;
    }

    std::uint64_t UrnId::getAbsNo() const
    {
        if (m_type != Type::OBJECT_REF) {
            THROWF(doorsid::InternalException) << "Absolute number requested from a non-object URN" << THROWF_END;
        }
        return m_abs_no;
    }

    Key UrnId::getModuleKey() const
    {
        if (m_type != Type::OBJECT_REF) {
            THROWF(doorsid::InternalException) << "Module key requested from a non-object URN" << THROWF_END;
        }
        return m_key;
    }

    bool UrnId::operator==(const UrnId &other) const {
        return m_type == other.m_type && m_key == other.m_key && m_abs_no == other.m_abs_no;
    }

    bool UrnId::operator!=(const UrnId &other) const {
        return !(*this == other);
    }

    Urn::Urn(UrnScheme scheme, DatabaseId db_id, UrnKind kind, UrnId id)
        : m_scheme(scheme)
        , m_db_id(db_id)
        , m_kind(kind)
        , m_id(id)
    {
        auto expected = (kind == UrnKind::OBJECT) ? UrnId::Type::OBJECT_REF : UrnId::Type::SIMPLE;
        if (id.getType() != expected) {
            THROWF(doorsid::InputException) << "URN id does not match the kind '" << kind << "'" << THROWF_END;
        }
    }

    Urn Urn::fromString(const std::string &str) {
        return UrnCodec::parse(str);
    }

    std::string Urn::toString() const {
        return UrnCodec::format(*this);
    }

    bool Urn::operator==(const Urn &other) const
    {
        return m_scheme == other.m_scheme && m_db_id == other.m_db_id && m_kind == other.m_kind
            && m_id == other.m_id;
    }

    bool Urn::operator!=(const Urn &other) const {
        return !(*this == other);
    }

    std::ostream &operator<<(std::ostream &os, const Urn &urn) {
        return os << urn.toString();
    }

}
