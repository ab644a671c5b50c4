#include "TypeCode.hpp"
#include <doorsid/core/exception/Exceptions.hpp>
#include <doorsid/core/utils/conversions.hpp>

namespace doorsid

{

    TypeCode::TypeCode(TypeKind kind)
        : m_value(static_cast<std::uint8_t>(kind))
    {
        if (kind == TypeKind::UNKNOWN) {
            THROWF(doorsid::InputException) << "TypeCode requires a known kind or an explicit byte" << THROWF_END;
        }
    }

    std::optional<TypeCode> TypeCode::tryParse(const std::string &str)
    {
        if (str.empty() || str.size() > HEX_WIDTH) {
            return std::nullopt;
        }
        auto value = parse_hex(str);
        if (!value) {
            return std::nullopt;
        }
        return TypeCode(static_cast<std::uint8_t>(*value));
    }

    TypeKind TypeCode::getKind() const
    {
        switch (static_cast<TypeKind>(m_value)) {
            case TypeKind::PROJECT_ROOT:
            case TypeKind::FOLDER:
            case TypeKind::BASELINE_SET:
            case TypeKind::VIEW:
            case TypeKind::FORMAL_MODULE:
            case TypeKind::OBJECT:
                return static_cast<TypeKind>(m_value);
            default:
                return TypeKind::UNKNOWN;
        }
    }

    std::string TypeCode::getName() const
    {
        switch (getKind()) {
            case TypeKind::PROJECT_ROOT:
                return "ProjectRoot";
            case TypeKind::FOLDER:
                return "Folder";
            case TypeKind::BASELINE_SET:
                return "BaselineSet";
            case TypeKind::VIEW:
                return "View";
            case TypeKind::FORMAL_MODULE:
                return "FormalModule";
            case TypeKind::OBJECT:
                return "Object";
            case TypeKind::UNKNOWN:
                break;
        }
        return "Unknown(0x" + toString() + ")";
    }

    std::string TypeCode::toString() const {
        return format_hex(m_value, HEX_WIDTH);
    }

    std::ostream &operator<<(std::ostream &os, TypeKind kind)
    {
        if (kind == TypeKind::UNKNOWN) {
            return os << "Unknown";
        }
        return os << TypeCode(kind).getName();
    }

    std::ostream &operator<<(std::ostream &os, const TypeCode &type_code) {
        return os << type_code.toString();
    }

}
