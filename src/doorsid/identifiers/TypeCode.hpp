#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace doorsid

{
    
    /**
     * Item kinds documented for the GUID type byte
     * the enumerator values are the type bytes themselves
    */
    enum class TypeKind: std::uint8_t
    {
        PROJECT_ROOT = 0x18,
        FOLDER = 0x19,
        BASELINE_SET = 0x1D,
        VIEW = 0x1F,
        FORMAL_MODULE = 0x21,
        OBJECT = 0x23,
        // tag only, the actual byte is kept by TypeCode
        UNKNOWN = 0x00
    };

    /**
     * One byte GUID type code, bytes outside of the known kinds are preserved as UNKNOWN
    */
    class TypeCode
    {
    public:
        static constexpr std::size_t HEX_WIDTH = 2;

        TypeCode() = default;

        // NOTE: TypeKind::UNKNOWN carries no byte and is rejected with InputException
        TypeCode(TypeKind);

        static inline TypeCode fromByte(std::uint8_t value) {
            return TypeCode(value);
        }

        // 1 or 2 hex digits
        static std::optional<TypeCode> tryParse(const std::string &);

        inline std::uint8_t getByte() const {
            return m_value;
        }

        TypeKind getKind() const;

        inline bool isKnown() const {
            return getKind() != TypeKind::UNKNOWN;
        }

        inline bool is(TypeKind kind) const {
            return getKind() == kind;
        }

        // e.g. "FormalModule" or "Unknown(0x42)"
        std::string getName() const;

        // 2 lowercase hex digits
        std::string toString() const;

        inline bool operator==(const TypeCode &other) const {
            return m_value == other.m_value;
        }

        inline bool operator!=(const TypeCode &other) const {
            return m_value != other.m_value;
        }

        inline bool operator<(const TypeCode &other) const {
            return m_value < other.m_value;
        }

    private:
        std::uint8_t m_value = 0;

        inline TypeCode(std::uint8_t value)
            : m_value(value)
        {
        }
    };

    std::ostream &operator<<(std::ostream &, TypeKind);
    std::ostream &operator<<(std::ostream &, const TypeCode &);

}

namespace std

{

    template <> struct hash<doorsid::TypeCode> {
        std::size_t operator()(const doorsid::TypeCode &type_code) const noexcept {
            return std::hash<std::uint8_t>()(type_code.getByte());
        }
    };

}
