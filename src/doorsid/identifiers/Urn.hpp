#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include "DatabaseId.hpp"
#include "Key.hpp"

namespace doorsid

{

    // enumerator values are the kind letters used in the URN
    enum class UrnKind: char
    {
        PROJECT_ROOT = 'P',
        FOLDER = 'F',
        FORMAL_MODULE = 'M',
        OBJECT = 'O'
    };

    // "rational" and "telelogic" are distinct and never normalized
    enum class UrnScheme: std::uint8_t
    {
        RATIONAL = 0,
        TELELOGIC = 1
    };

    char toLetter(UrnKind);
    // uppercase letters only
    std::optional<UrnKind> urnKindFromLetter(char);

    const char *toToken(UrnScheme);
    std::optional<UrnScheme> urnSchemeFromToken(const std::string &);

    std::ostream &operator<<(std::ostream &, UrnKind);
    std::ostream &operator<<(std::ostream &, UrnScheme);

    /**
     * The kind-specific part of a URN:
     * SIMPLE - the item key (projects, folders, modules)
     * OBJECT_REF - absolute object number + key of the owning module
    */
    class UrnId
    {
    public:
        enum class Type: std::uint8_t
        {
            SIMPLE = 0,
            OBJECT_REF = 1
        };

        static UrnId simple(Key);
        static UrnId objectRef(std::uint64_t abs_no, Key module_key);

        inline Type getType() const {
            return m_type;
        }

        // the following getters throw InternalException when called on a different type
        Key getKey() const;
        std::uint64_t getAbsNo() const;
        Key getModuleKey() const;

        bool operator==(const UrnId &other) const;
        bool operator!=(const UrnId &other) const;

    private:
        Type m_type;
        Key m_key;
        std::uint64_t m_abs_no = 0;

        UrnId(Type, Key, std::uint64_t abs_no);
    };

    /**
     * DWA URN, e.g. urn:rational::1-48beda447cfb0c27-M-00003c20
     * or urn:rational::1-48beda447cfb0c27-O-2-00003c20 for objects
     * see UrnCodec for the textual form
    */
    class Urn
    {
    public:
        // InputException if the id type does not match the kind (OBJECT requires OBJECT_REF)
        Urn(UrnScheme, DatabaseId, UrnKind, UrnId);
        
        // UrnCodec::parse / UrnCodec::format shortcuts
        static Urn fromString(const std::string &);
        std::string toString() const;

        inline UrnScheme getScheme() const {
            return m_scheme;
        }

        inline const DatabaseId &getDbId() const {
            return m_db_id;
        }

        inline UrnKind getKind() const {
            return m_kind;
        }

        inline const UrnId &getId() const {
            return m_id;
        }

        bool operator==(const Urn &other) const;
        bool operator!=(const Urn &other) const;

    private:
        UrnScheme m_scheme;
        DatabaseId m_db_id;
        UrnKind m_kind;
        UrnId m_id;
    };

    std::ostream &operator<<(std::ostream &, const Urn &);

}

namespace std

{

    template <> struct hash<doorsid::Urn> {
        std::size_t operator()(const doorsid::Urn &urn) const {
            return std::hash<std::string>()(urn.toString());
        }
    };

}
