#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include "DatabaseId.hpp"
#include "TypeCode.hpp"
#include "ParentKey.hpp"
#include "ObjectKey.hpp"
#include "BaselineKey.hpp"

namespace doorsid

{

    /**
     * DOORS Classic GUID, e.g. AB:48beda447cfb0c27:21:2100003c20:28ffffffff:{null,0}
     * see GuidCodec for the textual form
    */
    class Guid
    {
    public:
        static constexpr const char *HEADER = "AB";

        Guid(DatabaseId, TypeCode, ParentKey, ObjectKey, std::optional<BaselineKey> = {});

        // GuidCodec::parse / GuidCodec::format shortcuts
        static Guid fromString(const std::string &);
        std::string toString() const;

        inline const DatabaseId &getDbId() const {
            return m_db_id;
        }

        inline const TypeCode &getTypeCode() const {
            return m_type_code;
        }

        inline const ParentKey &getParent() const {
            return m_parent;
        }

        inline const ObjectKey &getObject() const {
            return m_object;
        }

        /**
         * nullopt when the GUID has no baseline field (5 fields)
         * an explicit {null,0} is reported as BaselineKey::Type::LIVE
        */
        inline const std::optional<BaselineKey> &getBaseline() const {
            return m_baseline;
        }

        // the working copy, either with no baseline field or an explicit live one
        bool isLive() const;

        // copy with the baseline replaced
        Guid withBaseline(std::optional<BaselineKey>) const;

        bool operator==(const Guid &other) const;
        bool operator!=(const Guid &other) const;

    private:
        DatabaseId m_db_id;
        TypeCode m_type_code;
        ParentKey m_parent;
        ObjectKey m_object;
        std::optional<BaselineKey> m_baseline;
    };

    std::ostream &operator<<(std::ostream &, const Guid &);

}

namespace std

{

    // hashes the canonical textual form
    template <> struct hash<doorsid::Guid> {
        std::size_t operator()(const doorsid::Guid &guid) const {
            return std::hash<std::string>()(guid.toString());
        }
    };

}
