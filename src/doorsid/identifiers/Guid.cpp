#include "Guid.hpp"
#include "GuidCodec.hpp"

namespace doorsid

{

    Guid::Guid(DatabaseId db_id, TypeCode type_code, ParentKey parent, ObjectKey object,
        std::optional<BaselineKey> baseline)
        : m_db_id(db_id)
        , m_type_code(type_code)
        , m_parent(parent)
        , m_object(object)
        , m_baseline(baseline)
    {
    }

    Guid Guid::fromString(const std::string &str) {
        return GuidCodec::parse(str);
    }

    std::string Guid::toString() const {
        return GuidCodec::format(*this);
    }

    bool Guid::isLive() const {
        return !m_baseline || m_baseline->isLive();
    }

    Guid Guid::withBaseline(std::optional<BaselineKey> baseline) const
    {
        Guid result(*this);
        result.m_baseline = baseline;
        return result;
    }

    bool Guid::operator==(const Guid &other) const
    {
        return m_db_id == other.m_db_id && m_type_code == other.m_type_code && m_parent == other.m_parent
            && m_object == other.m_object && m_baseline == other.m_baseline;
    }

    bool Guid::operator!=(const Guid &other) const {
        return !(*this == other);
    }

    std::ostream &operator<<(std::ostream &os, const Guid &guid) {
        return os << guid.toString();
    }

}
