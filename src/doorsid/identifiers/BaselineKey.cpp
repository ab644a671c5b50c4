#include "BaselineKey.hpp"
#include <doorsid/core/exception/Exceptions.hpp>
#include <doorsid/core/utils/conversions.hpp>

namespace doorsid

{

    static constexpr const char *LEGACY_PREFIX = "ff";
    static constexpr const char *LIVE_ID = "null";

    BaselineKey::BaselineKey(Type type, std::uint64_t id, std::uint64_t epoch)
        : m_type(type)
        , m_id(id)
        , m_epoch(epoch)
    {
    }

    BaselineKey BaselineKey::live() {
        return BaselineKey(Type::LIVE, 0, 0);
    }

    BaselineKey BaselineKey::legacy(Key key) {
        return BaselineKey(Type::LEGACY, key.getValue(), 0);
    }

    BaselineKey BaselineKey::versioned(std::uint64_t id, std::uint64_t epoch) {
        return BaselineKey(Type::VERSIONED, id, epoch);
    }

    // the legacy marker is a hex byte, so any case is accepted
    static bool has_legacy_prefix(const std::string &str) {
        return str.size() >= 2 && (str[0] == 'f' || str[0] == 'F') && (str[1] == 'f' || str[1] == 'F');
    }

    std::optional<BaselineKey> BaselineKey::tryParse(const std::string &str)
    {
        if (has_legacy_prefix(str)) {
            auto key = Key::tryParse(str.substr(2));
            if (!key) {
                return std::nullopt;
            }
            return legacy(*key);
        }

        if (str.size() < 2 || str.front() != '{' || str.back() != '}') {
            return std::nullopt;
        }
        auto parts = split(str.substr(1, str.size() - 2), ',');
        if (parts.size() != 2) {
            return std::nullopt;
        }
        if (parts[0] == LIVE_ID) {
            if (parts[1] != "0") {
                return std::nullopt;
            }
            return live();
        }
        auto id = parse_decimal(parts[0]);
        auto epoch = parse_decimal(parts[1]);
        if (!id || !epoch) {
            return std::nullopt;
        }
        return versioned(*id, *epoch);
    }

    void BaselineKey::assertType(Type type) const
    {
        if (m_type != type) {
            THROWF(doorsid::InternalException) << "Baseline key accessed as type " << static_cast<int>(type) 
                << " but holds type " << static_cast<int>(m_type) << THROWF_END;
        }
    }

    Key BaselineKey::getLegacyKey() const
    {
        assertType(Type::LEGACY);
        return Key(static_cast<std::uint32_t>(m_id));
    }

    std::uint64_t BaselineKey::getId() const
    {
        assertType(Type::VERSIONED);
        return m_id;
    }

    std::uint64_t BaselineKey::getEpoch() const
    {
        assertType(Type::VERSIONED);
        return m_epoch;
    }

    std::string BaselineKey::toString() const
    {
        switch (m_type) {
            case Type::LIVE:
                return std::string("{") + LIVE_ID + ",0}";
            case Type::LEGACY:
                return LEGACY_PREFIX + getLegacyKey().toString();
            case Type::VERSIONED:
                return "{" + std::to_string(m_id) + "," + std::to_string(m_epoch) + "}";
        }
        THROWF(doorsid::InternalException) << "Invalid baseline key type: " << static_cast<int>(m_type) << THROWF_END;
    }

    bool BaselineKey::operator==(const BaselineKey &other) const {
        return m_type == other.m_type && m_id == other.m_id && m_epoch == other.m_epoch;
    }

    bool BaselineKey::operator!=(const BaselineKey &other) const {
        return !(*this == other);
    }

    std::ostream &operator<<(std::ostream &os, const BaselineKey &baseline) {
        return os << baseline.toString();
    }

}
