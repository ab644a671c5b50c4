#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include "Key.hpp"

namespace doorsid

{

    /**
     * Baseline field of a GUID, one of:
     * LIVE - the working copy, written as {null,0}
     * LEGACY - ff + 8 hex digits (baseline number)
     * VERSIONED - {id,epoch}, both decimal, epoch is a Unix timestamp
     * 
     * NOTE: a GUID without the baseline field also denotes the working copy
     * but is kept apart from LIVE (see Guid::getBaseline)
    */
    class BaselineKey
    {
    public:
        enum class Type: std::uint8_t
        {
            LIVE = 0,
            LEGACY = 1,
            VERSIONED = 2
        };

        static BaselineKey live();
        static BaselineKey legacy(Key);
        static BaselineKey versioned(std::uint64_t id, std::uint64_t epoch);

        static std::optional<BaselineKey> tryParse(const std::string &);

        inline Type getType() const {
            return m_type;
        }

        inline bool isLive() const {
            return m_type == Type::LIVE;
        }

        // the following getters throw InternalException when called on a different type
        Key getLegacyKey() const;
        std::uint64_t getId() const;
        std::uint64_t getEpoch() const;

        std::string toString() const;

        bool operator==(const BaselineKey &other) const;
        bool operator!=(const BaselineKey &other) const;

    private:
        Type m_type;
        // legacy key or versioned id
        std::uint64_t m_id = 0;
        std::uint64_t m_epoch = 0;

        BaselineKey(Type, std::uint64_t id, std::uint64_t epoch);

        void assertType(Type) const;
    };

    std::ostream &operator<<(std::ostream &, const BaselineKey &);

}
