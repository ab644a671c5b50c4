#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace doorsid

{

    /**
     * 64-bit DOORS database identifier
     * printed as 16 lowercase hex digits, parsing accepts any case
    */
    class DatabaseId
    {
    public:
        static constexpr std::size_t HEX_WIDTH = 16;

        DatabaseId() = default;

        static inline DatabaseId fromValue(std::uint64_t value) {
            return DatabaseId(value);
        }

        // exactly 16 hex digits
        static std::optional<DatabaseId> tryParse(const std::string &);

        inline std::uint64_t getValue() const {
            return m_value;
        }

        std::string toString() const;

        inline bool operator==(const DatabaseId &other) const {
            return m_value == other.m_value;
        }

        inline bool operator!=(const DatabaseId &other) const {
            return m_value != other.m_value;
        }

        inline bool operator<(const DatabaseId &other) const {
            return m_value < other.m_value;
        }

    private:
        std::uint64_t m_value = 0;

        inline DatabaseId(std::uint64_t value)
            : m_value(value)
        {
        }
    };

    std::ostream &operator<<(std::ostream &, const DatabaseId &);

}

namespace std

{

    template <> struct hash<doorsid::DatabaseId> {
        std::size_t operator()(const doorsid::DatabaseId &db_id) const noexcept {
            return std::hash<std::uint64_t>()(db_id.getValue());
        }
    };

}
