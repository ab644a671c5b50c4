#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace doorsid

{

    /**
     * 32-bit DOORS item key, the textual form is always 8 lowercase hex digits
    */
    class Key
    {
    public:
        static constexpr std::size_t HEX_WIDTH = 8;

        Key() = default;

        inline Key(std::uint32_t value)
            : m_value(value)
        {
        }

        // exactly 8 hex digits (any case)
        static std::optional<Key> tryParse(const std::string &);

        inline std::uint32_t getValue() const {
            return m_value;
        }

        std::string toString() const;

        inline bool operator==(const Key &other) const {
            return m_value == other.m_value;
        }

        inline bool operator!=(const Key &other) const {
            return m_value != other.m_value;
        }

        inline bool operator<(const Key &other) const {
            return m_value < other.m_value;
        }

    private:
        std::uint32_t m_value = 0;
    };

    std::ostream &operator<<(std::ostream &, const Key &);

}

namespace std

{

    template <> struct hash<doorsid::Key> {
        std::size_t operator()(const doorsid::Key &key) const noexcept {
            return std::hash<std::uint32_t>()(key.getValue());
        }
    };

}
