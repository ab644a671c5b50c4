#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <doorsid/core/utils/lexical_cast.hpp>
#include <doorsid/core/exception/Exceptions.hpp>

namespace doorsid

{

    // String key / value configuration with typed getters
    class Config
    {
    public:
        using MapT = std::unordered_map<std::string, std::string>;

        Config() = default;
        Config(const MapT &values);

        bool has(const std::string &key) const;

        /**
         * @return nullopt if the key is not set
         * @throw InputException if the value cannot be converted to T
        */
        template <typename T> std::optional<T> get(const std::string &key) const
        {
            auto it = m_values.find(key);
            if (it == m_values.end()) {
                return std::nullopt;
            }
            return doorsid::lexical_cast<T>(it->second);
        }

        template <typename T> T get(const std::string &key, const T &default_value) const
        {
            auto result = get<T>(key);
            return result ? *result : default_value;
        }

        // @throw KeyNotFoundException if the key is not set
        template <typename T> T getRequired(const std::string &key) const
        {
            auto result = get<T>(key);
            if (!result) {
                THROWF(doorsid::KeyNotFoundException) << "Missing configuration key: " << key << THROWF_END;
            }
            return *result;
        }

        Config &set(const std::string &key, const std::string &value);

    private:
        MapT m_values;
    };
    
}
