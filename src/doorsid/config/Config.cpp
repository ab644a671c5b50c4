#include "Config.hpp"

namespace doorsid

{

    Config::Config(const MapT &values)
        : m_values(values)
    {
    }

    bool Config::has(const std::string &key) const {
        return m_values.find(key) != m_values.end();
    }

    Config &Config::set(const std::string &key, const std::string &value)
    {
        m_values[key] = value;
        return *this;
    }

}
