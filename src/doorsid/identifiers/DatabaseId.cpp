#include "DatabaseId.hpp"
#include <doorsid/core/utils/conversions.hpp>

namespace doorsid

{

    std::optional<DatabaseId> DatabaseId::tryParse(const std::string &str)
    {
        auto value = parse_hex(str, HEX_WIDTH);
        if (!value) {
            return std::nullopt;
        }
        return DatabaseId(*value);
    }

    std::string DatabaseId::toString() const {
        return format_hex(m_value, HEX_WIDTH);
    }

    std::ostream &operator<<(std::ostream &os, const DatabaseId &db_id) {
        return os << db_id.toString();
    }

}
