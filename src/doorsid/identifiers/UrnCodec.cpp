#include "UrnCodec.hpp"
#include <cstring>
#include <doorsid/core/utils/conversions.hpp>

namespace doorsid

{

    namespace

    {

        [[noreturn]] void fail(UrnParseError error, const std::string &text)
        {
            throw UrnParseException(error, text) << "Invalid URN " << getFieldName(error)
                << " (" << error << "): '" << text << "'";
        }

    }

    Urn UrnCodec::parse(const std::string &str)
    {
        if (!starts_with(str, PREFIX)) {
            fail(UrnParseError::MALFORMED_PREFIX, str);
        }
        auto pos = std::strlen(PREFIX);
        
        // scheme token runs up to the version marker
        auto marker_pos = str.find(':', pos);
        auto scheme = urnSchemeFromToken(str.substr(pos, marker_pos == std::string::npos ? 
            std::string::npos : marker_pos - pos));
        if (!scheme) {
            fail(UrnParseError::INVALID_SCHEME, str.substr(pos, marker_pos - pos));
        }
        if (marker_pos == std::string::npos) {
            fail(UrnParseError::MALFORMED_PREFIX, str);
        }
        if (str.compare(marker_pos, std::strlen(VERSION_MARKER), VERSION_MARKER) != 0) {
            fail(UrnParseError::MALFORMED_PREFIX, str.substr(0, marker_pos + std::strlen(VERSION_MARKER)));
        }
        pos = marker_pos + std::strlen(VERSION_MARKER);
        
        auto db_id_text = str.substr(pos, DatabaseId::HEX_WIDTH);
        auto db_id = DatabaseId::tryParse(db_id_text);
        pos += DatabaseId::HEX_WIDTH;
        if (!db_id || pos >= str.size() || str[pos] != SEPARATOR) {
            fail(UrnParseError::INVALID_DB_ID, str.substr(marker_pos + std::strlen(VERSION_MARKER), 
                DatabaseId::HEX_WIDTH + 1));
        }
        ++pos;
        
        auto kind_end = str.find(SEPARATOR, pos);
        auto kind_text = str.substr(pos, kind_end == std::string::npos ? std::string::npos : kind_end - pos);
        std::optional<UrnKind> kind;
        if (kind_text.size() == 1) {
            kind = urnKindFromLetter(kind_text[0]);
        }
        if (!kind) {
            fail(UrnParseError::UNKNOWN_KIND, kind_text);
        }
        
        std::string rest;
        if (kind_end != std::string::npos) {
            rest = str.substr(kind_end + 1);
        }
        
        if (*kind == UrnKind::OBJECT) {
            auto parts = split(rest, SEPARATOR);
            if (parts.size() != 2) {
                fail(UrnParseError::INVALID_OBJECT_REF, rest);
            }
            auto abs_no = parse_decimal(parts[0]);
            auto module_key = Key::tryParse(parts[1]);
            if (!abs_no || !module_key) {
                fail(UrnParseError::INVALID_OBJECT_REF, rest);
            }
            return Urn(*scheme, *db_id, *kind, UrnId::objectRef(*abs_no, *module_key));
        }
        
        auto key = Key::tryParse(rest);
        if (!key) {
            fail(UrnParseError::INVALID_KEY, rest);
        }
        return Urn(*scheme, *db_id, *kind, UrnId::simple(*key));
    }

    std::optional<Urn> UrnCodec::tryParse(const std::string &str, UrnParseError *error)
    {
        try {
            return parse(str);
        } catch (const UrnParseException &e) {
            if (error) {
                *error = e.getError();
            }
            return std::nullopt;
        }
    }
    
    std::string UrnCodec::format(const Urn &urn)
    {
        std::string result = PREFIX;
        result += toToken(urn.getScheme());
        result += VERSION_MARKER;
        result += urn.getDbId().toString();
        result += SEPARATOR;
        result += toLetter(urn.getKind());
        result += SEPARATOR;
        const auto &id = urn.getId();
        switch (id.getType()) {
            case UrnId::Type::SIMPLE:
                result += id.getKey().toString();
                break;
            case UrnId::Type::OBJECT_REF:
                result += std::to_string(id.getAbsNo());
                result += SEPARATOR;
                result += id.getModuleKey().toString();
                break;
        }
        return result;
    }

}
