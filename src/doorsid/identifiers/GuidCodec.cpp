#include "GuidCodec.hpp"
#include <doorsid/core/utils/conversions.hpp>

namespace doorsid

{

    namespace

    {

        enum FieldIndex: int
        {
            HEADER_FIELD = 0,
            DB_ID_FIELD = 1,
            TYPE_CODE_FIELD = 2,
            PARENT_FIELD = 3,
            OBJECT_FIELD = 4,
            BASELINE_FIELD = 5
        };

        [[noreturn]] void fail(GuidParseError error, int field_index, const std::string &text)
        {
            throw GuidParseException(error, field_index, text) << "Invalid GUID " << getFieldName(error)
                << " (" << error << "): '" << text << "'";
        }

        template <typename T> T require(const std::optional<T> &value, GuidParseError error,
            const std::vector<std::string> &fields, int field_index)
        {
            if (!value) {
                fail(error, field_index, fields[field_index]);
            }
            return *value;
        }

    }

    Guid GuidCodec::parse(const std::string &str)
    {
        auto fields = split(str, SEPARATOR);
        if (fields.size() < MIN_FIELD_COUNT || fields.size() > MAX_FIELD_COUNT) {
            throw GuidParseException(GuidParseError::UNEXPECTED_FIELD_COUNT, GuidParseException::WHOLE_INPUT, str)
                << "Invalid GUID: expected " << MIN_FIELD_COUNT << " or " << MAX_FIELD_COUNT 
                << " fields, got " << fields.size() << ": '" << str << "'";
        }
        
        if (fields[HEADER_FIELD] != Guid::HEADER) {
            fail(GuidParseError::MALFORMED_HEADER, HEADER_FIELD, fields[HEADER_FIELD]);
        }
        
        auto db_id = require(DatabaseId::tryParse(fields[DB_ID_FIELD]), GuidParseError::INVALID_DB_ID, 
            fields, DB_ID_FIELD);
        auto type_code = require(TypeCode::tryParse(fields[TYPE_CODE_FIELD]), GuidParseError::INVALID_TYPE_CODE,
            fields, TYPE_CODE_FIELD);
        auto parent = require(ParentKey::tryParse(fields[PARENT_FIELD]), GuidParseError::INVALID_PARENT_KEY,
            fields, PARENT_FIELD);
        auto object = require(ObjectKey::tryParse(fields[OBJECT_FIELD]), GuidParseError::INVALID_OBJECT_KEY,
            fields, OBJECT_FIELD);
        
        std::optional<BaselineKey> baseline;
        if (fields.size() == MAX_FIELD_COUNT) {
            baseline = require(BaselineKey::tryParse(fields[BASELINE_FIELD]), GuidParseError::INVALID_BASELINE,
                fields, BASELINE_FIELD);
        }
        
        return Guid(db_id, type_code, parent, object, baseline);
    }
    
    std::optional<Guid> GuidCodec::tryParse(const std::string &str, GuidParseError *error)
    {
        try {
            return parse(str);
        } catch (const GuidParseException &e) {
            if (error) {
                *error = e.getError();
            }
            return std::nullopt;
        }
    }

    std::string GuidCodec::format(const Guid &guid)
    {
        std::string result = Guid::HEADER;
        result += SEPARATOR;
        result += guid.getDbId().toString();
        result += SEPARATOR;
        result += guid.getTypeCode().toString();
        result += SEPARATOR;
        result += guid.getParent().toString();
        result += SEPARATOR;
        result += guid.getObject().toString();
        if (guid.getBaseline()) {
            result += SEPARATOR;
            result += guid.getBaseline()->toString();
        }
        return result;
    }

}
