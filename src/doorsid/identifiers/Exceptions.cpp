#include "Exceptions.hpp"

namespace doorsid

{

    const char *getFieldName(GuidParseError error)
    {
        switch (error) {
            case GuidParseError::UNEXPECTED_FIELD_COUNT:
                return "guid";
            case GuidParseError::MALFORMED_HEADER:
                return "header";
            case GuidParseError::INVALID_DB_ID:
                return "db-id";
            case GuidParseError::INVALID_TYPE_CODE:
                return "type-code";
            case GuidParseError::INVALID_PARENT_KEY:
                return "parent-key";
            case GuidParseError::INVALID_OBJECT_KEY:
                return "object-key";
            case GuidParseError::INVALID_BASELINE:
                return "baseline";
        }
        return "unknown";
    }

    const char *getFieldName(UrnParseError error)
    {
        switch (error) {
            case UrnParseError::MALFORMED_PREFIX:
                return "prefix";
            case UrnParseError::INVALID_SCHEME:
                return "scheme";
            case UrnParseError::INVALID_DB_ID:
                return "db-id";
            case UrnParseError::UNKNOWN_KIND:
                return "kind";
            case UrnParseError::INVALID_KEY:
                return "key";
            case UrnParseError::INVALID_OBJECT_REF:
                return "object-ref";
        }
        return "unknown";
    }

    std::ostream &operator<<(std::ostream &os, GuidParseError error)
    {
        switch (error) {
            case GuidParseError::UNEXPECTED_FIELD_COUNT:
                return os << "UnexpectedFieldCount";
            case GuidParseError::MALFORMED_HEADER:
                return os << "MalformedHeader";
            case GuidParseError::INVALID_DB_ID:
                return os << "InvalidDbId";
            case GuidParseError::INVALID_TYPE_CODE:
                return os << "InvalidTypeCode";
            case GuidParseError::INVALID_PARENT_KEY:
                return os << "InvalidParentKey";
            case GuidParseError::INVALID_OBJECT_KEY:
                return os << "InvalidObjectKey";
            case GuidParseError::INVALID_BASELINE:
                return os << "InvalidBaseline";
        }
        return os << "GuidParseError(" << static_cast<int>(error) << ")";
    }

    std::ostream &operator<<(std::ostream &os, UrnParseError error)
    {
        switch (error) {
            case UrnParseError::MALFORMED_PREFIX:
                return os << "MalformedPrefix";
            case UrnParseError::INVALID_SCHEME:
                return os << "InvalidScheme";
            case UrnParseError::INVALID_DB_ID:
                return os << "InvalidDbId";
            case UrnParseError::UNKNOWN_KIND:
                return os << "UnknownKind";
            case UrnParseError::INVALID_KEY:
                return os << "InvalidKey";
            case UrnParseError::INVALID_OBJECT_REF:
                return os << "InvalidObjectRef";
        }
        return os << "UrnParseError(" << static_cast<int>(error) << ")";
    }

    std::ostream &operator<<(std::ostream &os, TranslationError error)
    {
        switch (error) {
            case TranslationError::UNSUPPORTED_TYPE_CODE:
                return os << "UnsupportedTypeCode";
            case TranslationError::INCONSISTENT_OBJECT_KEY:
                return os << "InconsistentObjectKey";
            case TranslationError::MISSING_TYPE_HINT:
                return os << "MissingTypeHint";
            case TranslationError::TYPE_HINT_MISMATCH:
                return os << "TypeHintMismatch";
            case TranslationError::MISSING_VIEW_KEY:
                return os << "MissingViewKey";
        }
        return os << "TranslationError(" << static_cast<int>(error) << ")";
    }

    GuidParseException::GuidParseException(GuidParseError error, int field_index, const std::string &field_text)
        : InputException(exception_id)
        , m_error(error)
        , m_field_index(field_index)
        , m_field_text(field_text)
    {
    }

    GuidParseError GuidParseException::getError() const {
        return m_error;
    }

    int GuidParseException::getFieldIndex() const {
        return m_field_index;
    }

    const std::string &GuidParseException::getFieldText() const {
        return m_field_text;
    }

    UrnParseException::UrnParseException(UrnParseError error, const std::string &field_text)
        : InputException(exception_id)
        , m_error(error)
        , m_field_text(field_text)
    {
    }

    UrnParseError UrnParseException::getError() const {
        return m_error;
    }

    const std::string &UrnParseException::getFieldText() const {
        return m_field_text;
    }

    TranslationException::TranslationException(TranslationError error)
        : InputException(exception_id)
        , m_error(error)
    {
    }

    TranslationError TranslationException::getError() const {
        return m_error;
    }

}
