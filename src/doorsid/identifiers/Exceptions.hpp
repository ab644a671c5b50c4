#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <doorsid/core/exception/Exceptions.hpp>

namespace doorsid

{

    enum class GuidParseError: std::uint8_t
    {
        UNEXPECTED_FIELD_COUNT = 1,
        MALFORMED_HEADER,
        INVALID_DB_ID,
        INVALID_TYPE_CODE,
        INVALID_PARENT_KEY,
        INVALID_OBJECT_KEY,
        INVALID_BASELINE
    };

    enum class UrnParseError: std::uint8_t
    {
        MALFORMED_PREFIX = 1,
        INVALID_SCHEME,
        INVALID_DB_ID,
        UNKNOWN_KIND,
        INVALID_KEY,
        INVALID_OBJECT_REF
    };

    enum class TranslationError: std::uint8_t
    {
        UNSUPPORTED_TYPE_CODE = 1,
        INCONSISTENT_OBJECT_KEY,
        MISSING_TYPE_HINT,
        TYPE_HINT_MISMATCH,
        MISSING_VIEW_KEY
    };

    // name of the GUID / URN field the error refers to (e.g. "db-id")
    const char *getFieldName(GuidParseError);
    const char *getFieldName(UrnParseError);

    std::ostream &operator<<(std::ostream &, GuidParseError);
    std::ostream &operator<<(std::ostream &, UrnParseError);
    std::ostream &operator<<(std::ostream &, TranslationError);

    class GuidParseException : public InputException
    {
    public:
        static constexpr int exception_id = EXCEPTION_ID_PREFIX::CODEC | 0x01;

        // field index of the whole input (e.g. for UNEXPECTED_FIELD_COUNT)
        static constexpr int WHOLE_INPUT = -1;

        /**
         * @param field_index index of the colon-delimited field or WHOLE_INPUT
         * @param field_text raw text of the offending field
        */
        GuidParseException(GuidParseError, int field_index, const std::string &field_text);

        GuidParseError getError() const;
        int getFieldIndex() const;
        const std::string &getFieldText() const;

    private:
        GuidParseError m_error;
        int m_field_index;
        std::string m_field_text;
    };

    class UrnParseException : public InputException
    {
    public:
        static constexpr int exception_id = EXCEPTION_ID_PREFIX::CODEC | 0x02;

        UrnParseException(UrnParseError, const std::string &field_text);

        UrnParseError getError() const;
        const std::string &getFieldText() const;

    private:
        UrnParseError m_error;
        std::string m_field_text;
    };

    class TranslationException : public InputException
    {
    public:
        static constexpr int exception_id = EXCEPTION_ID_PREFIX::TRANSLATION | 0x01;

        TranslationException(TranslationError);

        TranslationError getError() const;

    private:
        TranslationError m_error;
    };

}
