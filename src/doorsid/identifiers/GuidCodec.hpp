#pragma once

#include <optional>
#include <string>
#include "Guid.hpp"
#include "Exceptions.hpp"

namespace doorsid

{

    /**
     * Colon-delimited GUID codec
     * AB:<db-id 16 hex>:<type 1-2 hex>:<parent 10 hex>:28<object 8 hex>[:<baseline>]
     * baseline: ff<8 hex> | {null,0} | {<id>,<epoch>}
     * hex fields are parsed in any case and always formatted in lowercase
    */
    class GuidCodec
    {
    public:
        static constexpr char SEPARATOR = ':';
        static constexpr std::size_t MIN_FIELD_COUNT = 5;
        static constexpr std::size_t MAX_FIELD_COUNT = 6;

        // @throw GuidParseException
        static Guid parse(const std::string &);

        /**
         * Non-throwing parse for batch processing
         * @param error receives the failure reason (optional)
        */
        static std::optional<Guid> tryParse(const std::string &, GuidParseError *error = nullptr);

        static std::string format(const Guid &);
    };

}
