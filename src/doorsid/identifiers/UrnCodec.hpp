#pragma once

#include <optional>
#include <string>
#include "Urn.hpp"
#include "Exceptions.hpp"

namespace doorsid

{

    /**
     * DWA URN codec
     * urn:(rational|telelogic)::1-<db-id 16 hex>-<P|F|M>-<key 8 hex>
     * urn:(rational|telelogic)::1-<db-id 16 hex>-O-<abs-no decimal>-<module key 8 hex>
     * 
     * Views have no URN of their own, the view key travels separately (see UrlBuilder)
    */
    class UrnCodec
    {
    public:
        static constexpr const char *PREFIX = "urn:";
        static constexpr const char *VERSION_MARKER = "::1-";
        static constexpr char SEPARATOR = '-';

        // @throw UrnParseException
        static Urn parse(const std::string &);

        static std::optional<Urn> tryParse(const std::string &, UrnParseError *error = nullptr);

        static std::string format(const Urn &);
    };

}
