#pragma once

#include <optional>
#include <string>
#include <doorsid/identifiers/Guid.hpp>
#include <doorsid/identifiers/Urn.hpp>

namespace doorsid

{

    class Config;

    /**
     * Builds DOORS Web Access URLs:
     * redirector - http://<server>/dwa/redirector/?version=2&urn=<urn>[&version=<legacy-hex>|&baseline=<id>]
     * direct - http://<server>/dwa/rm/<urn>[?view=<hex-key>]
     * catalog - http://<server>/dwa/rm/discovery/catalog
     * 
     * The server is a host name (optionally with port and path), a value already carrying
     * http:// or https:// is used verbatim. Trailing slashes are ignored.
     * The URN is always percent-encoded.
    */
    class UrlBuilder
    {
    public:
        // configuration keys
        static constexpr const char *SERVER_KEY = "server";
        static constexpr const char *URN_SCHEME_KEY = "urn_scheme";

        // @throw InputException if the server is empty
        UrlBuilder(const std::string &server, UrnScheme = UrnScheme::RATIONAL);
        
        // reads 'server' (required) and 'urn_scheme' (optional)
        UrlBuilder(const Config &);

        // the base URL, e.g. http://doors.example.com:8080
        const std::string &getBaseUrl() const;

        std::string redirectorUrl(const Urn &, const std::optional<BaselineKey> & = std::nullopt) const;
        // translates the GUID, its baseline is carried over
        std::string redirectorUrl(const Guid &) const;

        std::string directUrl(const Urn &, std::optional<Key> view_key = std::nullopt) const;
        // translates the GUID, for a View GUID the view key is carried over
        std::string directUrl(const Guid &) const;

        std::string catalogUrl() const;

        /**
         * Resolve a resource reference: 'urn:' references are turned into direct URLs,
         * anything else (an absolute URL) is returned as is
         * @throw UrnParseException for a malformed URN
        */
        std::string resolveUrl(const std::string &urn_or_url) const;

        static std::string buildRedirectorUrl(const std::string &server, const Urn &, 
            const std::optional<BaselineKey> & = std::nullopt);
        static std::string buildDirectUrl(const std::string &server, const Urn &, 
            std::optional<Key> view_key = std::nullopt);
        static std::string buildCatalogUrl(const std::string &server);
        static std::string resolveUrl(const std::string &server, const std::string &urn_or_url);

        // the http://<server> base URL
        static std::string makeBaseUrl(const std::string &server);

    private:
        std::string m_base_url;
        UrnScheme m_scheme;

        static std::string redirectorUrlFor(const std::string &base_url, const Urn &,
            const std::optional<BaselineKey> &);
        static std::string directUrlFor(const std::string &base_url, const Urn &, std::optional<Key> view_key);
    };

}
