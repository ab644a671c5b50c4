#include "UrlBuilder.hpp"
#include <cstring>
#include <doorsid/config/Config.hpp>
#include <doorsid/core/exception/Exceptions.hpp>
#include <doorsid/core/utils/conversions.hpp>
#include <doorsid/core/utils/percent_encoding.hpp>
#include <doorsid/identifiers/IdentifierTranslator.hpp>
#include <doorsid/identifiers/UrnCodec.hpp>

namespace doorsid

{

    static constexpr const char *DEFAULT_PROTOCOL = "http://";
    static constexpr const char *REDIRECTOR_PATH = "/dwa/redirector/?version=2&urn=";
    static constexpr const char *RESOURCE_PATH = "/dwa/rm/";
    static constexpr const char *CATALOG_PATH = "/dwa/rm/discovery/catalog";

    static UrnScheme getUrnScheme(const Config &config)
    {
        auto token = config.get<std::string>(UrlBuilder::URN_SCHEME_KEY);
        if (!token) {
            return UrnScheme::RATIONAL;
        }
        auto scheme = urnSchemeFromToken(*token);
        if (!scheme) {
            THROWF(doorsid::InputException) << "Invalid " << UrlBuilder::URN_SCHEME_KEY << ": " << *token << THROWF_END;
        }
        return *scheme;
    }

    UrlBuilder::UrlBuilder(const std::string &server, UrnScheme scheme)
        : m_base_url(makeBaseUrl(server))
        , m_scheme(scheme)
    {
    }

    UrlBuilder::UrlBuilder(const Config &config)
        : UrlBuilder(config.getRequired<std::string>(SERVER_KEY), getUrnScheme(config))
    {
    }

    const std::string &UrlBuilder::getBaseUrl() const {
        return m_base_url;
    }

    std::string UrlBuilder::makeBaseUrl(const std::string &server)
    {
        std::string protocol = DEFAULT_PROTOCOL;
        auto host = server;
        for (auto prefix: { "http://", "https://" }) {
            if (starts_with(server, prefix)) {
                protocol = prefix;
                host = server.substr(std::strlen(prefix));
                break;
            }
        }
        auto end = host.find_last_not_of('/');
        if (end == std::string::npos) {
            THROWF(doorsid::InputException) << "Server host must not be empty: '" << server << "'" << THROWF_END;
        }
        return protocol + host.substr(0, end + 1);
    }

    std::string UrlBuilder::redirectorUrlFor(const std::string &base_url, const Urn &urn,
        const std::optional<BaselineKey> &baseline)
    {
        auto result = base_url + REDIRECTOR_PATH + percent_encode(urn.toString());
        if (baseline) {
            switch (baseline->getType()) {
                case BaselineKey::Type::LIVE:
                    break;
                case BaselineKey::Type::LEGACY:
                    result += "&version=" + baseline->getLegacyKey().toString();
                    break;
                case BaselineKey::Type::VERSIONED:
                    result += "&baseline=" + std::to_string(baseline->getId());
                    break;
            }
        }
        return result;
    }

    std::string UrlBuilder::directUrlFor(const std::string &base_url, const Urn &urn, std::optional<Key> view_key)
    {
        auto result = base_url + RESOURCE_PATH + percent_encode(urn.toString());
        if (view_key) {
            result += "?view=" + view_key->toString();
        }
        return result;
    }

    std::string UrlBuilder::redirectorUrl(const Urn &urn, const std::optional<BaselineKey> &baseline) const {
        return redirectorUrlFor(m_base_url, urn, baseline);
    }

    std::string UrlBuilder::redirectorUrl(const Guid &guid) const
    {
        auto translation = IdentifierTranslator::guidToUrn(guid, m_scheme);
        return redirectorUrlFor(m_base_url, translation.m_urn, guid.getBaseline());
    }

    std::string UrlBuilder::directUrl(const Urn &urn, std::optional<Key> view_key) const {
        return directUrlFor(m_base_url, urn, view_key);
    }

    std::string UrlBuilder::directUrl(const Guid &guid) const
    {
        auto translation = IdentifierTranslator::guidToUrn(guid, m_scheme);
        return directUrlFor(m_base_url, translation.m_urn, translation.m_view_key);
    }

    std::string UrlBuilder::catalogUrl() const {
        return m_base_url + CATALOG_PATH;
    }

    std::string UrlBuilder::resolveUrl(const std::string &urn_or_url) const
    {
        if (starts_with(urn_or_url, UrnCodec::PREFIX)) {
            return directUrlFor(m_base_url, UrnCodec::parse(urn_or_url), std::nullopt);
        }
        return urn_or_url;
    }

    std::string UrlBuilder::buildRedirectorUrl(const std::string &server, const Urn &urn,
        const std::optional<BaselineKey> &baseline)
    {
        return redirectorUrlFor(makeBaseUrl(server), urn, baseline);
    }

    std::string UrlBuilder::buildDirectUrl(const std::string &server, const Urn &urn, std::optional<Key> view_key) {
        return directUrlFor(makeBaseUrl(server), urn, view_key);
    }

    std::string UrlBuilder::buildCatalogUrl(const std::string &server) {
        return makeBaseUrl(server) + CATALOG_PATH;
    }

    std::string UrlBuilder::resolveUrl(const std::string &server, const std::string &urn_or_url) {
        return UrlBuilder(server).resolveUrl(urn_or_url);
    }

}
