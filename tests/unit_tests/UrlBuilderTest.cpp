#include <gtest/gtest.h>
#include <string>
#include <doorsid/url/UrlBuilder.hpp>
#include <doorsid/config/Config.hpp>
#include <doorsid/identifiers/Exceptions.hpp>

using namespace std;
using namespace doorsid;

namespace tests

{

    class UrlBuilderTest : public testing::Test
    {
    public:
        static constexpr const char *SERVER = "doors.example.com";
        static constexpr const char *MODULE_URN = "urn:rational::1-48beda447cfb0c27-M-00003c20";
        static constexpr const char *ENCODED_MODULE_URN = "urn%3Arational%3A%3A1-48beda447cfb0c27-M-00003c20";
        static constexpr const char *ENCODED_OBJECT_URN = "urn%3Arational%3A%3A1-48beda447cfb0c27-O-2-00003c20";
    };

    TEST_F( UrlBuilderTest, testRedirectorUrlForWorkingCopy )
    {
        auto urn = Urn::fromString(MODULE_URN);
        auto expected = std::string("http://doors.example.com/dwa/redirector/?version=2&urn=") + ENCODED_MODULE_URN;
        ASSERT_EQ(UrlBuilder::buildRedirectorUrl(SERVER, urn), expected);
        ASSERT_EQ(UrlBuilder::buildRedirectorUrl(SERVER, urn, BaselineKey::live()), expected);
    }

    TEST_F( UrlBuilderTest, testRedirectorUrlWithBaseline )
    {
        auto urn = Urn::fromString(MODULE_URN);
        auto base = std::string("http://doors.example.com/dwa/redirector/?version=2&urn=") + ENCODED_MODULE_URN;
        ASSERT_EQ(UrlBuilder::buildRedirectorUrl(SERVER, urn, BaselineKey::legacy(Key(0xa))), base + "&version=0000000a");
        ASSERT_EQ(UrlBuilder::buildRedirectorUrl(SERVER, urn, BaselineKey::versioned(1000014, 1709026242)),
            base + "&baseline=1000014");
    }

    TEST_F( UrlBuilderTest, testDirectUrl )
    {
        auto urn = Urn::fromString(MODULE_URN);
        auto base = std::string("http://doors.example.com/dwa/rm/") + ENCODED_MODULE_URN;
        ASSERT_EQ(UrlBuilder::buildDirectUrl(SERVER, urn), base);
        ASSERT_EQ(UrlBuilder::buildDirectUrl(SERVER, urn, Key(7)), base + "?view=00000007");
    }

    TEST_F( UrlBuilderTest, testCatalogUrl )
    {
        ASSERT_EQ(UrlBuilder::buildCatalogUrl(SERVER), "http://doors.example.com/dwa/rm/discovery/catalog");
        ASSERT_EQ(UrlBuilder(SERVER).catalogUrl(), "http://doors.example.com/dwa/rm/discovery/catalog");
    }

    TEST_F( UrlBuilderTest, testServerNormalization )
    {
        ASSERT_EQ(UrlBuilder::makeBaseUrl("doors.example.com/"), "http://doors.example.com");
        ASSERT_EQ(UrlBuilder::makeBaseUrl("doors.example.com:8080//"), "http://doors.example.com:8080");
        ASSERT_EQ(UrlBuilder::makeBaseUrl("https://doors.example.com:8443/"), "https://doors.example.com:8443");
        ASSERT_EQ(UrlBuilder::makeBaseUrl("http://doors.example.com"), "http://doors.example.com");
        ASSERT_THROW(UrlBuilder::makeBaseUrl(""), InputException);
        ASSERT_THROW(UrlBuilder::makeBaseUrl("///"), InputException);
    }

    TEST_F( UrlBuilderTest, testServerWithProtocolOnly )
    {
        ASSERT_THROW(UrlBuilder::makeBaseUrl("http://"), InputException);
        ASSERT_THROW(UrlBuilder::makeBaseUrl("https://"), InputException);
        ASSERT_THROW(UrlBuilder::makeBaseUrl("http:///"), InputException);
        ASSERT_THROW({ UrlBuilder cut("https://"); }, InputException);
        ASSERT_EQ(UrlBuilder::makeBaseUrl("https://doors.example.com/dwa//"), "https://doors.example.com/dwa");
    }

    TEST_F( UrlBuilderTest, testGuidUrlsCarryBaselineAndView )
    {
        UrlBuilder cut(SERVER);
        auto object = Guid::fromString("AB:48beda447cfb0c27:23:2100003c20:2800000002:{1000014,1709026242}");
        ASSERT_EQ(cut.redirectorUrl(object), std::string("http://doors.example.com/dwa/redirector/?version=2&urn=")
            + ENCODED_OBJECT_URN + "&baseline=1000014");
        ASSERT_EQ(cut.directUrl(object), std::string("http://doors.example.com/dwa/rm/") + ENCODED_OBJECT_URN);
        
        auto view = Guid::fromString("AB:48beda447cfb0c27:1f:2100003c20:2800000007");
        ASSERT_EQ(cut.directUrl(view), std::string("http://doors.example.com/dwa/rm/") + ENCODED_MODULE_URN 
            + "?view=00000007");
        
        auto baseline_set = Guid::fromString("AB:48beda447cfb0c27:1d:2100003c20:28ffffffff");
        ASSERT_THROW(cut.directUrl(baseline_set), TranslationException);
    }

    TEST_F( UrlBuilderTest, testResolveUrl )
    {
        ASSERT_EQ(UrlBuilder::resolveUrl(SERVER, MODULE_URN), 
            std::string("http://doors.example.com/dwa/rm/") + ENCODED_MODULE_URN);
        ASSERT_EQ(UrlBuilder::resolveUrl(SERVER, "https://other.example.com/dwa/rm/x"), 
            "https://other.example.com/dwa/rm/x");
        ASSERT_THROW(UrlBuilder::resolveUrl(SERVER, "urn:rational::1-bad"), UrnParseException);
    }

    TEST_F( UrlBuilderTest, testBuilderFromConfig )
    {
        Config config(Config::MapT { { "server", "https://doors.example.com/" }, { "urn_scheme", "telelogic" } });
        UrlBuilder cut(config);
        ASSERT_EQ(cut.getBaseUrl(), "https://doors.example.com");
        auto module = Guid::fromString("AB:48beda447cfb0c27:21:2100003c20:28ffffffff");
        ASSERT_EQ(cut.directUrl(module), 
            "https://doors.example.com/dwa/rm/urn%3Atelelogic%3A%3A1-48beda447cfb0c27-M-00003c20");
    }

    TEST_F( UrlBuilderTest, testBuilderFromInvalidConfig )
    {
        ASSERT_THROW({ UrlBuilder cut { Config() }; }, KeyNotFoundException);
        Config config;
        config.set("server", SERVER).set("urn_scheme", "ibm");
        ASSERT_THROW({ UrlBuilder cut(config); }, InputException);
    }

}
