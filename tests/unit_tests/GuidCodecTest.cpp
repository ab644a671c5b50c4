#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <doorsid/identifiers/GuidCodec.hpp>

using namespace std;
using namespace doorsid;

namespace tests

{

    class GuidCodecTest : public testing::Test
    {
    public:
        static const DatabaseId &dbId()
        {
            static const DatabaseId db_id = DatabaseId::fromValue(0x48beda447cfb0c27ull);
            return db_id;
        }

        // parse expecting a failure, returns the exception
        static GuidParseException parseError(const std::string &str)
        {
            try {
                GuidCodec::parse(str);
            } catch (const GuidParseException &e) {
                return e;
            }
            throw std::runtime_error("GUID parsed unexpectedly: " + str);
        }
    };
    
    TEST_F( GuidCodecTest, testParseModuleWithLiveBaseline )
    {
        auto cut = GuidCodec::parse("AB:48beda447cfb0c27:21:2100003c20:28ffffffff:{null,0}");
        ASSERT_EQ(cut.getDbId(), dbId());
        ASSERT_EQ(cut.getTypeCode(), TypeCode(TypeKind::FORMAL_MODULE));
        ASSERT_EQ(cut.getParent(), ParentKey(TypeKind::FORMAL_MODULE, Key(0x3c20)));
        ASSERT_TRUE(cut.getObject().isWholeContainer());
        ASSERT_TRUE(cut.getBaseline());
        ASSERT_EQ(*cut.getBaseline(), BaselineKey::live());
        ASSERT_TRUE(cut.isLive());
    }

    TEST_F( GuidCodecTest, testParseObjectWithVersionedBaseline )
    {
        auto cut = GuidCodec::parse("AB:48beda447cfb0c27:23:2100003c20:2800000002:{1000014,1709026242}");
        ASSERT_EQ(cut.getTypeCode(), TypeCode(TypeKind::OBJECT));
        ASSERT_EQ(cut.getObject(), ObjectKey::absolute(Key(2)));
        ASSERT_EQ(*cut.getBaseline(), BaselineKey::versioned(1000014, 1709026242));
        ASSERT_FALSE(cut.isLive());
    }
    
    TEST_F( GuidCodecTest, testParseLegacyBaseline )
    {
        auto cut = GuidCodec::parse("AB:48beda447cfb0c27:23:2100003c20:2800000002:ff0000000a");
        ASSERT_EQ(*cut.getBaseline(), BaselineKey::legacy(Key(10)));
        ASSERT_EQ(cut.getObject().getKey(), Key(2));
    }

    TEST_F( GuidCodecTest, testMissingBaselineIsDistinctFromLive )
    {
        auto without = GuidCodec::parse("AB:48beda447cfb0c27:21:2100003c20:28ffffffff");
        auto live = GuidCodec::parse("AB:48beda447cfb0c27:21:2100003c20:28ffffffff:{null,0}");
        ASSERT_FALSE(without.getBaseline());
        ASSERT_TRUE(without.isLive());
        ASSERT_NE(without, live);
        ASSERT_EQ(without, live.withBaseline(std::nullopt));
        ASSERT_EQ(GuidCodec::format(without), "AB:48beda447cfb0c27:21:2100003c20:28ffffffff");
        ASSERT_EQ(GuidCodec::format(live), "AB:48beda447cfb0c27:21:2100003c20:28ffffffff:{null,0}");
    }

    TEST_F( GuidCodecTest, testFormatReproducesWellFormedInput )
    {
        std::vector<std::string> guids {
            "AB:48beda447cfb0c27:21:2100003c20:28ffffffff:{null,0}",
            "AB:48beda447cfb0c27:18:180000500d:28ffffffff",
            "AB:48beda447cfb0c27:23:2100003c20:2800000002:{1000014,1709026242}",
            "AB:48beda447cfb0c27:19:1900000003:28ffffffff",
            "AB:48beda447cfb0c27:23:2100003e20:2800000ba6:ff0000000a",
            "AB:48beda447cfb0c27:1f:2100003c20:2800000007",
            "AB:48beda447cfb0c27:42:4200000001:28ffffffff"
        };
        for (auto &str: guids) {
            ASSERT_EQ(GuidCodec::format(GuidCodec::parse(str)), str);
            ASSERT_EQ(Guid::fromString(str).toString(), str);
        }
    }

    TEST_F( GuidCodecTest, testParseIsCaseInsensitiveOnHexFields )
    {
        auto cut = GuidCodec::parse("AB:48BEDA447CFB0C27:21:2100003C20:28FFFFFFFF:FF0000000A");
        ASSERT_EQ(cut.getDbId(), dbId());
        ASSERT_EQ(cut.toString(), "AB:48beda447cfb0c27:21:2100003c20:28ffffffff:ff0000000a");
    }

    TEST_F( GuidCodecTest, testHeaderIsCaseSensitive )
    {
        auto e = parseError("ab:48BEDA447CFB0C27:21:2100003c20:28ffffffff");
        ASSERT_EQ(e.getError(), GuidParseError::MALFORMED_HEADER);
        ASSERT_EQ(e.getFieldIndex(), 0);
        ASSERT_EQ(e.getFieldText(), "ab");
        ASSERT_EQ(parseError("XY:48beda447cfb0c27:21:2100003c20:28ffffffff").getError(), GuidParseError::MALFORMED_HEADER);
    }

    TEST_F( GuidCodecTest, testSingleDigitTypeCodeIsZeroPadded )
    {
        auto cut = GuidCodec::parse("AB:48beda447cfb0c27:5:2100003c20:28ffffffff");
        ASSERT_EQ(cut.getTypeCode().getByte(), 0x05);
        ASSERT_EQ(cut.getTypeCode().getKind(), TypeKind::UNKNOWN);
        ASSERT_EQ(cut.toString(), "AB:48beda447cfb0c27:05:2100003c20:28ffffffff");
    }

    TEST_F( GuidCodecTest, testUnexpectedFieldCount )
    {
        for (auto str: { "", "AB", "AB:48beda447cfb0c27:21:2100003c20", 
            "AB:48beda447cfb0c27:21:2100003c20:28ffffffff:{null,0}:x" }) 
        {
            auto e = parseError(str);
            ASSERT_EQ(e.getError(), GuidParseError::UNEXPECTED_FIELD_COUNT) << str;
            ASSERT_EQ(e.getFieldIndex(), GuidParseException::WHOLE_INPUT);
            ASSERT_EQ(e.getFieldText(), str);
        }
    }

    TEST_F( GuidCodecTest, testInvalidDbId )
    {
        auto e = parseError("AB:xyz:21:2100003c20:28ffffffff");
        ASSERT_EQ(e.getError(), GuidParseError::INVALID_DB_ID);
        ASSERT_EQ(e.getFieldIndex(), 1);
        ASSERT_EQ(e.getFieldText(), "xyz");
        ASSERT_NE(std::string(e.what()).find("xyz"), std::string::npos);
        ASSERT_EQ(parseError("AB:48beda447cfb0c2:21:2100003c20:28ffffffff").getError(), GuidParseError::INVALID_DB_ID);
    }

    TEST_F( GuidCodecTest, testInvalidFields )
    {
        std::vector<std::pair<std::string, GuidParseError> > cases {
            { "AB:48beda447cfb0c27::2100003c20:28ffffffff", GuidParseError::INVALID_TYPE_CODE },
            { "AB:48beda447cfb0c27:211:2100003c20:28ffffffff", GuidParseError::INVALID_TYPE_CODE },
            { "AB:48beda447cfb0c27:2x:2100003c20:28ffffffff", GuidParseError::INVALID_TYPE_CODE },
            { "AB:48beda447cfb0c27:21:2100003c2:28ffffffff", GuidParseError::INVALID_PARENT_KEY },
            { "AB:48beda447cfb0c27:21:21g0003c20:28ffffffff", GuidParseError::INVALID_PARENT_KEY },
            { "AB:48beda447cfb0c27:21:2100003c20:29ffffffff", GuidParseError::INVALID_OBJECT_KEY },
            { "AB:48beda447cfb0c27:21:2100003c20:28fffffff", GuidParseError::INVALID_OBJECT_KEY },
            { "AB:48beda447cfb0c27:21:2100003c20:28zzzzzzzz", GuidParseError::INVALID_OBJECT_KEY },
            { "AB:48beda447cfb0c27:21:2100003c20:28ffffffff:", GuidParseError::INVALID_BASELINE },
            { "AB:48beda447cfb0c27:21:2100003c20:28ffffffff:{null,1}", GuidParseError::INVALID_BASELINE },
            { "AB:48beda447cfb0c27:21:2100003c20:28ffffffff:{1,2,3}", GuidParseError::INVALID_BASELINE },
            { "AB:48beda447cfb0c27:21:2100003c20:28ffffffff:ff000a", GuidParseError::INVALID_BASELINE },
            { "AB:48beda447cfb0c27:21:2100003c20:28ffffffff:0000000a", GuidParseError::INVALID_BASELINE }
        };
        for (auto &c: cases) {
            ASSERT_EQ(parseError(c.first).getError(), c.second) << c.first;
        }
    }

    TEST_F( GuidCodecTest, testErrorsAreReportedInFieldOrder )
    {
        // both db-id and object key are malformed
        ASSERT_EQ(parseError("AB:xyz:21:2100003c20:99").getError(), GuidParseError::INVALID_DB_ID);
        ASSERT_EQ(parseError("ab:xyz:21:2100003c20:99").getError(), GuidParseError::MALFORMED_HEADER);
    }
    
    TEST_F( GuidCodecTest, testTryParseReportsError )
    {
        GuidParseError error = GuidParseError::UNEXPECTED_FIELD_COUNT;
        ASSERT_FALSE(GuidCodec::tryParse("AB:xyz:21:2100003c20:28ffffffff", &error));
        ASSERT_EQ(error, GuidParseError::INVALID_DB_ID);
        ASSERT_FALSE(GuidCodec::tryParse("AB:48beda447cfb0c27:21:2100003c20:28ffffffff:bad"));
        
        auto cut = GuidCodec::tryParse("AB:48beda447cfb0c27:21:2100003c20:28ffffffff", &error);
        ASSERT_TRUE(cut);
        ASSERT_EQ(cut->getDbId(), dbId());
    }

    TEST_F( GuidCodecTest, testBatchSkipsMalformedEntries )
    {
        std::vector<std::string> batch {
            "AB:48beda447cfb0c27:21:2100003c20:28ffffffff",
            "AB:48beda447cfb0c27:21:2100003c20",
            "AB:48beda447cfb0c27:23:2100003c20:2800000002:{1000014,1709026242}",
            "garbage"
        };
        std::vector<Guid> parsed;
        for (auto &str: batch) {
            if (auto guid = GuidCodec::tryParse(str)) {
                parsed.push_back(*guid);
            }
        }
        ASSERT_EQ(parsed.size(), 2u);
    }

    TEST_F( GuidCodecTest, testInMemoryGuidRoundTrip )
    {
        std::vector<Guid> guids {
            Guid(dbId(), TypeKind::FORMAL_MODULE, ParentKey(TypeKind::FORMAL_MODULE, Key(0x3c20)), ObjectKey::wholeContainer()),
            Guid(dbId(), TypeKind::OBJECT, ParentKey(TypeKind::FORMAL_MODULE, Key(0x3c20)), ObjectKey::absolute(Key(0)),
                BaselineKey::versioned(0, 0)),
            Guid(DatabaseId::fromValue(0), TypeCode::fromByte(0xff), ParentKey(TypeCode::fromByte(0), Key(0xffffffff)),
                ObjectKey::absolute(Key(0xfffffffe)), BaselineKey::legacy(Key(0xffffffff))),
            Guid(dbId(), TypeKind::PROJECT_ROOT, ParentKey(TypeKind::PROJECT_ROOT, Key(1)), ObjectKey::wholeContainer(),
                BaselineKey::live())
        };
        for (auto &guid: guids) {
            ASSERT_EQ(GuidCodec::parse(GuidCodec::format(guid)), guid);
        }
    }

    TEST_F( GuidCodecTest, testGuidsAreHashable )
    {
        auto module = GuidCodec::parse("AB:48beda447cfb0c27:21:2100003c20:28ffffffff:{null,0}");
        auto same_module = GuidCodec::parse("AB:48BEDA447CFB0C27:21:2100003C20:28FFFFFFFF:{null,0}");
        auto folder = GuidCodec::parse("AB:48beda447cfb0c27:19:1900000003:28ffffffff");
        ASSERT_EQ(std::hash<Guid>()(module), std::hash<Guid>()(same_module));
        
        std::unordered_set<Guid> guid_set { module, folder };
        ASSERT_EQ(guid_set.count(same_module), 1u);
        std::unordered_map<Guid, std::string> names { { module, "module" }, { folder, "folder" } };
        ASSERT_EQ(names.at(same_module), "module");
    }

}
