#include <gtest/gtest.h>
#include <tlsfp/tls/version.hpp>

using namespace tlsfp::tls;

TEST(ProtocolVersionTest, DefaultConstructor) {
    ProtocolVersion version;
    ASSERT_EQ(version.majorVersion(), 0);
    ASSERT_EQ(version.minorVersion(), 0);
    ASSERT_EQ(version.code(), 0);
}

TEST(ProtocolVersionTest, ConstructorFromCode) {
    ProtocolVersion version(0x0301);
    ASSERT_EQ(version.majorVersion(), 3);
    ASSERT_EQ(version.minorVersion(), 1);
    ASSERT_EQ(version.code(), 769);
}

TEST(ProtocolVersionTest, ConstructorFromMajorMinor) {
    ProtocolVersion version(3, 3);
    ASSERT_EQ(version.code(), 771);
    ASSERT_EQ(version, ProtocolVersion::TLSv1_2);
}

TEST(ProtocolVersionTest, ToString) {
    ASSERT_EQ(ProtocolVersion(3, 0).toString(), "SSLv3.0");
    ASSERT_EQ(ProtocolVersion(3, 3).toString(), "TLSv1.2");
    ASSERT_EQ(ProtocolVersion(ProtocolVersion::TLSv1_3).toString(), "TLSv1.3");
    ASSERT_EQ(ProtocolVersion(0x0A0A).toString(), "Unknown version 10.10");
}

TEST(ProtocolVersionTest, FromString) {
    auto versionOpt = ProtocolVersion::fromString("TLSv1.2");
    ASSERT_TRUE(versionOpt.has_value());
    ASSERT_EQ(versionOpt->code(), 771);

    ASSERT_FALSE(ProtocolVersion::fromString("TLSv2.0").has_value());
}

TEST(ProtocolVersionTest, ComparisonOperators) {
    ProtocolVersion version1(3, 3);
    ProtocolVersion version2(3, 4);
    ASSERT_TRUE(version1 != version2);
    ASSERT_TRUE(version1 < version2);
    ASSERT_FALSE(version2 < version1);
}
