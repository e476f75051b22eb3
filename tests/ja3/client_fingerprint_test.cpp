#include <gtest/gtest.h>
#include <tlsfp/ja3/client_fingerprint.hpp>
#include <tlsfp/ja3/exception.hpp>

using namespace tlsfp::ja3;
using namespace tlsfp::tls;

class ClientFingerprintTest : public ::testing::Test
{
protected:
    static ClientFingerprint MakeFirefoxLike()
    {
        ClientFingerprint fp;
        fp.protocolVersions = {ProtocolVersion::TLSv1_2};
        fp.cipherSuites = {CipherSuiteCode::TLS_AES_128_GCM_SHA256, CipherSuiteCode::TLS_CHACHA20_POLY1305_SHA256,
                           CipherSuiteCode(0xC02B)};
        fp.extensions = {ExtensionType::ServerNameIndication, ExtensionType::ExtendedMasterSecret,
                         ExtensionType::SafeRenegotiation, ExtensionType::SupportedGroups};
        fp.ellipticCurves = {NamedGroup::X25519, NamedGroup::SECP256R1, NamedGroup(0x11EC)};
        fp.ellipticCurvePointFormats = {ECPointFormat::UNCOMPRESSED};
        return fp;
    }
};

TEST_F(ClientFingerprintTest, ParseFullFingerprint)
{
    auto fp = ClientFingerprint::parse("771,4865-4867-49195,0-23-65281-10,29-23-4588,0");

    ASSERT_EQ(fp.protocolVersions.size(), 1);
    EXPECT_EQ(fp.protocolVersions[0], ProtocolVersion::TLSv1_2);

    ASSERT_EQ(fp.cipherSuites.size(), 3);
    EXPECT_EQ(fp.cipherSuites[0], CipherSuiteCode::TLS_AES_128_GCM_SHA256);
    EXPECT_EQ(fp.cipherSuites[2].code(), 49195);

    ASSERT_EQ(fp.extensions.size(), 4);
    EXPECT_EQ(fp.extensions[2], ExtensionType::SafeRenegotiation);

    ASSERT_EQ(fp.ellipticCurves.size(), 3);
    EXPECT_EQ(fp.ellipticCurves[0], NamedGroup::X25519);

    ASSERT_EQ(fp.ellipticCurvePointFormats.size(), 1);
    EXPECT_EQ(fp.ellipticCurvePointFormats[0], ECPointFormat::UNCOMPRESSED);

    EXPECT_EQ(fp, MakeFirefoxLike());
}

TEST_F(ClientFingerprintTest, RenderFingerprint)
{
    EXPECT_EQ(MakeFirefoxLike().toString(), "771,4865-4867-49195,0-23-65281-10,29-23-4588,0");
}

TEST_F(ClientFingerprintTest, RecordRoundTrip)
{
    auto original = MakeFirefoxLike();
    EXPECT_EQ(ClientFingerprint::parse(original.toString()), original);
}

TEST_F(ClientFingerprintTest, TextRoundTrip)
{
    const std::string text = "769,47-53-5-10-49161-49162-49171-49172-50-56-19-4,0-10-11,23-24-25,0";
    EXPECT_EQ(ClientFingerprint::parse(text).toString(), text);
}

TEST_F(ClientFingerprintTest, OrderAndDuplicatesArePreserved)
{
    auto fp = ClientFingerprint::parse("772-771-772,,,,");
    ASSERT_EQ(fp.protocolVersions.size(), 3);
    EXPECT_EQ(fp.protocolVersions[0].code(), 772);
    EXPECT_EQ(fp.protocolVersions[1].code(), 771);
    EXPECT_EQ(fp.protocolVersions[2].code(), 772);
    EXPECT_EQ(fp.toString(), "772-771-772,,,,");
}

TEST_F(ClientFingerprintTest, AllFieldsEmpty)
{
    auto fp = ClientFingerprint::parse(",,,,");
    EXPECT_TRUE(fp.protocolVersions.empty());
    EXPECT_TRUE(fp.cipherSuites.empty());
    EXPECT_TRUE(fp.extensions.empty());
    EXPECT_TRUE(fp.ellipticCurves.empty());
    EXPECT_TRUE(fp.ellipticCurvePointFormats.empty());
    EXPECT_EQ(fp.toString(), ",,,,");
}

TEST_F(ClientFingerprintTest, EmptyText)
{
    auto fp = ClientFingerprint::parse("");
    EXPECT_EQ(fp, ClientFingerprint());
    EXPECT_EQ(fp.toString(), ",,,,");
}

TEST_F(ClientFingerprintTest, MissingTrailingFields)
{
    auto fp = ClientFingerprint::parse("771");
    ASSERT_EQ(fp.protocolVersions.size(), 1);
    EXPECT_EQ(fp.protocolVersions[0].code(), 771);
    EXPECT_TRUE(fp.cipherSuites.empty());
    EXPECT_TRUE(fp.extensions.empty());
    EXPECT_TRUE(fp.ellipticCurves.empty());
    EXPECT_TRUE(fp.ellipticCurvePointFormats.empty());
    EXPECT_EQ(fp, ClientFingerprint::parse("771,,,,"));
}

TEST_F(ClientFingerprintTest, TrailingEmptyFields)
{
    auto fp = ClientFingerprint::parse("771,4865,0,,");
    EXPECT_EQ(fp.extensions.size(), 1);
    EXPECT_TRUE(fp.ellipticCurves.empty());
    EXPECT_TRUE(fp.ellipticCurvePointFormats.empty());
    EXPECT_EQ(fp.toString(), "771,4865,0,,");
}

TEST_F(ClientFingerprintTest, DashJoinedValues)
{
    auto fp = ClientFingerprint::parse("771-770,4865-4866,0,29,0");
    ASSERT_EQ(fp.protocolVersions.size(), 2);
    EXPECT_EQ(fp.protocolVersions[0].code(), 771);
    EXPECT_EQ(fp.protocolVersions[1].code(), 770);
    ASSERT_EQ(fp.cipherSuites.size(), 2);
    EXPECT_EQ(fp.cipherSuites[1].code(), 4866);
}

TEST_F(ClientFingerprintTest, SingleValueHasNoDash)
{
    ClientFingerprint fp;
    fp.cipherSuites = {CipherSuiteCode(4865)};
    EXPECT_EQ(fp.toString(), ",4865,,,");
}

TEST_F(ClientFingerprintTest, UnknownCodesAreKept)
{
    auto fp = ClientFingerprint::parse("2570,2570-65535,64250,6682,255");
    EXPECT_EQ(fp.protocolVersions[0].code(), 2570);
    EXPECT_TRUE(fp.cipherSuites[0].isGrease());
    EXPECT_EQ(fp.cipherSuites[1].code(), 65535);
    EXPECT_EQ(fp.ellipticCurvePointFormats[0].code(), 255);
    EXPECT_EQ(fp.toString(), "2570,2570-65535,64250,6682,255");
}

TEST_F(ClientFingerprintTest, RejectsNonDigitToken)
{
    EXPECT_THROW(ClientFingerprint::parse("abc,,,,"), Exception);
    EXPECT_THROW(ClientFingerprint::parse("771,4865x,,,"), Exception);
    EXPECT_THROW(ClientFingerprint::parse("771,,0x10,,"), Exception);
}

TEST_F(ClientFingerprintTest, RejectsEmptyToken)
{
    EXPECT_THROW(ClientFingerprint::parse("771,4865--4866,,,"), Exception);
    EXPECT_THROW(ClientFingerprint::parse("771-,,,,"), Exception);
    EXPECT_THROW(ClientFingerprint::parse(",,,-29,"), Exception);
}

TEST_F(ClientFingerprintTest, RejectsSignsAndWhitespace)
{
    EXPECT_THROW(ClientFingerprint::parse("+771,,,,"), Exception);
    EXPECT_THROW(ClientFingerprint::parse(" 771,,,,"), Exception);
    EXPECT_THROW(ClientFingerprint::parse("771 ,,,,"), Exception);
    EXPECT_THROW(ClientFingerprint::parse("771,,,,0\n"), Exception);
}

TEST_F(ClientFingerprintTest, FieldWidthLimits)
{
    EXPECT_NO_THROW(ClientFingerprint::parse(",65535,,,"));
    EXPECT_THROW(ClientFingerprint::parse(",65536,,,"), Exception);

    EXPECT_NO_THROW(ClientFingerprint::parse(",,,,255"));
    EXPECT_THROW(ClientFingerprint::parse(",,,,256"), Exception);

    EXPECT_THROW(ClientFingerprint::parse(",,,99999999999999999999,"), Exception);
}

TEST_F(ClientFingerprintTest, ExtraFieldsStayInLastField)
{
    EXPECT_THROW(ClientFingerprint::parse("771,4865,0,29,0,1"), Exception);
    EXPECT_THROW(ClientFingerprint::parse("771,4865,0,29,0,"), Exception);
}

TEST_F(ClientFingerprintTest, ErrorCodeOverload)
{
    std::error_code ec;

    auto fp = ClientFingerprint::parse("771,4865,0,29,0", ec);
    EXPECT_FALSE(ec);
    EXPECT_EQ(fp.toString(), "771,4865,0,29,0");

    fp = ClientFingerprint::parse("771,4865,0,29,256", ec);
    EXPECT_EQ(ec, make_error_code(Errc::MalformedText));
    EXPECT_EQ(fp, ClientFingerprint());

    ClientFingerprint::parse("771", ec);
    EXPECT_FALSE(ec);
}

TEST_F(ClientFingerprintTest, ExceptionCarriesErrorCode)
{
    try
    {
        ClientFingerprint::parse("771,4865,zz,29,0");
        FAIL() << "Expected exception";
    }
    catch (const Exception& e)
    {
        EXPECT_EQ(e.code(), make_error_code(Errc::MalformedText));
        EXPECT_NE(std::string(e.what()).find("zz"), std::string::npos);
    }
}
