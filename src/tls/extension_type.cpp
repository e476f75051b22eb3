#include <tlsfp/tls/extension_type.hpp>
#include <casket/utils/format.hpp>

namespace tlsfp::tls
{

static const char* ExtensionCodeToString(const ExtensionCode code)
{
    switch (code)
    {
    case ExtensionCode::ServerNameIndication:
        return "ServerNameIndication";
    case ExtensionCode::MaxFragmentLength:
        return "MaxFragmentLength";
    case ExtensionCode::StatusRequest:
        return "StatusRequest";
    case ExtensionCode::SupportedGroups:
        return "SupportedGroups";
    case ExtensionCode::ECPointFormats:
        return "ECPointFormats";
    case ExtensionCode::SignatureAlgorithms:
        return "SignatureAlgorithms";
    case ExtensionCode::UseSrtp:
        return "UseSrtp";
    case ExtensionCode::Heartbeat:
        return "Heartbeat";
    case ExtensionCode::AppLayerProtocolNegotiation:
        return "AppLayerProtocolNegotiation";
    case ExtensionCode::SignedCertificateTimestamp:
        return "SignedCertificateTimestamp";
    case ExtensionCode::ClientCertificateType:
        return "ClientCertificateType";
    case ExtensionCode::ServerCertificateType:
        return "ServerCertificateType";
    case ExtensionCode::Padding:
        return "Padding";
    case ExtensionCode::EncryptThenMac:
        return "EncryptThenMac";
    case ExtensionCode::ExtendedMasterSecret:
        return "ExtendedMasterSecret";
    case ExtensionCode::CompressCertificate:
        return "CompressCertificate";
    case ExtensionCode::RecordSizeLimit:
        return "RecordSizeLimit";
    case ExtensionCode::SessionTicket:
        return "SessionTicket";
    case ExtensionCode::PreSharedKey:
        return "PreSharedKey";
    case ExtensionCode::EarlyData:
        return "EarlyData";
    case ExtensionCode::SupportedVersions:
        return "SupportedVersions";
    case ExtensionCode::Cookie:
        return "Cookie";
    case ExtensionCode::PskKeyExchangeModes:
        return "PskKeyExchangeModes";
    case ExtensionCode::CertificateAuthorities:
        return "CertificateAuthorities";
    case ExtensionCode::PostHandshakeAuth:
        return "PostHandshakeAuth";
    case ExtensionCode::SignatureAlgorithmsCert:
        return "SignatureAlgorithmsCert";
    case ExtensionCode::KeyShare:
        return "KeyShare";
    case ExtensionCode::ApplicationSettings:
        return "ApplicationSettings";
    case ExtensionCode::EncryptedClientHello:
        return "EncryptedClientHello";
    case ExtensionCode::SafeRenegotiation:
        return "SafeRenegotiation";
    default:
        return nullptr;
    }
}

std::string ExtensionType::toString() const
{
    const char* name = ExtensionCodeToString(static_cast<ExtensionCode>(code_));
    if (name)
    {
        return name;
    }
    return casket::format("Unknown({})", code_);
}

} // namespace tlsfp::tls
