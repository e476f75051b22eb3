#pragma once
#include <cstdint>
#include <string>

namespace tlsfp::tls
{

/// @brief Enumeration of the well-known TLS extension codes.
enum class ExtensionCode : std::uint16_t
{
    ServerNameIndication = 0,         ///< Server Name Indication (SNI) extension.
    MaxFragmentLength = 1,            ///< Maximum Fragment Length (RFC 6066).
    StatusRequest = 5,                ///< Certificate Status Request (OCSP stapling).
    SupportedGroups = 10,             ///< Supported Groups Extension (RFC 7919).
    ECPointFormats = 11,              ///< Supported EC Point Formats.
    SignatureAlgorithms = 13,         ///< Signature Algorithms (RFC 8446).
    UseSrtp = 14,                     ///< DTLS-SRTP (RFC 5764).
    Heartbeat = 15,                   ///< Heartbeat (RFC 6520).
    AppLayerProtocolNegotiation = 16, ///< Application Layer Protocol Negotiation (ALPN) extension.
    SignedCertificateTimestamp = 18,  ///< Certificate Transparency (RFC 6962).
    ClientCertificateType = 19,       ///< Client Certificate Type extension.
    ServerCertificateType = 20,       ///< Server Certificate Type extension.
    Padding = 21,                     ///< ClientHello padding (RFC 7685).
    EncryptThenMac = 22,              ///< Encrypt-then-MAC extension.
    ExtendedMasterSecret = 23,        ///< Extended Master Secret extension.
    CompressCertificate = 27,         ///< Certificate compression (RFC 8879).
    RecordSizeLimit = 28,             ///< Record Size Limit extension.
    SessionTicket = 35,               ///< Session Ticket (RFC 5077).
    PreSharedKey = 41,                ///< Pre-Shared Key (RFC 8446).
    EarlyData = 42,                   ///< Early Data (RFC 8446).
    SupportedVersions = 43,           ///< Supported Versions extension.
    Cookie = 44,                      ///< Cookie (RFC 8446).
    PskKeyExchangeModes = 45,         ///< PSK Key Exchange Modes (RFC 8446).
    CertificateAuthorities = 47,      ///< Certificate Authorities (RFC 8446).
    PostHandshakeAuth = 49,           ///< Post-Handshake Client Authentication (RFC 8446).
    SignatureAlgorithmsCert = 50,     ///< Signature Algorithms for certificates (RFC 8446).
    KeyShare = 51,                    ///< Key Share (RFC 8446).
    ApplicationSettings = 17513,      ///< ALPS (draft).
    EncryptedClientHello = 65037,     ///< Encrypted Client Hello (draft).
    SafeRenegotiation = 65281,        ///< Safe Renegotiation extension.
};

/// @brief TLS extension type as it appears on the wire.
///
/// The code space is open: values without a named constant are kept as is.
class ExtensionType final
{
public:
    using enum ExtensionCode;

    constexpr ExtensionType()
        : code_(0)
    {
    }

    constexpr ExtensionType(ExtensionCode code)
        : code_(static_cast<std::uint16_t>(code))
    {
    }

    explicit constexpr ExtensionType(std::uint16_t code)
        : code_(code)
    {
    }

    constexpr std::uint16_t code() const noexcept
    {
        return code_;
    }

    constexpr bool operator==(ExtensionType other) const noexcept
    {
        return code_ == other.code_;
    }

    constexpr bool operator!=(ExtensionType other) const noexcept
    {
        return code_ != other.code_;
    }

    constexpr bool operator<(ExtensionType other) const noexcept
    {
        return code_ < other.code_;
    }

    /// @brief Gets the extension name.
    /// @return Name for a known extension code, "Unknown(<code>)" otherwise.
    std::string toString() const;

private:
    std::uint16_t code_;
};

} // namespace tlsfp::tls
