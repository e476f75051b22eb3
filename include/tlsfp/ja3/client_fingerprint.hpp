/// @file
/// @brief Declaration of the JA3 client fingerprint.

#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <tlsfp/tls/version.hpp>
#include <tlsfp/tls/cipher_suite_code.hpp>
#include <tlsfp/tls/extension_type.hpp>
#include <tlsfp/tls/named_group.hpp>
#include <tlsfp/tls/point_format.hpp>

namespace tlsfp::ja3
{

/// @brief JA3 client fingerprint (pre-hash form).
///
/// Text format: `versions,ciphers,extensions,curves,point_formats`, every field
/// a dash-separated list of decimal codes. Order of the codes is kept as is.
///
/// @see https://github.com/salesforce/ja3
struct ClientFingerprint final
{
    static constexpr std::size_t kFieldCount = 5;

    /// SSL Version(s) - first part of the fingerprint.
    std::vector<tls::ProtocolVersion> protocolVersions;
    /// Cipher(s) - second part of the fingerprint.
    std::vector<tls::CipherSuiteCode> cipherSuites;
    /// SSL Extension(s) - third part of the fingerprint.
    std::vector<tls::ExtensionType> extensions;
    /// Elliptic Curve(s) - fourth part of the fingerprint.
    std::vector<tls::NamedGroup> ellipticCurves;
    /// Elliptic Curve Point Format(s) - fifth part of the fingerprint.
    std::vector<tls::ECPointFormat> ellipticCurvePointFormats;

    /// @brief Parses a fingerprint string.
    ///
    /// @param[in] text Fingerprint string.
    ///
    /// @return Parsed fingerprint.
    ///
    /// @throws Exception with Errc::MalformedText if a token is not a valid code.
    static ClientFingerprint parse(std::string_view text);

    /// @brief Parses a fingerprint string.
    ///
    /// @param[in] text Fingerprint string.
    /// @param[out] ec Set to Errc::MalformedText on failure, cleared otherwise.
    ///
    /// @return Parsed fingerprint, or an empty one on failure.
    static ClientFingerprint parse(std::string_view text, std::error_code& ec);

    /// @brief Renders the fingerprint string.
    std::string toString() const;

    bool operator==(const ClientFingerprint& other) const;

    bool operator!=(const ClientFingerprint& other) const
    {
        return !(*this == other);
    }
};

using Ja3 = ClientFingerprint;

} // namespace tlsfp::ja3
