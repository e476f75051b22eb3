/// @file
/// @brief Declaration of the JA3S server fingerprint.

#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <tlsfp/tls/version.hpp>
#include <tlsfp/tls/cipher_suite_code.hpp>
#include <tlsfp/tls/extension_type.hpp>

namespace tlsfp::ja3
{

/// @brief JA3S server fingerprint (pre-hash form).
///
/// Text format: `versions,ciphers,extensions`. The text is split into exactly three
/// fields, so commas after the second one belong to the extensions field and make
/// parsing fail (e.g. a full JA3 string is not accepted as JA3S).
///
/// @see https://github.com/salesforce/ja3
struct ServerFingerprint final
{
    static constexpr std::size_t kFieldCount = 3;

    /// SSL Version(s) - first part of the fingerprint.
    std::vector<tls::ProtocolVersion> protocolVersions;
    /// Cipher(s) - second part of the fingerprint.
    std::vector<tls::CipherSuiteCode> cipherSuites;
    /// SSL Extension(s) - third part of the fingerprint.
    std::vector<tls::ExtensionType> extensions;

    /// @brief Parses a fingerprint string.
    /// @throws Exception with Errc::MalformedText if a token is not a valid code.
    static ServerFingerprint parse(std::string_view text);

    /// @brief Parses a fingerprint string without throwing.
    static ServerFingerprint parse(std::string_view text, std::error_code& ec);

    std::string toString() const;

    bool operator==(const ServerFingerprint& other) const;

    bool operator!=(const ServerFingerprint& other) const
    {
        return !(*this == other);
    }
};

using Ja3s = ServerFingerprint;

} // namespace tlsfp::ja3
