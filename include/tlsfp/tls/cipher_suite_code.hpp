/// @file
/// @brief Declaration of the CipherSuiteCode class.

#pragma once
#include <cstdint>
#include <string>

namespace tlsfp::tls
{

/// @brief Well-known cipher suite identifiers (IANA registry).
enum class CipherSuiteId : std::uint16_t
{
    TLS_NULL_WITH_NULL_NULL = 0x0000,
    TLS_RSA_WITH_3DES_EDE_CBC_SHA = 0x000A,
    TLS_RSA_WITH_AES_128_CBC_SHA = 0x002F,
    TLS_RSA_WITH_AES_256_CBC_SHA = 0x0035,
    TLS_RSA_WITH_AES_128_CBC_SHA256 = 0x003C,
    TLS_RSA_WITH_AES_256_CBC_SHA256 = 0x003D,
    TLS_RSA_WITH_AES_128_GCM_SHA256 = 0x009C,
    TLS_RSA_WITH_AES_256_GCM_SHA384 = 0x009D,
    TLS_EMPTY_RENEGOTIATION_INFO_SCSV = 0x00FF,

    TLS_AES_128_GCM_SHA256 = 0x1301,
    TLS_AES_256_GCM_SHA384 = 0x1302,
    TLS_CHACHA20_POLY1305_SHA256 = 0x1303,
    TLS_AES_128_CCM_SHA256 = 0x1304,
    TLS_AES_128_CCM_8_SHA256 = 0x1305,

    TLS_FALLBACK_SCSV = 0x5600,

    TLS_ECDHE_ECDSA_WITH_AES_128_CBC_SHA = 0xC009,
    TLS_ECDHE_ECDSA_WITH_AES_256_CBC_SHA = 0xC00A,
    TLS_ECDHE_RSA_WITH_AES_128_CBC_SHA = 0xC013,
    TLS_ECDHE_RSA_WITH_AES_256_CBC_SHA = 0xC014,
    TLS_ECDHE_ECDSA_WITH_AES_128_CBC_SHA256 = 0xC023,
    TLS_ECDHE_ECDSA_WITH_AES_256_CBC_SHA384 = 0xC024,
    TLS_ECDHE_RSA_WITH_AES_128_CBC_SHA256 = 0xC027,
    TLS_ECDHE_RSA_WITH_AES_256_CBC_SHA384 = 0xC028,
    TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256 = 0xC02B,
    TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384 = 0xC02C,
    TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256 = 0xC02F,
    TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384 = 0xC030,
    TLS_ECDHE_RSA_WITH_CHACHA20_POLY1305_SHA256 = 0xCCA8,
    TLS_ECDHE_ECDSA_WITH_CHACHA20_POLY1305_SHA256 = 0xCCA9,
};

/// @brief Cipher suite code as sent in a ClientHello or selected in a ServerHello.
///
/// Wraps the raw 16-bit identifier, so unknown and GREASE values survive unchanged.
class CipherSuiteCode final
{
public:
    using enum CipherSuiteId;

    /// @brief Default constructor (TLS_NULL_WITH_NULL_NULL).
    constexpr CipherSuiteCode()
        : id_(0)
    {
    }

    /// @brief Constructor with named cipher suite.
    /// @param id Cipher suite identifier.
    constexpr CipherSuiteCode(CipherSuiteId id)
        : id_(static_cast<std::uint16_t>(id))
    {
    }

    /// @brief Constructor with raw cipher suite code.
    /// @param id Cipher suite code.
    explicit constexpr CipherSuiteCode(std::uint16_t id)
        : id_(id)
    {
    }

    /// @brief Constructor with the two wire bytes.
    /// @param first First byte.
    /// @param second Second byte.
    constexpr CipherSuiteCode(std::uint8_t first, std::uint8_t second)
        : id_(static_cast<std::uint16_t>((static_cast<std::uint16_t>(first) << 8) | second))
    {
    }

    /// @brief Gets the cipher suite code.
    /// @return The cipher suite code.
    constexpr std::uint16_t code() const noexcept
    {
        return id_;
    }

    constexpr bool operator==(CipherSuiteCode other) const noexcept
    {
        return id_ == other.id_;
    }

    constexpr bool operator!=(CipherSuiteCode other) const noexcept
    {
        return id_ != other.id_;
    }

    constexpr bool operator<(CipherSuiteCode other) const noexcept
    {
        return id_ < other.id_;
    }

    /// @brief Checks whether the code is a reserved GREASE value (RFC 8701).
    constexpr bool isGrease() const noexcept
    {
        return (id_ & 0x0F0F) == 0x0A0A && (id_ >> 8) == (id_ & 0xFF);
    }

    /// @brief Gets the IANA name of the cipher suite.
    /// @return The name for a well-known code, "Unknown(0xXXXX)" otherwise.
    std::string toString() const;

private:
    std::uint16_t id_;
};

} // namespace tlsfp::tls
