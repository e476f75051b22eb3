/// @file
/// @brief Declaration of the ProtocolVersion class.

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <openssl/ssl.h>

namespace tlsfp::tls
{

/// @brief Class representing a protocol version code.
///
/// Any 16-bit value is accepted, named constants cover the well-known versions.
class ProtocolVersion final
{
public:
    /// @brief Enum representing the version code.
    enum VersionCode : std::uint16_t
    {
        SSLv3_0 = SSL3_VERSION,
        TLSv1_0 = TLS1_VERSION,
        TLSv1_1 = TLS1_1_VERSION,
        TLSv1_2 = TLS1_2_VERSION,
        TLSv1_3 = TLS1_3_VERSION
    };

    /// @brief Default constructor.
    constexpr ProtocolVersion()
        : version_(0)
    {
    }

    /// @brief Constructor with version code.
    /// @param code The version code.
    explicit constexpr ProtocolVersion(std::uint16_t code)
        : version_(code)
    {
    }

    /// @brief Constructor with named version.
    /// @param version A specific named version of the protocol.
    constexpr ProtocolVersion(VersionCode version)
        : ProtocolVersion(static_cast<std::uint16_t>(version))
    {
    }

    /// @brief Constructor with major and minor version.
    /// @param major The major version.
    /// @param minor The minor version.
    constexpr ProtocolVersion(std::uint8_t major, std::uint8_t minor)
        : ProtocolVersion(static_cast<std::uint16_t>((static_cast<std::uint16_t>(major) << 8) | minor))
    {
    }

    /// @brief Gets the major version of the protocol version.
    /// @return The major version.
    inline std::uint8_t majorVersion() const noexcept
    {
        return static_cast<std::uint8_t>(version_ >> 8);
    }

    /// @brief Gets the minor version of the protocol version.
    /// @return The minor version.
    inline std::uint8_t minorVersion() const noexcept
    {
        return static_cast<std::uint8_t>(version_ & 0xFF);
    }

    /// @brief Gets the version code.
    /// @return The version code.
    inline std::uint16_t code() const noexcept
    {
        return version_;
    }

    inline bool operator==(const ProtocolVersion& other) const noexcept
    {
        return (version_ == other.version_);
    }

    inline bool operator!=(const ProtocolVersion& other) const noexcept
    {
        return (version_ != other.version_);
    }

    inline bool operator<(const ProtocolVersion& other) const noexcept
    {
        return version_ < other.version_;
    }

    /// @brief Generates a human-readable version string.
    /// @return A human-readable description of this version.
    std::string toString() const;

    /// @brief Creates a ProtocolVersion from a string.
    /// @param str The string representation of the version, e.g. "TLSv1.2".
    /// @return An optional containing the ProtocolVersion if successful, otherwise std::nullopt.
    static std::optional<ProtocolVersion> fromString(std::string_view str);

private:
    std::uint16_t version_;
};

} // namespace tlsfp::tls
