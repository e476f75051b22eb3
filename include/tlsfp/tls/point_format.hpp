#pragma once
#include <cstdint>
#include <string>
#include <openssl/tls1.h>

namespace tlsfp::tls
{

/// @brief EC point format identifier (8-bit code space).
class ECPointFormat final
{
public:
    enum FormatCode : std::uint8_t
    {
        UNCOMPRESSED = TLSEXT_ECPOINTFORMAT_uncompressed,
        ANSIX962_COMPRESSED_PRIME = TLSEXT_ECPOINTFORMAT_ansiX962_compressed_prime,
        ANSIX962_COMPRESSED_CHAR2 = TLSEXT_ECPOINTFORMAT_ansiX962_compressed_char2,
    };

    constexpr ECPointFormat()
        : format_(0)
    {
    }

    constexpr ECPointFormat(FormatCode format)
        : format_(static_cast<std::uint8_t>(format))
    {
    }

    explicit constexpr ECPointFormat(std::uint8_t format)
        : format_(format)
    {
    }

    inline std::uint8_t code() const noexcept
    {
        return format_;
    }

    inline bool operator==(const ECPointFormat& other) const noexcept
    {
        return format_ == other.format_;
    }

    inline bool operator!=(const ECPointFormat& other) const noexcept
    {
        return format_ != other.format_;
    }

    inline bool operator<(const ECPointFormat& other) const noexcept
    {
        return format_ < other.format_;
    }

    std::string toString() const;

private:
    std::uint8_t format_;
};

} // namespace tlsfp::tls
