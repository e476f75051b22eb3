#pragma once
#include <cstdint>
#include <string>

namespace tlsfp::tls
{

enum class NamedGroupCode : std::uint16_t
{
    NONE = 0,

    SECT163K1 = 1,
    SECT163R2 = 3,
    SECT233K1 = 6,
    SECT233R1 = 7,
    SECT283K1 = 9,
    SECT283R1 = 10,
    SECT409K1 = 11,
    SECT409R1 = 12,
    SECT571K1 = 13,
    SECT571R1 = 14,

    SECP160K1 = 15,
    SECP160R1 = 16,
    SECP160R2 = 17,
    SECP192K1 = 18,
    SECP192R1 = 19,
    SECP224K1 = 20,
    SECP224R1 = 21,
    SECP256K1 = 22,
    SECP256R1 = 23,
    SECP384R1 = 24,
    SECP521R1 = 25,

    BRAINPOOL256R1 = 26,
    BRAINPOOL384R1 = 27,
    BRAINPOOL512R1 = 28,

    X25519 = 29,
    X448 = 30,

    FFDHE_2048 = 256,
    FFDHE_3072 = 257,
    FFDHE_4096 = 258,
    FFDHE_6144 = 259,
    FFDHE_8192 = 260,

    X25519_MLKEM768 = 4588,
};

/// @brief Named group (elliptic curve or finite field group) identifier.
///
/// Values outside of NamedGroupCode are valid and preserved.
class NamedGroup final
{
public:
    using enum NamedGroupCode;

    constexpr NamedGroup()
        : m_code(0)
    {
    }

    constexpr NamedGroup(NamedGroupCode code)
        : m_code(static_cast<std::uint16_t>(code))
    {
    }

    explicit constexpr NamedGroup(std::uint16_t code)
        : m_code(code)
    {
    }

    constexpr bool operator==(NamedGroup other) const
    {
        return m_code == other.m_code;
    }

    constexpr bool operator!=(NamedGroup other) const
    {
        return m_code != other.m_code;
    }

    constexpr bool operator<(NamedGroup other) const
    {
        return m_code < other.m_code;
    }

    constexpr std::uint16_t code() const
    {
        return m_code;
    }

    constexpr bool isEllipticCurve() const
    {
        return (m_code >= 1 && m_code <= 30);
    }

    constexpr bool isFiniteField() const
    {
        return (m_code >= 256 && m_code <= 511);
    }

    /// @returns IANA group name, or "Unknown(<code>)".
    std::string toString() const;

private:
    std::uint16_t m_code;
};

} // namespace tlsfp::tls
