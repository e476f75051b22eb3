#include <algorithm>
#include <array>
#include <utility>
#include <tlsfp/tls/named_group.hpp>
#include <casket/utils/format.hpp>

namespace tlsfp::tls
{

static constexpr std::array<std::pair<NamedGroupCode, const char*>, 33> gNamedGroups = {{
    {NamedGroupCode::SECT163K1, "sect163k1"},
    {NamedGroupCode::SECT163R2, "sect163r2"},
    {NamedGroupCode::SECT233K1, "sect233k1"},
    {NamedGroupCode::SECT233R1, "sect233r1"},
    {NamedGroupCode::SECT283K1, "sect283k1"},
    {NamedGroupCode::SECT283R1, "sect283r1"},
    {NamedGroupCode::SECT409K1, "sect409k1"},
    {NamedGroupCode::SECT409R1, "sect409r1"},
    {NamedGroupCode::SECT571K1, "sect571k1"},
    {NamedGroupCode::SECT571R1, "sect571r1"},
    {NamedGroupCode::SECP160K1, "secp160k1"},
    {NamedGroupCode::SECP160R1, "secp160r1"},
    {NamedGroupCode::SECP160R2, "secp160r2"},
    {NamedGroupCode::SECP192K1, "secp192k1"},
    {NamedGroupCode::SECP192R1, "secp192r1"},
    {NamedGroupCode::SECP224K1, "secp224k1"},
    {NamedGroupCode::SECP224R1, "secp224r1"},
    {NamedGroupCode::SECP256K1, "secp256k1"},
    {NamedGroupCode::SECP256R1, "secp256r1"},
    {NamedGroupCode::SECP384R1, "secp384r1"},
    {NamedGroupCode::SECP521R1, "secp521r1"},
    {NamedGroupCode::BRAINPOOL256R1, "brainpoolP256r1"},
    {NamedGroupCode::BRAINPOOL384R1, "brainpoolP384r1"},
    {NamedGroupCode::BRAINPOOL512R1, "brainpoolP512r1"},
    {NamedGroupCode::X25519, "x25519"},
    {NamedGroupCode::X448, "x448"},
    {NamedGroupCode::FFDHE_2048, "ffdhe2048"},
    {NamedGroupCode::FFDHE_3072, "ffdhe3072"},
    {NamedGroupCode::FFDHE_4096, "ffdhe4096"},
    {NamedGroupCode::FFDHE_6144, "ffdhe6144"},
    {NamedGroupCode::FFDHE_8192, "ffdhe8192"},
    {NamedGroupCode::X25519_MLKEM768, "X25519MLKEM768"},
    {NamedGroupCode::NONE, "none"},
}};

std::string NamedGroup::toString() const
{
    auto found = std::find_if(gNamedGroups.begin(), gNamedGroups.end(), [this](const auto& entry) {
        return static_cast<std::uint16_t>(entry.first) == m_code;
    });

    if (found != gNamedGroups.end())
    {
        return found->second;
    }
    return casket::format("Unknown({})", m_code);
}

} // namespace tlsfp::tls
