#include <tlsfp/tls/version.hpp>
#include <casket/utils/string.hpp>

namespace tlsfp::tls
{

std::string ProtocolVersion::toString() const
{
    const std::uint8_t maj = majorVersion();
    const std::uint8_t min = minorVersion();

    if (maj == 3 && min == 0)
    {
        return "SSLv3.0";
    }

    if (maj == 3 && min >= 1 && min <= 4)
    {
        return "TLSv1." + std::to_string(min - 1);
    }

    return "Unknown version " + std::to_string(maj) + "." + std::to_string(min);
}

std::optional<ProtocolVersion> ProtocolVersion::fromString(std::string_view str)
{
    if (casket::iequals(str, "sslv3.0"))
    {
        return VersionCode::SSLv3_0;
    }
    else if (casket::iequals(str, "tlsv1.0"))
    {
        return VersionCode::TLSv1_0;
    }
    else if (casket::iequals(str, "tlsv1.1"))
    {
        return VersionCode::TLSv1_1;
    }
    else if (casket::iequals(str, "tlsv1.2"))
    {
        return VersionCode::TLSv1_2;
    }
    else if (casket::iequals(str, "tlsv1.3"))
    {
        return VersionCode::TLSv1_3;
    }
    return std::nullopt;
}

} // namespace tlsfp::tls
