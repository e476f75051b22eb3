#include <tlsfp/ja3/server_fingerprint.hpp>
#include <tlsfp/ja3/exception.hpp>
#include <tlsfp/ja3/field_codec.hpp>

#include <casket/utils/format.hpp>

namespace tlsfp::ja3
{

using Reader = detail::FieldReader<ServerFingerprint::kFieldCount>;

static ServerFingerprint Read(Reader& reader)
{
    ServerFingerprint fp;
    reader.read<std::uint16_t>(fp.protocolVersions);
    reader.read<std::uint16_t>(fp.cipherSuites);
    reader.read<std::uint16_t>(fp.extensions);
    return fp;
}

ServerFingerprint ServerFingerprint::parse(std::string_view text)
{
    Reader reader(text);
    auto fp = Read(reader);
    if (reader.failed())
    {
        throw Exception(reader.error(), casket::format("JA3S field {}: invalid token '{}'", reader.failedField(),
                                                       reader.failedToken()));
    }
    return fp;
}

ServerFingerprint ServerFingerprint::parse(std::string_view text, std::error_code& ec)
{
    Reader reader(text);
    auto fp = Read(reader);
    ec = reader.error();
    if (ec)
    {
        return ServerFingerprint();
    }
    return fp;
}

std::string ServerFingerprint::toString() const
{
    detail::FieldWriter writer;
    writer.write(protocolVersions);
    writer.write(cipherSuites);
    writer.write(extensions);
    return writer.release();
}

bool ServerFingerprint::operator==(const ServerFingerprint& other) const
{
    return protocolVersions == other.protocolVersions && cipherSuites == other.cipherSuites &&
           extensions == other.extensions;
}

} // namespace tlsfp::ja3
