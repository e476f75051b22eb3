#include <tlsfp/ja3/client_fingerprint.hpp>
#include <tlsfp/ja3/exception.hpp>
#include <tlsfp/ja3/field_codec.hpp>

#include <casket/utils/format.hpp>

namespace tlsfp::ja3
{

using Reader = detail::FieldReader<ClientFingerprint::kFieldCount>;

static ClientFingerprint Read(Reader& reader)
{
    ClientFingerprint fp;
    reader.read<std::uint16_t>(fp.protocolVersions);
    reader.read<std::uint16_t>(fp.cipherSuites);
    reader.read<std::uint16_t>(fp.extensions);
    reader.read<std::uint16_t>(fp.ellipticCurves);
    reader.read<std::uint8_t>(fp.ellipticCurvePointFormats);
    return fp;
}

ClientFingerprint ClientFingerprint::parse(std::string_view text)
{
    Reader reader(text);
    auto fp = Read(reader);
    if (reader.failed())
    {
        throw Exception(reader.error(), casket::format("JA3 field {}: invalid token '{}'", reader.failedField(),
                                                       reader.failedToken()));
    }
    return fp;
}

ClientFingerprint ClientFingerprint::parse(std::string_view text, std::error_code& ec)
{
    Reader reader(text);
    auto fp = Read(reader);
    ec = reader.error();
    if (ec)
    {
        return ClientFingerprint();
    }
    return fp;
}

std::string ClientFingerprint::toString() const
{
    detail::FieldWriter writer;
    writer.write(protocolVersions);
    writer.write(cipherSuites);
    writer.write(extensions);
    writer.write(ellipticCurves);
    writer.write(ellipticCurvePointFormats);
    return writer.release();
}

bool ClientFingerprint::operator==(const ClientFingerprint& other) const
{
    return protocolVersions == other.protocolVersions && cipherSuites == other.cipherSuites &&
           extensions == other.extensions && ellipticCurves == other.ellipticCurves &&
           ellipticCurvePointFormats == other.ellipticCurvePointFormats;
}

} // namespace tlsfp::ja3
