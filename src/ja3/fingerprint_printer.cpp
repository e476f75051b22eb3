#include <iomanip>
#include <tlsfp/ja3/fingerprint_printer.hpp>
#include <tlsfp/tls/cipher_suite_catalog.hpp>

namespace tlsfp::ja3
{

static constexpr int columnFieldWidth = 16;
static constexpr int columnCodeWidth = 10;
static constexpr int columnNameWidth = 48;

template <typename Code>
static std::string CodeName(const Code& code)
{
    return code.toString();
}

static std::string CodeName(const tls::CipherSuiteCode& code)
{
    return tls::CipherSuiteCatalog::getInstance().getName(code);
}

FingerprintPrinter::FingerprintPrinter(std::ostream& os)
    : os_(os)
{
}

void FingerprintPrinter::print(const ClientFingerprint& fp)
{
    printHeader();
    printField("Version", fp.protocolVersions);
    printField("Cipher", fp.cipherSuites);
    printField("Extension", fp.extensions);
    printField("Curve", fp.ellipticCurves);
    printField("PointFormat", fp.ellipticCurvePointFormats);
    os_ << std::endl << "JA3: " << fp.toString() << std::endl;
}

void FingerprintPrinter::print(const ServerFingerprint& fp)
{
    printHeader();
    printField("Version", fp.protocolVersions);
    printField("Cipher", fp.cipherSuites);
    printField("Extension", fp.extensions);
    os_ << std::endl << "JA3S: " << fp.toString() << std::endl;
}

void FingerprintPrinter::printHeader()
{
    // clang-format off
    os_ << std::left
        << std::setw(columnFieldWidth) << "Field"
        << std::setw(columnCodeWidth) << "Code"
        << "Name"
        << std::endl;
    // clang-format on

    os_ << std::string(columnFieldWidth + columnCodeWidth + columnNameWidth, '-') << std::endl;
}

template <typename Code>
void FingerprintPrinter::printField(std::string_view field, const std::vector<Code>& codes)
{
    for (const auto& code : codes)
    {
        // clang-format off
        os_ << std::left
            << std::setw(columnFieldWidth) << field
            << std::setw(columnCodeWidth) << static_cast<unsigned>(code.code())
            << CodeName(code)
            << std::endl;
        // clang-format on
    }
}

} // namespace tlsfp::ja3
