#include <tlsfp/tls/point_format.hpp>
#include <casket/utils/format.hpp>

namespace tlsfp::tls
{

std::string ECPointFormat::toString() const
{
    switch (format_)
    {
    case UNCOMPRESSED:
        return "uncompressed";
    case ANSIX962_COMPRESSED_PRIME:
        return "ansiX962_compressed_prime";
    case ANSIX962_COMPRESSED_CHAR2:
        return "ansiX962_compressed_char2";
    default:
        return casket::format("Unknown({})", static_cast<unsigned>(format_));
    }
}

} // namespace tlsfp::tls
