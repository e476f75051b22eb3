#include <tlsfp/ja3/error_category.hpp>
#include <tlsfp/ja3/error_code.hpp>

namespace tlsfp::ja3
{

const char* ErrorCategory::name() const noexcept
{
    return "JA3";
}

std::string ErrorCategory::message(int value) const
{
    switch (static_cast<Errc>(value))
    {
    case Errc::MalformedText:
        return "malformed fingerprint text";
    default:
        return "unknown fingerprint error";
    }
}

} // namespace tlsfp::ja3
