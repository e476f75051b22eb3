#include <tlsfp/ja3/error_code.hpp>
#include <tlsfp/ja3/error_category.hpp>

namespace tlsfp::ja3
{

std::error_code make_error_code(Errc e)
{
    return std::error_code{static_cast<int>(e), ErrorCategory::Instance()};
}

} // namespace tlsfp::ja3
