#pragma once
#include <charconv>
#include <system_error>
#include <string_view>
#include <type_traits>

#include <casket/utils/exception.hpp>

namespace tlsfp::utils
{

/// @brief Converts a decimal string to an integer.
///
/// The whole @p value must be consumed, otherwise @p ec is set to
/// std::errc::invalid_argument. Signs and whitespace are not accepted.
template <typename T>
inline void to_number(std::string_view value, T& result, std::error_code& ec)
{
    static_assert(std::is_integral_v<T> == true);
    auto r = std::from_chars(value.data(), value.data() + value.size(), result);
    if (r.ec != std::errc())
    {
        ec = std::make_error_code(r.ec);
    }
    else if (r.ptr != value.data() + value.size())
    {
        ec = std::make_error_code(std::errc::invalid_argument);
    }
}

template <typename T>
inline void to_number(std::string_view value, T& result)
{
    std::error_code ec;
    to_number<T>(value, result, ec);
    casket::ThrowIfError(ec);
}

} // namespace tlsfp::utils
