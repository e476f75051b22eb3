/// @file
/// @brief Declaration of error codes for fingerprint parsing.

#pragma once
#include <system_error>
#include <type_traits>

namespace tlsfp::ja3
{

/// @brief Fingerprint error conditions.
enum class Errc
{
    MalformedText = 1 ///< Fingerprint text contains a token that is not a valid code.
};

/// @brief Makes an error code for the fingerprint error category.
/// @param e The error condition.
/// @return The corresponding std::error_code.
std::error_code make_error_code(Errc e);

} // namespace tlsfp::ja3

namespace std
{

template <>
struct is_error_code_enum<tlsfp::ja3::Errc> : true_type
{
};

} // namespace std
