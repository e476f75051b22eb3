/// @file
/// @brief Exception type for fingerprint errors.

#pragma once

#include <string>
#include <system_error>

#include <tlsfp/ja3/error_code.hpp>

namespace tlsfp::ja3 {

/// @brief Main class for fingerprint exceptions.
class Exception final : public std::system_error {
public:
    /// @brief Constructor.
    ///
    /// @param ec Error code.
    explicit Exception(std::error_code ec)
        : std::system_error(ec) {
    }

    /// @brief Constructor.
    ///
    /// @param ec Error code.
    /// @param what_arg Error message.
    Exception(std::error_code ec, const std::string& what_arg)
        : std::system_error(ec, what_arg) {
    }
};

} // namespace tlsfp::ja3
