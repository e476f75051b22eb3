/// @file
/// @brief Declaration of the FingerprintPrinter class.

#pragma once
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <tlsfp/ja3/client_fingerprint.hpp>
#include <tlsfp/ja3/server_fingerprint.hpp>

namespace tlsfp::ja3
{

/// @brief Prints a fingerprint as a table of codes with their symbolic names.
///
/// Every code is printed on its own row: field, decimal code, name. The table is
/// followed by the canonical fingerprint string.
class FingerprintPrinter final
{
public:
    /// @brief Constructor.
    /// @param[in] os Output stream.
    explicit FingerprintPrinter(std::ostream& os);

    /// @brief Prints a JA3 fingerprint.
    void print(const ClientFingerprint& fp);

    /// @brief Prints a JA3S fingerprint.
    void print(const ServerFingerprint& fp);

private:
    void printHeader();

    template <typename Code>
    void printField(std::string_view field, const std::vector<Code>& codes);

private:
    std::ostream& os_;
};

} // namespace tlsfp::ja3
