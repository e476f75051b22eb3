/// @file
/// @brief Declaration of the cipher suite catalog class.

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <tlsfp/tls/cipher_suite_code.hpp>

namespace tlsfp::tls
{

/// @brief Looks up cipher suite names in the OpenSSL cipher table.
class CipherSuiteCatalog final
{
private:
    /// @brief Default constructor.
    CipherSuiteCatalog();

public:
    CipherSuiteCatalog(const CipherSuiteCatalog& other) = delete;
    CipherSuiteCatalog& operator=(const CipherSuiteCatalog& other) = delete;

    /// @brief Gets the singleton instance of the CipherSuiteCatalog.
    /// @return Reference to the CipherSuiteCatalog instance.
    static CipherSuiteCatalog& getInstance();

    /// @brief Destructor.
    ~CipherSuiteCatalog() noexcept;

    /// @brief Gets the RFC name of a cipher suite known to OpenSSL.
    /// @param code The cipher suite code.
    /// @return The RFC name, or std::nullopt if OpenSSL does not know the suite.
    std::optional<std::string> getStandardName(CipherSuiteCode code) const;

    /// @brief Gets the display name of a cipher suite.
    ///
    /// Falls back to CipherSuiteCode::toString() when OpenSSL does not know the suite.
    std::string getName(CipherSuiteCode code) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tlsfp::tls
