#include <openssl/ssl.h>
#include <tlsfp/tls/cipher_suite_catalog.hpp>
#include <casket/utils/exception.hpp>

namespace tlsfp::tls
{

struct CipherSuiteCatalog::Impl final
{
public:
    Impl()
        : ctx(SSL_CTX_new(TLS_method()))
        , ssl(nullptr)
    {
        casket::ThrowIfFalse(ctx != nullptr, "Failed to create SSL context");

        casket::ThrowIfFalse(SSL_CTX_set_cipher_list(ctx, "ALL:COMPLEMENTOFALL") == 1,
                             "Failed to set cipher list");

        ssl = SSL_new(ctx);
        casket::ThrowIfFalse(ssl != nullptr, "Failed to create SSL handle");
    }

    ~Impl() noexcept
    {
        SSL_free(ssl);
        SSL_CTX_free(ctx);
    }

    SSL_CTX* ctx;
    SSL* ssl;
};

CipherSuiteCatalog::CipherSuiteCatalog()
    : impl_(std::make_unique<Impl>())
{
}

CipherSuiteCatalog::~CipherSuiteCatalog() noexcept
{
}

CipherSuiteCatalog& CipherSuiteCatalog::getInstance()
{
    static CipherSuiteCatalog instance;
    return instance;
}

std::optional<std::string> CipherSuiteCatalog::getStandardName(CipherSuiteCode code) const
{
    const unsigned char bytes[2] = {static_cast<unsigned char>(code.code() >> 8),
                                    static_cast<unsigned char>(code.code() & 0xFF)};

    const SSL_CIPHER* cipher = SSL_CIPHER_find(impl_->ssl, bytes);
    if (cipher == nullptr)
    {
        return std::nullopt;
    }

    const char* name = SSL_CIPHER_standard_name(cipher);
    if (name == nullptr)
    {
        return std::nullopt;
    }
    return std::string(name);
}

std::string CipherSuiteCatalog::getName(CipherSuiteCode code) const
{
    auto name = getStandardName(code);
    return name.value_or(code.toString());
}

} // namespace tlsfp::tls
