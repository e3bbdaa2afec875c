#ifndef MEDIAVAULT_CRYPTO_ERROR_HPP
#define MEDIAVAULT_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace mediavault::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message)
        : CryptoError("Digest error: " + message) {}
};

} // namespace mediavault::crypto

#endif // MEDIAVAULT_CRYPTO_ERROR_HPP
