#ifndef ENCSTREAM_CRYPTO_ERROR_HPP
#define ENCSTREAM_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace encstream::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Bad key material or an OpenSSL context that could not be set up
class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message)
        : CryptoError("Initialization error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

// Input the stream format cannot represent (e.g. a zero-length source)
class InvalidInputError : public CryptoError {
public:
    explicit InvalidInputError(const std::string& message)
        : CryptoError("Invalid input: " + message) {}
};

// Block counter would overflow the 31 bits left beside the final-block flag
class CapacityExceededError : public CryptoError {
public:
    explicit CapacityExceededError(const std::string& message)
        : CryptoError("Capacity exceeded: " + message) {}
};

class MalformedHeaderError : public CryptoError {
public:
    explicit MalformedHeaderError(const std::string& message)
        : CryptoError("Malformed header: " + message) {}
};

// A block failed verification under both the regular and the final nonce
class AuthenticationError : public CryptoError {
public:
    explicit AuthenticationError(const std::string& message)
        : CryptoError("Authentication failure: " + message) {}
};

class IncompleteStreamError : public CryptoError {
public:
    explicit IncompleteStreamError(const std::string& message)
        : CryptoError("Incomplete stream: " + message) {}
};

// Ciphertext continued past an authenticated final block
class TrailingDataError : public CryptoError {
public:
    explicit TrailingDataError(const std::string& message)
        : CryptoError("Trailing data: " + message) {}
};

class ClosedStreamError : public CryptoError {
public:
    explicit ClosedStreamError(const std::string& message)
        : CryptoError("Closed stream: " + message) {}
};

} // namespace encstream::crypto

#endif // ENCSTREAM_CRYPTO_ERROR_HPP
