#pragma once

#include <didkey/common/encoding.hpp>

namespace didkey {

    enum class DigestAlgorithm { SHA256, SHA384, SHA512, SM3 };

    inline std::string digestAlgorithmToString(DigestAlgorithm algorithm) {
        switch (algorithm) {
        case DigestAlgorithm::SHA256:
            return "SHA-256";
        case DigestAlgorithm::SHA384:
            return "SHA-384";
        case DigestAlgorithm::SHA512:
            return "SHA-512";
        case DigestAlgorithm::SM3:
            return "SM3";
        default:
            return "Unknown";
        }
    }

    /// One-shot message digest via OpenSSL EVP
    dp::Result<Bytes, dp::Error> digest(DigestAlgorithm algorithm, const Bytes &data);

    inline dp::Result<Bytes, dp::Error> digest(DigestAlgorithm algorithm, const std::string &data) {
        return digest(algorithm, toBytes(data));
    }

    /// Cryptographically secure random bytes
    dp::Result<Bytes, dp::Error> randomBytes(size_t count);

    /// Random string drawn from [A-Za-z0-9]
    dp::Result<std::string, dp::Error> randomAlphanumeric(size_t length);

} // namespace didkey
