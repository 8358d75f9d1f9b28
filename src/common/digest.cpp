#include <didkey/common/digest.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace didkey {

    namespace {
        const EVP_MD *messageDigest(DigestAlgorithm algorithm) {
            switch (algorithm) {
            case DigestAlgorithm::SHA256:
                return EVP_sha256();
            case DigestAlgorithm::SHA384:
                return EVP_sha384();
            case DigestAlgorithm::SHA512:
                return EVP_sha512();
            case DigestAlgorithm::SM3:
                return EVP_sm3();
            default:
                return nullptr;
            }
        }
    } // namespace

    dp::Result<Bytes, dp::Error> digest(DigestAlgorithm algorithm, const Bytes &data) {
        const EVP_MD *md = messageDigest(algorithm);
        if (md == nullptr) {
            return dp::Result<Bytes, dp::Error>::err(dp::Error::invalid_argument("Unknown digest algorithm"));
        }

        Bytes out(EVP_MAX_MD_SIZE);
        unsigned int out_len = 0;
        if (EVP_Digest(data.data(), data.size(), out.data(), &out_len, md, nullptr) != 1) {
            return dp::Result<Bytes, dp::Error>::err(dp::Error::io_error(
                dp::String(("Digest computation failed: " + digestAlgorithmToString(algorithm)).c_str())));
        }
        out.resize(out_len);
        return dp::Result<Bytes, dp::Error>::ok(out);
    }

    dp::Result<Bytes, dp::Error> randomBytes(size_t count) {
        Bytes out(count);
        if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
            return dp::Result<Bytes, dp::Error>::err(dp::Error::io_error("Random number generator failed"));
        }
        return dp::Result<Bytes, dp::Error>::ok(out);
    }

    dp::Result<std::string, dp::Error> randomAlphanumeric(size_t length) {
        static const std::string charset = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

        std::string out;
        out.reserve(length);
        // Rejection sampling keeps the distribution uniform over the 62 symbols
        while (out.size() < length) {
            auto random = randomBytes(length - out.size() + 8);
            if (random.is_err())
                return dp::Result<std::string, dp::Error>::err(random.error());
            for (uint8_t byte : random.value()) {
                if (byte >= 248)
                    continue;
                out += charset[byte % charset.size()];
                if (out.size() == length)
                    break;
            }
        }
        return dp::Result<std::string, dp::Error>::ok(out);
    }

} // namespace didkey
