#include <didkey/common/error.hpp>
#include <didkey/identity/key_material.hpp>
#include <keylock/keylock.hpp>

namespace didkey {

    namespace {

        constexpr size_t ED25519_SEED_SIZE = 32;

        /// Ed25519 via keylock. The secret key is kept as the 32-byte seed; keylock signs with
        /// the expanded seed || public key form.
        class Ed25519KeyMaterial : public KeyMaterial {
          public:
            Ed25519KeyMaterial(Key key, Bytes public_key, Bytes seed)
                : KeyMaterial(KeyFamily::Ed25519, std::move(key), std::move(public_key), std::move(seed)) {}

            dp::Result<Bytes, dp::Error> sign(const Bytes &data) const override {
                if (!hasSecretKey())
                    return dp::Result<Bytes, dp::Error>::err(signing_failed("No secret key available"));

                Bytes private_key = secret_key_;
                append(private_key, public_key_);

                keylock::keylock crypto(keylock::Algorithm::Ed25519);
                auto result = crypto.sign(data, private_key);
                if (!result.success) {
                    return dp::Result<Bytes, dp::Error>::err(
                        make_error(ERR_SIGNING_FAILED, "Ed25519 signing failed: " + result.error_message));
                }
                return dp::Result<Bytes, dp::Error>::ok(result.data);
            }

            dp::Result<bool, dp::Error> verify(const Bytes &data, const Bytes &signature) const override {
                keylock::keylock crypto(keylock::Algorithm::Ed25519);
                auto result = crypto.verify(data, signature, public_key_);
                return dp::Result<bool, dp::Error>::ok(result.success);
            }
        };

    } // namespace

    dp::Result<KeyHandle, dp::Error> loadEd25519Key(const Key &key) {
        auto decoded = decodePublicKey(key.publicKeyMultibase);
        if (decoded.is_err())
            return dp::Result<KeyHandle, dp::Error>::err(decoded.error());

        Bytes seed;
        if (key.hasSecretKey()) {
            auto secret = decodeSecretKey(KeyFamily::Ed25519, *key.secretKeyMultibase);
            if (secret.is_err())
                return dp::Result<KeyHandle, dp::Error>::err(secret.error());
            seed = secret.value();
        }

        return dp::Result<KeyHandle, dp::Error>::ok(
            std::make_shared<Ed25519KeyMaterial>(key, decoded.value().bytes, seed));
    }

    dp::Result<Key, dp::Error> generateEd25519Key() {
        keylock::keylock crypto(keylock::Algorithm::Ed25519);
        auto keypair = crypto.generate_keypair();

        if (keypair.private_key.size() < ED25519_SEED_SIZE || keypair.public_key.size() != 32) {
            return dp::Result<Key, dp::Error>::err(key_generation_failed("Failed to generate Ed25519 keypair"));
        }

        Bytes seed(keypair.private_key.begin(), keypair.private_key.begin() + ED25519_SEED_SIZE);
        return dp::Result<Key, dp::Error>::ok(makeKey(KeyFamily::Ed25519, keypair.public_key, seed));
    }

} // namespace didkey
