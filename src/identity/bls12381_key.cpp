#include <didkey/common/error.hpp>
#include <didkey/crypto/bbs.hpp>
#include <didkey/identity/key_material.hpp>

namespace didkey {

    namespace {

        /// BLS12-381 G2 key. Raw data signatures are BBS signatures over a single message.
        class Bls12381KeyMaterial : public KeyMaterial {
          public:
            Bls12381KeyMaterial(Key key, Bytes public_key, Bytes secret_key)
                : KeyMaterial(KeyFamily::Bls12381G2, std::move(key), std::move(public_key), std::move(secret_key)) {}

            dp::Result<Bytes, dp::Error> sign(const Bytes &data) const override {
                if (!hasSecretKey())
                    return dp::Result<Bytes, dp::Error>::err(signing_failed("No secret key available"));

                const auto &params = bbs::Params::standard();
                bbs::Fr sk;
                if (!bbs::deserialize(sk, secret_key_))
                    return dp::Result<Bytes, dp::Error>::err(signing_failed("Invalid BLS12-381 secret key"));

                auto sig = bbs::sign(params, sk, {bbs::hashToScalar(data)});
                return dp::Result<Bytes, dp::Error>::ok(sig.toBytes());
            }

            dp::Result<bool, dp::Error> verify(const Bytes &data, const Bytes &signature) const override {
                const auto &params = bbs::Params::standard();
                bbs::G2 pk;
                if (!bbs::deserialize(pk, public_key_)) {
                    return dp::Result<bool, dp::Error>::err(malformed_did("Invalid BLS12-381 public key point"));
                }

                auto sig = bbs::Signature::fromBytes(signature);
                if (sig.is_err())
                    return dp::Result<bool, dp::Error>::ok(false);
                return dp::Result<bool, dp::Error>::ok(bbs::verify(params, pk, {bbs::hashToScalar(data)}, sig.value()));
            }
        };

    } // namespace

    dp::Result<KeyHandle, dp::Error> loadBls12381Key(const Key &key) {
        auto decoded = decodePublicKey(key.publicKeyMultibase);
        if (decoded.is_err())
            return dp::Result<KeyHandle, dp::Error>::err(decoded.error());
        if (decoded.value().family != KeyFamily::Bls12381G2) {
            return dp::Result<KeyHandle, dp::Error>::err(unsupported_key_type("Not a BLS12-381 G2 key"));
        }

        Bytes secret;
        if (key.hasSecretKey()) {
            auto decoded_secret = decodeSecretKey(KeyFamily::Bls12381G2, *key.secretKeyMultibase);
            if (decoded_secret.is_err())
                return dp::Result<KeyHandle, dp::Error>::err(decoded_secret.error());
            secret = decoded_secret.value();
        }

        return dp::Result<KeyHandle, dp::Error>::ok(
            std::make_shared<Bls12381KeyMaterial>(key, decoded.value().bytes, secret));
    }

    dp::Result<Key, dp::Error> generateBls12381Key() {
        const auto &params = bbs::Params::standard();
        auto keypair = bbs::keygen(params);

        Bytes pk = bbs::serialize(keypair.pk);
        Bytes sk = bbs::serialize(keypair.sk);
        const auto &info = keyFamilyInfo(KeyFamily::Bls12381G2);
        if (pk.size() != info.public_key_size || sk.size() != info.secret_key_size) {
            return dp::Result<Key, dp::Error>::err(key_generation_failed("Unexpected BLS12-381 key encoding size"));
        }

        return dp::Result<Key, dp::Error>::ok(makeKey(KeyFamily::Bls12381G2, pk, sk));
    }

} // namespace didkey
