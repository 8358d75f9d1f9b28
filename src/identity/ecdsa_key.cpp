#include <didkey/common/error.hpp>
#include <didkey/identity/key_material.hpp>

#include <memory>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>

namespace didkey {

    namespace {

        struct EVP_PKEY_Deleter {
            void operator()(EVP_PKEY *p) const {
                if (p)
                    EVP_PKEY_free(p);
            }
        };
        struct EVP_PKEY_CTX_Deleter {
            void operator()(EVP_PKEY_CTX *p) const {
                if (p)
                    EVP_PKEY_CTX_free(p);
            }
        };
        struct EVP_MD_CTX_Deleter {
            void operator()(EVP_MD_CTX *p) const {
                if (p)
                    EVP_MD_CTX_free(p);
            }
        };
        struct OSSL_PARAM_BLD_Deleter {
            void operator()(OSSL_PARAM_BLD *p) const {
                if (p)
                    OSSL_PARAM_BLD_free(p);
            }
        };
        struct OSSL_PARAM_Deleter {
            void operator()(OSSL_PARAM *p) const {
                if (p)
                    OSSL_PARAM_free(p);
            }
        };
        struct BIGNUM_Deleter {
            void operator()(BIGNUM *p) const {
                if (p)
                    BN_clear_free(p);
            }
        };
        struct ECDSA_SIG_Deleter {
            void operator()(ECDSA_SIG *p) const {
                if (p)
                    ECDSA_SIG_free(p);
            }
        };

        using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter>;
        using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;
        using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;
        using OSSL_PARAM_BLD_ptr = std::unique_ptr<OSSL_PARAM_BLD, OSSL_PARAM_BLD_Deleter>;
        using OSSL_PARAM_ptr = std::unique_ptr<OSSL_PARAM, OSSL_PARAM_Deleter>;
        using BIGNUM_ptr = std::unique_ptr<BIGNUM, BIGNUM_Deleter>;
        using ECDSA_SIG_ptr = std::unique_ptr<ECDSA_SIG, ECDSA_SIG_Deleter>;

        /// OpenSSL key type and group for a curve family
        struct CurveSpec {
            const char *key_type;
            const char *group;
            const EVP_MD *(*md)();
        };

        CurveSpec curveSpec(KeyFamily family) {
            switch (family) {
            case KeyFamily::EcdsaP384:
                return {"EC", "secp384r1", EVP_sha384};
            case KeyFamily::EcdsaP521:
                return {"EC", "secp521r1", EVP_sha512};
            case KeyFamily::Sm2:
                return {"SM2", "SM2", EVP_sm3};
            case KeyFamily::EcdsaP256:
            default:
                return {"EC", "prime256v1", EVP_sha256};
            }
        }

        /// 0x04 || X || Y  ->  (0x02 | parity(Y)) || X
        Bytes compressPoint(const Bytes &point) {
            if (point.empty() || point[0] != 0x04)
                return point;
            size_t coord = (point.size() - 1) / 2;
            Bytes compressed;
            compressed.reserve(coord + 1);
            compressed.push_back(static_cast<uint8_t>(0x02 | (point.back() & 0x01)));
            compressed.insert(compressed.end(), point.begin() + 1, point.begin() + 1 + static_cast<std::ptrdiff_t>(coord));
            return compressed;
        }

        EVP_PKEY_ptr importKey(KeyFamily family, const Bytes &public_key, const Bytes &secret_key) {
            CurveSpec spec = curveSpec(family);

            EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, spec.key_type, nullptr));
            if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0)
                return EVP_PKEY_ptr(nullptr);

            OSSL_PARAM_BLD_ptr bld(OSSL_PARAM_BLD_new());
            if (!bld)
                return EVP_PKEY_ptr(nullptr);

            BIGNUM_ptr priv(nullptr);
            OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, spec.group, 0);
            OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY, public_key.data(), public_key.size());
            if (!secret_key.empty()) {
                priv.reset(BN_bin2bn(secret_key.data(), static_cast<int>(secret_key.size()), nullptr));
                if (!priv)
                    return EVP_PKEY_ptr(nullptr);
                OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_PRIV_KEY, priv.get());
            }

            OSSL_PARAM_ptr params(OSSL_PARAM_BLD_to_param(bld.get()));
            if (!params)
                return EVP_PKEY_ptr(nullptr);

            EVP_PKEY *raw_pkey = nullptr;
            int selection = secret_key.empty() ? EVP_PKEY_PUBLIC_KEY : EVP_PKEY_KEYPAIR;
            if (EVP_PKEY_fromdata(ctx.get(), &raw_pkey, selection, params.get()) <= 0)
                return EVP_PKEY_ptr(nullptr);
            return EVP_PKEY_ptr(raw_pkey);
        }

        /// DER ECDSA-Sig-Value -> fixed-width r || s
        Bytes derToP1363(const Bytes &der, size_t scalar_size) {
            const unsigned char *p = der.data();
            ECDSA_SIG_ptr sig(d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der.size())));
            if (!sig)
                return {};
            const BIGNUM *r = nullptr;
            const BIGNUM *s = nullptr;
            ECDSA_SIG_get0(sig.get(), &r, &s);

            Bytes out(scalar_size * 2);
            if (BN_bn2binpad(r, out.data(), static_cast<int>(scalar_size)) < 0 ||
                BN_bn2binpad(s, out.data() + scalar_size, static_cast<int>(scalar_size)) < 0)
                return {};
            return out;
        }

        /// Fixed-width r || s -> DER ECDSA-Sig-Value
        Bytes p1363ToDer(const Bytes &raw) {
            size_t half = raw.size() / 2;
            ECDSA_SIG_ptr sig(ECDSA_SIG_new());
            BIGNUM *r = BN_bin2bn(raw.data(), static_cast<int>(half), nullptr);
            BIGNUM *s = BN_bin2bn(raw.data() + half, static_cast<int>(half), nullptr);
            if (!sig || !r || !s || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
                BN_free(r);
                BN_free(s);
                return {};
            }

            int len = i2d_ECDSA_SIG(sig.get(), nullptr);
            if (len <= 0)
                return {};
            Bytes der(static_cast<size_t>(len));
            unsigned char *p = der.data();
            i2d_ECDSA_SIG(sig.get(), &p);
            return der;
        }

        /// ECDSA over P-256/P-384/P-521 and SM2, via OpenSSL EVP.
        /// Signatures use the IEEE P1363 r || s form.
        class EcdsaKeyMaterial : public KeyMaterial {
          public:
            EcdsaKeyMaterial(KeyFamily family, Key key, Bytes public_key, Bytes secret_key)
                : KeyMaterial(family, std::move(key), std::move(public_key), std::move(secret_key)) {}

            dp::Result<Bytes, dp::Error> sign(const Bytes &data) const override {
                if (!hasSecretKey())
                    return dp::Result<Bytes, dp::Error>::err(signing_failed("No secret key available"));

                EVP_PKEY_ptr pkey = importKey(family_, public_key_, secret_key_);
                if (!pkey) {
                    return dp::Result<Bytes, dp::Error>::err(
                        make_error(ERR_SIGNING_FAILED, "Failed to import " + keyFamilyToString(family_) + " key"));
                }

                EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
                size_t sig_len = 0;
                if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, curveSpec(family_).md(), nullptr, pkey.get()) <= 0 ||
                    EVP_DigestSignUpdate(ctx.get(), data.data(), data.size()) <= 0 ||
                    EVP_DigestSignFinal(ctx.get(), nullptr, &sig_len) <= 0) {
                    return dp::Result<Bytes, dp::Error>::err(signing_failed("EVP_DigestSign failed"));
                }

                Bytes der(sig_len);
                if (EVP_DigestSignFinal(ctx.get(), der.data(), &sig_len) <= 0)
                    return dp::Result<Bytes, dp::Error>::err(signing_failed("EVP_DigestSignFinal failed"));
                der.resize(sig_len);

                Bytes signature = derToP1363(der, keyFamilyInfo(family_).secret_key_size);
                if (signature.empty())
                    return dp::Result<Bytes, dp::Error>::err(signing_failed("Malformed DER signature"));
                return dp::Result<Bytes, dp::Error>::ok(signature);
            }

            dp::Result<bool, dp::Error> verify(const Bytes &data, const Bytes &signature) const override {
                if (signature.size() != keyFamilyInfo(family_).secret_key_size * 2)
                    return dp::Result<bool, dp::Error>::ok(false);

                EVP_PKEY_ptr pkey = importKey(family_, public_key_, {});
                if (!pkey) {
                    return dp::Result<bool, dp::Error>::err(make_error(
                        ERR_MALFORMED_DID, "Invalid " + keyFamilyToString(family_) + " public key point"));
                }

                Bytes der = p1363ToDer(signature);
                if (der.empty())
                    return dp::Result<bool, dp::Error>::ok(false);

                EVP_MD_CTX_ptr ctx(EVP_MD_CTX_new());
                if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, curveSpec(family_).md(), nullptr, pkey.get()) <= 0 ||
                    EVP_DigestVerifyUpdate(ctx.get(), data.data(), data.size()) <= 0) {
                    return dp::Result<bool, dp::Error>::ok(false);
                }
                return dp::Result<bool, dp::Error>::ok(
                    EVP_DigestVerifyFinal(ctx.get(), der.data(), der.size()) == 1);
            }
        };

    } // namespace

    dp::Result<KeyHandle, dp::Error> loadEcdsaKey(const Key &key) {
        auto decoded = decodePublicKey(key.publicKeyMultibase);
        if (decoded.is_err())
            return dp::Result<KeyHandle, dp::Error>::err(decoded.error());

        KeyFamily family = decoded.value().family;
        if (family == KeyFamily::Ed25519 || family == KeyFamily::Bls12381G2) {
            return dp::Result<KeyHandle, dp::Error>::err(
                make_error(ERR_UNSUPPORTED_KEY_TYPE, keyFamilyToString(family) + " is not an elliptic curve DSA key"));
        }

        Bytes secret;
        if (key.hasSecretKey()) {
            auto decoded_secret = decodeSecretKey(family, *key.secretKeyMultibase);
            if (decoded_secret.is_err())
                return dp::Result<KeyHandle, dp::Error>::err(decoded_secret.error());
            secret = decoded_secret.value();
        }

        return dp::Result<KeyHandle, dp::Error>::ok(
            std::make_shared<EcdsaKeyMaterial>(family, key, decoded.value().bytes, secret));
    }

    dp::Result<Key, dp::Error> generateEcdsaKey(KeyFamily family) {
        CurveSpec spec = curveSpec(family);
        const auto &info = keyFamilyInfo(family);

        EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, spec.key_type, nullptr));
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0)
            return dp::Result<Key, dp::Error>::err(key_generation_failed("EVP_PKEY_keygen_init failed"));

        OSSL_PARAM params[2];
        params[0] = OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, const_cast<char *>(spec.group), 0);
        params[1] = OSSL_PARAM_construct_end();
        if (EVP_PKEY_CTX_set_params(ctx.get(), params) <= 0)
            return dp::Result<Key, dp::Error>::err(key_generation_failed("Failed to set curve group"));

        EVP_PKEY *raw_pkey = nullptr;
        if (EVP_PKEY_keygen(ctx.get(), &raw_pkey) <= 0)
            return dp::Result<Key, dp::Error>::err(key_generation_failed("EVP_PKEY_keygen failed"));
        EVP_PKEY_ptr pkey(raw_pkey);

        size_t pk_len = 0;
        if (EVP_PKEY_get_octet_string_param(pkey.get(), OSSL_PKEY_PARAM_PUB_KEY, nullptr, 0, &pk_len) <= 0)
            return dp::Result<Key, dp::Error>::err(key_generation_failed("Failed to read public key"));
        Bytes pk(pk_len);
        if (EVP_PKEY_get_octet_string_param(pkey.get(), OSSL_PKEY_PARAM_PUB_KEY, pk.data(), pk.size(), &pk_len) <= 0)
            return dp::Result<Key, dp::Error>::err(key_generation_failed("Failed to read public key"));
        pk.resize(pk_len);
        pk = compressPoint(pk);

        BIGNUM *raw_priv = nullptr;
        if (EVP_PKEY_get_bn_param(pkey.get(), OSSL_PKEY_PARAM_PRIV_KEY, &raw_priv) <= 0)
            return dp::Result<Key, dp::Error>::err(key_generation_failed("Failed to read private key"));
        BIGNUM_ptr priv(raw_priv);

        Bytes sk(info.secret_key_size);
        if (BN_bn2binpad(priv.get(), sk.data(), static_cast<int>(sk.size())) < 0)
            return dp::Result<Key, dp::Error>::err(key_generation_failed("Private key does not fit the curve"));

        if (pk.size() != info.public_key_size)
            return dp::Result<Key, dp::Error>::err(key_generation_failed("Unexpected public key size"));

        return dp::Result<Key, dp::Error>::ok(makeKey(family, pk, sk));
    }

} // namespace didkey
