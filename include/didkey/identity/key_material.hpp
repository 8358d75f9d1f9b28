#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/encoding.hpp>
#include <didkey/identity/did_key.hpp>
#include <didkey/identity/key.hpp>
#include <didkey/identity/key_family.hpp>
#include <memory>

namespace didkey {

    /// Signing/verification capability bound to one did:key.
    /// Public-only material can verify but not sign.
    class KeyMaterial {
      public:
        virtual ~KeyMaterial() = default;

        /// Algorithm family
        inline KeyFamily family() const { return family_; }

        /// Key record (id, controller, publicKeyMultibase and, for local keys, secretKeyMultibase)
        inline const Key &key() const { return key_; }

        /// Verification method id used in proofs
        inline const std::string &verificationMethod() const { return key_.id; }

        /// Raw public key bytes (compressed point for curve keys)
        inline const Bytes &publicKey() const { return public_key_; }

        /// Raw secret key bytes, empty for public-only material
        inline const Bytes &secretKey() const { return secret_key_; }

        inline bool hasSecretKey() const { return !secret_key_.empty(); }

        /// Sign data. Fails with ERR_SIGNING_FAILED without a secret key.
        virtual dp::Result<Bytes, dp::Error> sign(const Bytes &data) const = 0;

        /// Verify a signature. A wrong signature is ok(false), never an error.
        virtual dp::Result<bool, dp::Error> verify(const Bytes &data, const Bytes &signature) const = 0;

      protected:
        KeyMaterial(KeyFamily family, Key key, Bytes public_key, Bytes secret_key)
            : family_(family), key_(std::move(key)), public_key_(std::move(public_key)),
              secret_key_(std::move(secret_key)) {}

        KeyFamily family_;
        Key key_;
        Bytes public_key_;
        Bytes secret_key_;
    };

    using KeyHandle = std::shared_ptr<const KeyMaterial>;

    // ===========================================
    // Per-family loaders (key must be normalized)
    // ===========================================

    dp::Result<KeyHandle, dp::Error> loadEd25519Key(const Key &key);
    dp::Result<KeyHandle, dp::Error> loadEcdsaKey(const Key &key);
    dp::Result<KeyHandle, dp::Error> loadBls12381Key(const Key &key);

    // ===========================================
    // Per-family generators
    // ===========================================

    dp::Result<Key, dp::Error> generateEd25519Key();
    dp::Result<Key, dp::Error> generateEcdsaKey(KeyFamily family);
    dp::Result<Key, dp::Error> generateBls12381Key();

    /// Build a complete key record from raw material
    Key makeKey(KeyFamily family, const Bytes &public_key, const Bytes &secret_key);

} // namespace didkey
