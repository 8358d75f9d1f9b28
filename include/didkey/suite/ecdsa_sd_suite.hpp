#pragma once

#include <didkey/suite/cryptosuite.hpp>
#include <didkey/suite/statements.hpp>

namespace didkey {

    /// ecdsa-sd-2023: selective disclosure over ECDSA.
    ///
    /// Issuance signs every non-mandatory statement with a fresh P-256 key and signs
    /// H(proof config) || ephemeral public key || H(mandatory statements) with the issuer key.
    /// A derived proof keeps the base signature and the signatures of the disclosed statements.
    ///
    /// proofValue layout (base64url multibase):
    ///   0xd9 0x5d <variant> | lp(base signature) | lp(ephemeral public key) | u32 n | n x lp(signature)
    /// with variant 0x00 for base proofs and 0x01 for derived proofs.
    class EcdsaSdSuite : public DerivableCryptosuite {
      public:
        static constexpr uint8_t BASE_PROOF = 0x00;
        static constexpr uint8_t DERIVED_PROOF = 0x01;

        CryptosuiteName name() const override { return CryptosuiteName::EcdsaSd2023; }

        bool supportsFamily(KeyFamily family) const override;

        dp::Result<Proof, dp::Error> createProof(const json &document, const ProofOptions &options,
                                                 const KeyMaterial &key) const override;

        dp::Result<bool, dp::Error> verifyProof(const json &document, const Proof &proof,
                                                const KeyMaterial &key) const override;

        bool isBaseProof(const Proof &proof) const override;

        dp::Result<std::pair<json, Proof>, dp::Error>
        deriveProof(const json &document, const Proof &base_proof, const std::vector<std::string> &selective_pointers,
                    const std::optional<std::string> &presentation_header, const KeyMaterial &issuer) const override;

      private:
        struct Components {
            uint8_t variant = BASE_PROOF;
            Bytes base_signature;
            Bytes ephemeral_public_key;
            std::vector<Bytes> signatures;
        };

        static std::string encodeComponents(const Components &components);
        static dp::Result<Components, dp::Error> decodeComponents(const std::string &proof_value);

        /// Issuer-signed data: H(proof config) || ephemeral public key || H(mandatory statements)
        static dp::Result<Bytes, dp::Error> baseSigningInput(const json &document, const Proof &proof,
                                                             const Bytes &ephemeral_public_key,
                                                             const std::vector<Statement> &mandatory,
                                                             DigestAlgorithm algorithm);
    };

} // namespace didkey
