#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/json.hpp>
#include <didkey/identity/key_material.hpp>
#include <didkey/suite/proof.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace didkey {

    /// Proof algorithms, by their "cryptosuite" value
    enum class CryptosuiteName {
        Ecdsa2019,   // ecdsa-2019
        EcdsaSd2023, // ecdsa-sd-2023
        Eddsa2022,   // eddsa-2022
        Sm22023,     // sm2-2023
        Bbs2023,     // bbs-2023
    };

    inline std::string cryptosuiteNameToString(CryptosuiteName name) {
        switch (name) {
        case CryptosuiteName::Ecdsa2019:
            return "ecdsa-2019";
        case CryptosuiteName::EcdsaSd2023:
            return "ecdsa-sd-2023";
        case CryptosuiteName::Eddsa2022:
            return "eddsa-2022";
        case CryptosuiteName::Sm22023:
            return "sm2-2023";
        case CryptosuiteName::Bbs2023:
            return "bbs-2023";
        default:
            return "unknown";
        }
    }

    /// Parse a "cryptosuite" value. Unknown names fail with ERR_UNSUPPORTED_CRYPTOSUITE.
    dp::Result<CryptosuiteName, dp::Error> cryptosuiteNameFromString(const std::string &name);

    /// Options a suite stamps into a new proof
    struct ProofOptions {
        ProofPurpose purpose = ProofPurpose::AssertionMethod;
        std::string created; // Empty means now
        std::optional<std::string> challenge;
        std::optional<std::string> domain;
        std::vector<std::string> mandatoryPointers; // Selective-disclosure suites only
    };

    /// A proof algorithm.
    /// Documents handed to a suite are unsecured (no "proof" member).
    class Cryptosuite {
      public:
        virtual ~Cryptosuite() = default;

        virtual CryptosuiteName name() const = 0;

        /// Whether keys of this family can sign with this suite
        virtual bool supportsFamily(KeyFamily family) const = 0;

        /// Whether proofs of this suite can be derived into selective disclosures
        virtual bool isDerivable() const { return false; }

        /// Sign the document
        virtual dp::Result<Proof, dp::Error> createProof(const json &document, const ProofOptions &options,
                                                         const KeyMaterial &key) const = 0;

        /// Check a proof against the document and the signer's public material.
        /// A failed check is ok(false); errors are reserved for unusable inputs.
        virtual dp::Result<bool, dp::Error> verifyProof(const json &document, const Proof &proof,
                                                        const KeyMaterial &key) const = 0;

        inline std::string toString() const { return cryptosuiteNameToString(name()); }

      protected:
        /// Fill the common proof fields
        Proof initialProof(const ProofOptions &options, const KeyMaterial &key) const;
    };

    /// A suite whose base proofs can be derived (once) into selective-disclosure proofs
    class DerivableCryptosuite : public Cryptosuite {
      public:
        bool isDerivable() const override { return true; }

        /// Whether the proof is a base proof issued by the signer (as opposed to a derived one)
        virtual bool isBaseProof(const Proof &proof) const = 0;

        /// Produce the reduced document and its derived proof.
        /// selective_pointers must each address a value of the document (ERR_INVALID_POINTER).
        virtual dp::Result<std::pair<json, Proof>, dp::Error>
        deriveProof(const json &document, const Proof &base_proof, const std::vector<std::string> &selective_pointers,
                    const std::optional<std::string> &presentation_header, const KeyMaterial &issuer) const = 0;
    };

    // ===========================================
    // Helpers shared by the suite implementations
    // ===========================================

    /// Hash of the canonical proof configuration (proof without proofValue, with @context)
    dp::Result<Bytes, dp::Error> hashProofConfig(DigestAlgorithm algorithm, const json &document,
                                                 const Proof &proof);

    /// Two-byte multibase header tag + variant byte of selective-disclosure proof values
    constexpr uint8_t PROOF_VALUE_TAG_0 = 0xd9;
    constexpr uint8_t PROOF_VALUE_TAG_1 = 0x5d;

    /// Encode a tagged proof value ('u' base64url)
    std::string encodeTaggedProofValue(uint8_t variant, const Bytes &body);

    /// Decode a tagged proof value; returns the variant byte and advances offset past the header
    dp::Result<uint8_t, dp::Error> decodeTaggedProofValue(const std::string &proof_value, Bytes &out,
                                                          size_t &offset);

} // namespace didkey
