#pragma once

#include <didkey/suite/cryptosuite.hpp>
#include <vector>

namespace didkey {

    /// Whole-document proofs (ecdsa-2019, eddsa-2022, sm2-2023).
    ///
    /// The signer signs H(canonical proof config) || H(canonical document), H being the
    /// digest of its key family. proofValue is the base58btc multibase of the raw signature.
    class DataIntegritySuite : public Cryptosuite {
      public:
        DataIntegritySuite(CryptosuiteName name, std::vector<KeyFamily> families);

        CryptosuiteName name() const override { return name_; }

        bool supportsFamily(KeyFamily family) const override;

        dp::Result<Proof, dp::Error> createProof(const json &document, const ProofOptions &options,
                                                 const KeyMaterial &key) const override;

        dp::Result<bool, dp::Error> verifyProof(const json &document, const Proof &proof,
                                                const KeyMaterial &key) const override;

      private:
        dp::Result<Bytes, dp::Error> signingInput(const json &document, const Proof &proof, KeyFamily family) const;

        CryptosuiteName name_;
        std::vector<KeyFamily> families_;
    };

} // namespace didkey
