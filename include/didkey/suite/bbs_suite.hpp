#pragma once

#include <didkey/crypto/bbs.hpp>
#include <didkey/suite/cryptosuite.hpp>
#include <didkey/suite/statements.hpp>

namespace didkey {

    /// bbs-2023: selective disclosure with BBS signatures over BLS12-381.
    ///
    /// Message 1 is H(proof config) || H(mandatory statements) mapped to a scalar; messages
    /// 2..L are the non-mandatory statements in pointer order. A derived proof is a
    /// zero-knowledge proof of the base signature that reveals message 1 and the disclosed
    /// statements, bound to the presentation header.
    ///
    /// proofValue layout (base64url multibase):
    ///   base:    0xd9 0x5d 0x02 | lp(signature)
    ///   derived: 0xd9 0x5d 0x03 | u32 L | u32 n | n x u32 disclosed index | lp(proof)
    class BbsSuite : public DerivableCryptosuite {
      public:
        static constexpr uint8_t BASE_PROOF = 0x02;
        static constexpr uint8_t DERIVED_PROOF = 0x03;

        CryptosuiteName name() const override { return CryptosuiteName::Bbs2023; }

        bool supportsFamily(KeyFamily family) const override { return family == KeyFamily::Bls12381G2; }

        dp::Result<Proof, dp::Error> createProof(const json &document, const ProofOptions &options,
                                                 const KeyMaterial &key) const override;

        dp::Result<bool, dp::Error> verifyProof(const json &document, const Proof &proof,
                                                const KeyMaterial &key) const override;

        bool isBaseProof(const Proof &proof) const override;

        dp::Result<std::pair<json, Proof>, dp::Error>
        deriveProof(const json &document, const Proof &base_proof, const std::vector<std::string> &selective_pointers,
                    const std::optional<std::string> &presentation_header, const KeyMaterial &issuer) const override;

      private:
        /// Messages m_1..m_L of a document under the proof's mandatory pointers
        struct Messages {
            std::vector<bbs::Fr> scalars;
            std::vector<Statement> non_mandatory;
        };

        static dp::Result<Messages, dp::Error> buildMessages(const json &document, const Proof &proof);

        static dp::Result<bool, dp::Error> verifyBase(const Messages &messages, const bbs::G2 &pk, const Bytes &data,
                                                      size_t offset);
        static dp::Result<bool, dp::Error> verifyDerived(const Messages &messages, const bbs::G2 &pk,
                                                         const Bytes &data, size_t offset);
    };

} // namespace didkey
