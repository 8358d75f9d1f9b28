#include <didkey/common/error.hpp>
#include <didkey/suite/data_integrity_suite.hpp>

#include <algorithm>

namespace didkey {

    DataIntegritySuite::DataIntegritySuite(CryptosuiteName name, std::vector<KeyFamily> families)
        : name_(name), families_(std::move(families)) {}

    bool DataIntegritySuite::supportsFamily(KeyFamily family) const {
        return std::find(families_.begin(), families_.end(), family) != families_.end();
    }

    dp::Result<Bytes, dp::Error> DataIntegritySuite::signingInput(const json &document, const Proof &proof,
                                                                  KeyFamily family) const {
        DigestAlgorithm algorithm = keyFamilyInfo(family).digest;

        auto proof_hash = hashProofConfig(algorithm, document, proof);
        if (proof_hash.is_err())
            return proof_hash;
        auto document_hash = digest(algorithm, canonicalize(document));
        if (document_hash.is_err())
            return document_hash;

        Bytes input = proof_hash.value();
        append(input, document_hash.value());
        return dp::Result<Bytes, dp::Error>::ok(input);
    }

    dp::Result<Proof, dp::Error> DataIntegritySuite::createProof(const json &document, const ProofOptions &options,
                                                                 const KeyMaterial &key) const {
        if (!supportsFamily(key.family())) {
            return dp::Result<Proof, dp::Error>::err(make_error(
                ERR_UNSUPPORTED_CRYPTOSUITE, toString() + " cannot sign with " + keyFamilyToString(key.family())));
        }

        Proof proof = initialProof(options, key);
        auto input = signingInput(document, proof, key.family());
        if (input.is_err())
            return dp::Result<Proof, dp::Error>::err(input.error());

        auto signature = key.sign(input.value());
        if (signature.is_err())
            return dp::Result<Proof, dp::Error>::err(signature.error());

        proof.proofValue = multibaseEncode(signature.value(), MULTIBASE_BASE58BTC);
        return dp::Result<Proof, dp::Error>::ok(proof);
    }

    dp::Result<bool, dp::Error> DataIntegritySuite::verifyProof(const json &document, const Proof &proof,
                                                                const KeyMaterial &key) const {
        if (proof.cryptosuite != toString() || !supportsFamily(key.family()))
            return dp::Result<bool, dp::Error>::ok(false);
        if (proof.proofValue.empty() || proof.proofValue[0] != MULTIBASE_BASE58BTC)
            return dp::Result<bool, dp::Error>::ok(false);

        auto signature = multibaseDecode(proof.proofValue);
        if (signature.is_err())
            return dp::Result<bool, dp::Error>::ok(false);

        auto input = signingInput(document, proof, key.family());
        if (input.is_err())
            return dp::Result<bool, dp::Error>::err(input.error());

        return key.verify(input.value(), signature.value());
    }

} // namespace didkey
