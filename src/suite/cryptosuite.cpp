#include <didkey/common/error.hpp>
#include <didkey/suite/cryptosuite.hpp>

namespace didkey {

    dp::Result<CryptosuiteName, dp::Error> cryptosuiteNameFromString(const std::string &name) {
        for (auto candidate : {CryptosuiteName::Ecdsa2019, CryptosuiteName::EcdsaSd2023, CryptosuiteName::Eddsa2022,
                               CryptosuiteName::Sm22023, CryptosuiteName::Bbs2023}) {
            if (cryptosuiteNameToString(candidate) == name)
                return dp::Result<CryptosuiteName, dp::Error>::ok(candidate);
        }
        return dp::Result<CryptosuiteName, dp::Error>::err(
            make_error(ERR_UNSUPPORTED_CRYPTOSUITE, "Unsupported cryptosuite: " + name));
    }

    Proof Cryptosuite::initialProof(const ProofOptions &options, const KeyMaterial &key) const {
        Proof proof;
        proof.cryptosuite = toString();
        proof.created = options.created.empty() ? currentTimestamp() : options.created;
        proof.verificationMethod = key.verificationMethod();
        proof.proofPurpose = options.purpose;
        proof.challenge = options.challenge;
        proof.domain = options.domain;
        return proof;
    }

    dp::Result<Bytes, dp::Error> hashProofConfig(DigestAlgorithm algorithm, const json &document,
                                                 const Proof &proof) {
        return digest(algorithm, canonicalize(proof.configJson(document)));
    }

    std::string encodeTaggedProofValue(uint8_t variant, const Bytes &body) {
        Bytes value = {PROOF_VALUE_TAG_0, PROOF_VALUE_TAG_1, variant};
        append(value, body);
        return multibaseEncode(value, MULTIBASE_BASE64URL);
    }

    dp::Result<uint8_t, dp::Error> decodeTaggedProofValue(const std::string &proof_value, Bytes &out,
                                                          size_t &offset) {
        if (proof_value.empty() || proof_value[0] != MULTIBASE_BASE64URL) {
            return dp::Result<uint8_t, dp::Error>::err(
                invalid_document("Selective disclosure proof value must be base64url multibase"));
        }
        auto decoded = multibaseDecode(proof_value);
        if (decoded.is_err())
            return dp::Result<uint8_t, dp::Error>::err(decoded.error());

        out = decoded.value();
        if (out.size() < 3 || out[0] != PROOF_VALUE_TAG_0 || out[1] != PROOF_VALUE_TAG_1) {
            return dp::Result<uint8_t, dp::Error>::err(invalid_document("Unknown proof value header"));
        }
        offset = 3;
        return dp::Result<uint8_t, dp::Error>::ok(out[2]);
    }

} // namespace didkey
