#include <didkey/common/error.hpp>
#include <didkey/suite/ecdsa_sd_suite.hpp>

#include <set>

namespace didkey {

    namespace {

        /// Public-only P-256 material for the per-issuance statement key
        dp::Result<KeyHandle, dp::Error> decodeEphemeral(const Bytes &public_key) {
            if (public_key.size() != keyFamilyInfo(KeyFamily::EcdsaP256).public_key_size)
                return dp::Result<KeyHandle, dp::Error>::err(invalid_document("Invalid ephemeral public key"));
            return loadEcdsaKey(makeKey(KeyFamily::EcdsaP256, public_key, Bytes{}));
        }

    } // namespace

    bool EcdsaSdSuite::supportsFamily(KeyFamily family) const {
        return family == KeyFamily::EcdsaP256 || family == KeyFamily::EcdsaP384 || family == KeyFamily::EcdsaP521;
    }

    std::string EcdsaSdSuite::encodeComponents(const Components &components) {
        Bytes body;
        appendLengthPrefixed(body, components.base_signature);
        appendLengthPrefixed(body, components.ephemeral_public_key);
        appendU32(body, static_cast<uint32_t>(components.signatures.size()));
        for (const auto &signature : components.signatures)
            appendLengthPrefixed(body, signature);
        return encodeTaggedProofValue(components.variant, body);
    }

    dp::Result<EcdsaSdSuite::Components, dp::Error> EcdsaSdSuite::decodeComponents(const std::string &proof_value) {
        Bytes data;
        size_t offset = 0;
        auto variant = decodeTaggedProofValue(proof_value, data, offset);
        if (variant.is_err())
            return dp::Result<Components, dp::Error>::err(variant.error());
        if (variant.value() != BASE_PROOF && variant.value() != DERIVED_PROOF)
            return dp::Result<Components, dp::Error>::err(invalid_document("Not an ecdsa-sd-2023 proof value"));

        Components components;
        components.variant = variant.value();

        auto base_signature = readLengthPrefixed(data, offset);
        if (base_signature.is_err())
            return dp::Result<Components, dp::Error>::err(base_signature.error());
        components.base_signature = base_signature.value();

        auto ephemeral = readLengthPrefixed(data, offset);
        if (ephemeral.is_err())
            return dp::Result<Components, dp::Error>::err(ephemeral.error());
        components.ephemeral_public_key = ephemeral.value();

        auto count = readU32(data, offset);
        if (count.is_err())
            return dp::Result<Components, dp::Error>::err(count.error());
        for (uint32_t i = 0; i < count.value(); ++i) {
            auto signature = readLengthPrefixed(data, offset);
            if (signature.is_err())
                return dp::Result<Components, dp::Error>::err(signature.error());
            components.signatures.push_back(signature.value());
        }

        if (offset != data.size())
            return dp::Result<Components, dp::Error>::err(invalid_document("Trailing bytes in proof value"));
        return dp::Result<Components, dp::Error>::ok(components);
    }

    dp::Result<Bytes, dp::Error> EcdsaSdSuite::baseSigningInput(const json &document, const Proof &proof,
                                                                const Bytes &ephemeral_public_key,
                                                                const std::vector<Statement> &mandatory,
                                                                DigestAlgorithm algorithm) {
        auto proof_hash = hashProofConfig(algorithm, document, proof);
        if (proof_hash.is_err())
            return proof_hash;
        auto mandatory_hash = hashStatements(algorithm, mandatory);
        if (mandatory_hash.is_err())
            return mandatory_hash;

        Bytes input = proof_hash.value();
        append(input, ephemeral_public_key);
        append(input, mandatory_hash.value());
        return dp::Result<Bytes, dp::Error>::ok(input);
    }

    dp::Result<Proof, dp::Error> EcdsaSdSuite::createProof(const json &document, const ProofOptions &options,
                                                           const KeyMaterial &key) const {
        if (!supportsFamily(key.family())) {
            return dp::Result<Proof, dp::Error>::err(make_error(
                ERR_UNSUPPORTED_CRYPTOSUITE, toString() + " cannot sign with " + keyFamilyToString(key.family())));
        }

        auto valid = validatePointers(document, options.mandatoryPointers);
        if (valid.is_err())
            return dp::Result<Proof, dp::Error>::err(valid.error());

        auto partition = partitionStatements(toStatements(document), options.mandatoryPointers);
        if (partition.is_err())
            return dp::Result<Proof, dp::Error>::err(partition.error());

        Proof proof = initialProof(options, key);
        proof.mandatoryPointers = options.mandatoryPointers;

        // Fresh per-issuance key for the individual statements
        auto ephemeral_key = generateEcdsaKey(KeyFamily::EcdsaP256);
        if (ephemeral_key.is_err())
            return dp::Result<Proof, dp::Error>::err(ephemeral_key.error());
        auto ephemeral = loadEcdsaKey(ephemeral_key.value());
        if (ephemeral.is_err())
            return dp::Result<Proof, dp::Error>::err(ephemeral.error());

        Components components;
        components.variant = BASE_PROOF;
        components.ephemeral_public_key = ephemeral.value()->publicKey();

        auto input = baseSigningInput(document, proof, components.ephemeral_public_key, partition.value().mandatory,
                                      keyFamilyInfo(key.family()).digest);
        if (input.is_err())
            return dp::Result<Proof, dp::Error>::err(input.error());

        auto base_signature = key.sign(input.value());
        if (base_signature.is_err())
            return dp::Result<Proof, dp::Error>::err(base_signature.error());
        components.base_signature = base_signature.value();

        for (const auto &statement : partition.value().non_mandatory) {
            auto signature = ephemeral.value()->sign(toBytes(statement.text()));
            if (signature.is_err())
                return dp::Result<Proof, dp::Error>::err(signature.error());
            components.signatures.push_back(signature.value());
        }

        proof.proofValue = encodeComponents(components);
        return dp::Result<Proof, dp::Error>::ok(proof);
    }

    dp::Result<bool, dp::Error> EcdsaSdSuite::verifyProof(const json &document, const Proof &proof,
                                                          const KeyMaterial &key) const {
        if (proof.cryptosuite != toString() || !supportsFamily(key.family()))
            return dp::Result<bool, dp::Error>::ok(false);

        auto components = decodeComponents(proof.proofValue);
        if (components.is_err())
            return dp::Result<bool, dp::Error>::ok(false);

        auto partition = partitionStatements(toStatements(document), proof.mandatoryPointers);
        if (partition.is_err())
            return dp::Result<bool, dp::Error>::ok(false);

        const auto &non_mandatory = partition.value().non_mandatory;
        if (components.value().signatures.size() != non_mandatory.size())
            return dp::Result<bool, dp::Error>::ok(false);

        auto input = baseSigningInput(document, proof, components.value().ephemeral_public_key,
                                      partition.value().mandatory, keyFamilyInfo(key.family()).digest);
        if (input.is_err())
            return dp::Result<bool, dp::Error>::err(input.error());

        auto base_ok = key.verify(input.value(), components.value().base_signature);
        if (base_ok.is_err() || !base_ok.value())
            return base_ok;

        auto decoded_ephemeral = decodeEphemeral(components.value().ephemeral_public_key);
        if (decoded_ephemeral.is_err())
            return dp::Result<bool, dp::Error>::ok(false);

        for (size_t i = 0; i < non_mandatory.size(); ++i) {
            auto ok = decoded_ephemeral.value()->verify(toBytes(non_mandatory[i].text()),
                                                        components.value().signatures[i]);
            if (ok.is_err() || !ok.value())
                return dp::Result<bool, dp::Error>::ok(false);
        }
        return dp::Result<bool, dp::Error>::ok(true);
    }

    bool EcdsaSdSuite::isBaseProof(const Proof &proof) const {
        auto components = decodeComponents(proof.proofValue);
        return components.is_ok() && components.value().variant == BASE_PROOF;
    }

    dp::Result<std::pair<json, Proof>, dp::Error>
    EcdsaSdSuite::deriveProof(const json &document, const Proof &base_proof,
                              const std::vector<std::string> &selective_pointers,
                              const std::optional<std::string> & /*presentation_header*/,
                              const KeyMaterial & /*issuer*/) const {
        using DeriveResult = dp::Result<std::pair<json, Proof>, dp::Error>;

        auto components = decodeComponents(base_proof.proofValue);
        if (components.is_err())
            return DeriveResult::err(components.error());
        if (components.value().variant != BASE_PROOF)
            return DeriveResult::err(unsupported_cryptosuite("Proof is already derived"));

        auto valid = validatePointers(document, selective_pointers);
        if (valid.is_err())
            return DeriveResult::err(valid.error());

        auto partition = partitionStatements(toStatements(document), base_proof.mandatoryPointers);
        if (partition.is_err())
            return DeriveResult::err(partition.error());
        const auto &non_mandatory = partition.value().non_mandatory;
        if (components.value().signatures.size() != non_mandatory.size())
            return DeriveResult::err(invalid_document("Base proof does not match the credential"));

        std::vector<std::string> pointers = base_proof.mandatoryPointers;
        pointers.insert(pointers.end(), selective_pointers.begin(), selective_pointers.end());
        auto reduced = selectDocument(document, pointers);
        if (reduced.is_err())
            return DeriveResult::err(reduced.error());

        std::set<std::string> disclosed;
        for (const auto &statement : toStatements(reduced.value()))
            disclosed.insert(statement.pointer);

        Components derived;
        derived.variant = DERIVED_PROOF;
        derived.base_signature = components.value().base_signature;
        derived.ephemeral_public_key = components.value().ephemeral_public_key;
        for (size_t i = 0; i < non_mandatory.size(); ++i) {
            if (disclosed.count(non_mandatory[i].pointer) != 0)
                derived.signatures.push_back(components.value().signatures[i]);
        }

        Proof proof = base_proof;
        proof.proofValue = encodeComponents(derived);
        return DeriveResult::ok(std::make_pair(reduced.value(), proof));
    }

} // namespace didkey
