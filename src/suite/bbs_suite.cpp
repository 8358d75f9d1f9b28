#include <didkey/common/error.hpp>
#include <didkey/suite/bbs_suite.hpp>

#include <set>

namespace didkey {

    namespace {

        dp::Result<bbs::G2, dp::Error> issuerPublicKey(const KeyMaterial &key) {
            bbs::G2 pk;
            if (!bbs::deserialize(pk, key.publicKey()))
                return dp::Result<bbs::G2, dp::Error>::err(malformed_did("Invalid BLS12-381 public key point"));
            return dp::Result<bbs::G2, dp::Error>::ok(pk);
        }

    } // namespace

    dp::Result<BbsSuite::Messages, dp::Error> BbsSuite::buildMessages(const json &document, const Proof &proof) {
        const DigestAlgorithm algorithm = keyFamilyInfo(KeyFamily::Bls12381G2).digest;

        auto partition = partitionStatements(toStatements(document), proof.mandatoryPointers);
        if (partition.is_err())
            return dp::Result<Messages, dp::Error>::err(partition.error());

        auto proof_hash = hashProofConfig(algorithm, document, proof);
        if (proof_hash.is_err())
            return dp::Result<Messages, dp::Error>::err(proof_hash.error());
        auto mandatory_hash = hashStatements(algorithm, partition.value().mandatory);
        if (mandatory_hash.is_err())
            return dp::Result<Messages, dp::Error>::err(mandatory_hash.error());

        Messages messages;
        Bytes first = proof_hash.value();
        append(first, mandatory_hash.value());
        messages.scalars.push_back(bbs::hashToScalar(first));

        messages.non_mandatory = partition.value().non_mandatory;
        for (const auto &statement : messages.non_mandatory)
            messages.scalars.push_back(bbs::hashToScalar(toBytes(statement.text())));
        return dp::Result<Messages, dp::Error>::ok(messages);
    }

    dp::Result<Proof, dp::Error> BbsSuite::createProof(const json &document, const ProofOptions &options,
                                                       const KeyMaterial &key) const {
        if (!supportsFamily(key.family())) {
            return dp::Result<Proof, dp::Error>::err(make_error(
                ERR_UNSUPPORTED_CRYPTOSUITE, toString() + " cannot sign with " + keyFamilyToString(key.family())));
        }
        if (!key.hasSecretKey())
            return dp::Result<Proof, dp::Error>::err(signing_failed("No secret key available"));

        auto valid = validatePointers(document, options.mandatoryPointers);
        if (valid.is_err())
            return dp::Result<Proof, dp::Error>::err(valid.error());

        Proof proof = initialProof(options, key);
        proof.mandatoryPointers = options.mandatoryPointers;

        auto messages = buildMessages(document, proof);
        if (messages.is_err())
            return dp::Result<Proof, dp::Error>::err(messages.error());

        bbs::Fr sk;
        if (!bbs::deserialize(sk, key.secretKey()))
            return dp::Result<Proof, dp::Error>::err(signing_failed("Invalid BLS12-381 secret key"));

        auto signature = bbs::sign(bbs::Params::standard(), sk, messages.value().scalars);

        Bytes body;
        appendLengthPrefixed(body, signature.toBytes());
        proof.proofValue = encodeTaggedProofValue(BASE_PROOF, body);
        return dp::Result<Proof, dp::Error>::ok(proof);
    }

    dp::Result<bool, dp::Error> BbsSuite::verifyBase(const Messages &messages, const bbs::G2 &pk, const Bytes &data,
                                                     size_t offset) {
        auto signature_bytes = readLengthPrefixed(data, offset);
        if (signature_bytes.is_err() || offset != data.size())
            return dp::Result<bool, dp::Error>::ok(false);

        auto signature = bbs::Signature::fromBytes(signature_bytes.value());
        if (signature.is_err())
            return dp::Result<bool, dp::Error>::ok(false);

        return dp::Result<bool, dp::Error>::ok(
            bbs::verify(bbs::Params::standard(), pk, messages.scalars, signature.value()));
    }

    dp::Result<bool, dp::Error> BbsSuite::verifyDerived(const Messages &messages, const bbs::G2 &pk,
                                                        const Bytes &data, size_t offset) {
        auto total = readU32(data, offset);
        auto count = readU32(data, offset);
        if (total.is_err() || count.is_err())
            return dp::Result<bool, dp::Error>::ok(false);
        if (count.value() != messages.non_mandatory.size() || total.value() < count.value() + uint64_t{1})
            return dp::Result<bool, dp::Error>::ok(false);

        // Message 1 is always disclosed; the rest pair up with the disclosed statements in order
        std::vector<std::pair<size_t, bbs::Fr>> disclosed;
        disclosed.emplace_back(1, messages.scalars[0]);
        size_t previous = 1;
        for (uint32_t k = 0; k < count.value(); ++k) {
            auto index = readU32(data, offset);
            if (index.is_err() || index.value() <= previous || index.value() > total.value())
                return dp::Result<bool, dp::Error>::ok(false);
            previous = index.value();
            disclosed.emplace_back(index.value(), messages.scalars[k + 1]);
        }

        auto proof_bytes = readLengthPrefixed(data, offset);
        if (proof_bytes.is_err() || offset != data.size())
            return dp::Result<bool, dp::Error>::ok(false);

        auto proof = bbs::SDProof::fromBytes(proof_bytes.value());
        if (proof.is_err() || total.value() - count.value() - 1 != proof.value().hidden_indices.size())
            return dp::Result<bool, dp::Error>::ok(false);

        return dp::Result<bool, dp::Error>::ok(
            bbs::verifyProof(bbs::Params::standard(), pk, proof.value(), disclosed, total.value()));
    }

    dp::Result<bool, dp::Error> BbsSuite::verifyProof(const json &document, const Proof &proof,
                                                      const KeyMaterial &key) const {
        if (proof.cryptosuite != toString() || !supportsFamily(key.family()))
            return dp::Result<bool, dp::Error>::ok(false);

        auto pk = issuerPublicKey(key);
        if (pk.is_err())
            return dp::Result<bool, dp::Error>::err(pk.error());

        Bytes data;
        size_t offset = 0;
        auto variant = decodeTaggedProofValue(proof.proofValue, data, offset);
        if (variant.is_err())
            return dp::Result<bool, dp::Error>::ok(false);

        auto messages = buildMessages(document, proof);
        if (messages.is_err())
            return dp::Result<bool, dp::Error>::ok(false);

        switch (variant.value()) {
        case BASE_PROOF:
            return verifyBase(messages.value(), pk.value(), data, offset);
        case DERIVED_PROOF:
            return verifyDerived(messages.value(), pk.value(), data, offset);
        default:
            return dp::Result<bool, dp::Error>::ok(false);
        }
    }

    bool BbsSuite::isBaseProof(const Proof &proof) const {
        Bytes data;
        size_t offset = 0;
        auto variant = decodeTaggedProofValue(proof.proofValue, data, offset);
        return variant.is_ok() && variant.value() == BASE_PROOF;
    }

    dp::Result<std::pair<json, Proof>, dp::Error>
    BbsSuite::deriveProof(const json &document, const Proof &base_proof,
                          const std::vector<std::string> &selective_pointers,
                          const std::optional<std::string> &presentation_header, const KeyMaterial &issuer) const {
        using DeriveResult = dp::Result<std::pair<json, Proof>, dp::Error>;

        Bytes data;
        size_t offset = 0;
        auto variant = decodeTaggedProofValue(base_proof.proofValue, data, offset);
        if (variant.is_err())
            return DeriveResult::err(variant.error());
        if (variant.value() != BASE_PROOF)
            return DeriveResult::err(unsupported_cryptosuite("Proof is already derived"));

        auto signature_bytes = readLengthPrefixed(data, offset);
        if (signature_bytes.is_err())
            return DeriveResult::err(signature_bytes.error());
        auto signature = bbs::Signature::fromBytes(signature_bytes.value());
        if (signature.is_err())
            return DeriveResult::err(signature.error());

        auto pk = issuerPublicKey(issuer);
        if (pk.is_err())
            return DeriveResult::err(pk.error());

        auto valid = validatePointers(document, selective_pointers);
        if (valid.is_err())
            return DeriveResult::err(valid.error());

        auto messages = buildMessages(document, base_proof);
        if (messages.is_err())
            return DeriveResult::err(messages.error());

        const auto &params = bbs::Params::standard();
        if (!bbs::verify(params, pk.value(), messages.value().scalars, signature.value()))
            return DeriveResult::err(invalid_document("Base proof does not match the credential"));

        std::vector<std::string> pointers = base_proof.mandatoryPointers;
        pointers.insert(pointers.end(), selective_pointers.begin(), selective_pointers.end());
        auto reduced = selectDocument(document, pointers);
        if (reduced.is_err())
            return DeriveResult::err(reduced.error());

        std::set<std::string> kept;
        for (const auto &statement : toStatements(reduced.value()))
            kept.insert(statement.pointer);

        std::vector<size_t> disclosed = {1};
        const auto &non_mandatory = messages.value().non_mandatory;
        for (size_t i = 0; i < non_mandatory.size(); ++i) {
            if (kept.count(non_mandatory[i].pointer) != 0)
                disclosed.push_back(i + 2);
        }

        auto sd_proof = bbs::createProof(params, pk.value(), signature.value(), messages.value().scalars, disclosed,
                                         presentation_header.value_or(""));

        Bytes body;
        appendU32(body, static_cast<uint32_t>(messages.value().scalars.size()));
        appendU32(body, static_cast<uint32_t>(disclosed.size() - 1));
        for (size_t i = 1; i < disclosed.size(); ++i)
            appendU32(body, static_cast<uint32_t>(disclosed[i]));
        appendLengthPrefixed(body, sd_proof.toBytes());

        Proof proof = base_proof;
        proof.proofValue = encodeTaggedProofValue(DERIVED_PROOF, body);
        return DeriveResult::ok(std::make_pair(reduced.value(), proof));
    }

} // namespace didkey
