#include <didkey/common/error.hpp>
#include <didkey/credential/credential_engine.hpp>

namespace didkey {

    namespace {

        ProofResult failed(ProofResult result, const std::string &reason) {
            result.verified = false;
            result.error = reason;
            return result;
        }

        /// Whether a DID document lists the method under the purpose's relationship
        bool authorizes(const json &did_document, ProofPurpose purpose, const std::string &method) {
            const std::string relationship = proofPurposeToString(purpose);
            if (!did_document.contains(relationship) || !did_document[relationship].is_array())
                return false;
            const std::string authority = didAuthority(method);
            for (const auto &entry : did_document[relationship]) {
                if (didAuthority(identifierOf(entry)) == authority)
                    return true;
            }
            return false;
        }

    } // namespace

    CredentialEngine::CredentialEngine(std::shared_ptr<const SuiteRegistry> registry,
                                       std::shared_ptr<const DocumentLoader> loader, Config config)
        : registry_(std::move(registry)), loader_(std::move(loader)), config_(std::move(config)) {}

    dp::Result<json, dp::Error> CredentialEngine::issue(const json &credential, const KeyReference &key,
                                                        const IssuanceRequest &request) const {
        auto parsed = VerifiableCredential::fromJson(credential);
        if (parsed.is_err())
            return dp::Result<json, dp::Error>::err(parsed.error());

        auto signing = registry_->signingSuite(key, request);
        if (signing.is_err())
            return dp::Result<json, dp::Error>::err(signing.error());

        VerifiableCredential vc = parsed.value();
        vc.setIssuer(signing.value().verificationMethod());
        if (config_.stamp_issuance_date && vc.getIssuanceDate().empty() &&
            hasContext(vc.toJson(), CREDENTIALS_V1_CONTEXT)) {
            vc.setIssuanceDate(currentTimestamp());
        }

        if (config_.resolve_contexts) {
            auto resolved = loader_->resolveContexts(vc.toJson());
            if (resolved.is_err())
                return dp::Result<json, dp::Error>::err(resolved.error());
        }

        ProofOptions options = signing.value().options;
        options.purpose = ProofPurpose::AssertionMethod;

        auto proof = signing.value().suite->createProof(vc.unsecured(), options, *signing.value().key);
        if (proof.is_err())
            return dp::Result<json, dp::Error>::err(proof.error());

        vc.addProof(proof.value());
        return dp::Result<json, dp::Error>::ok(vc.toJson());
    }

    dp::Result<ProofResult, dp::Error>
    CredentialEngine::verifyProof(const json &document, const json &proof_json, ProofPurpose purpose,
                                  const std::optional<KeyReference> &verification_method,
                                  const std::optional<std::string> &expected_controller) const {
        if (!proof_json.is_object() || !proof_json.contains("cryptosuite") || !proof_json["cryptosuite"].is_string())
            return dp::Result<ProofResult, dp::Error>::err(invalid_document("Proof has no cryptosuite"));

        ProofResult result;
        result.cryptosuite = proof_json["cryptosuite"].get<std::string>();

        auto suite = registry_->verifierFor(result.cryptosuite);
        if (suite.is_err())
            return dp::Result<ProofResult, dp::Error>::err(suite.error());

        auto proof = Proof::fromJson(proof_json);
        if (proof.is_err())
            return dp::Result<ProofResult, dp::Error>::ok(failed(result, errorMessage(proof.error())));

        KeyReference method = verification_method ? *verification_method : KeyReference(proof.value().verificationMethod);
        auto key = registry_->resolveKeyMaterial(method);
        if (key.is_err())
            return dp::Result<ProofResult, dp::Error>::err(key.error());
        result.verificationMethod = key.value()->key().publicKey();

        if (proof.value().proofPurpose != purpose) {
            return dp::Result<ProofResult, dp::Error>::ok(
                failed(result, "Proof purpose is not " + proofPurposeToString(purpose)));
        }

        auto did_document = loader_->load(key.value()->verificationMethod());
        if (did_document.is_err())
            return dp::Result<ProofResult, dp::Error>::err(did_document.error());
        if (!authorizes(did_document.value(), purpose, key.value()->verificationMethod())) {
            return dp::Result<ProofResult, dp::Error>::ok(failed(
                result, "Verification method is not authorized for " + proofPurposeToString(purpose)));
        }

        if (expected_controller &&
            didAuthority(*expected_controller) != didAuthority(key.value()->key().controller)) {
            return dp::Result<ProofResult, dp::Error>::ok(
                failed(result, "Credential issuer does not match the verification method controller"));
        }

        auto verified = suite.value()->verifyProof(document, proof.value(), *key.value());
        if (verified.is_err())
            return dp::Result<ProofResult, dp::Error>::err(verified.error());
        if (!verified.value())
            return dp::Result<ProofResult, dp::Error>::ok(failed(result, "Invalid signature"));

        result.verified = true;
        return dp::Result<ProofResult, dp::Error>::ok(result);
    }

    dp::Result<CredentialVerificationResult, dp::Error>
    CredentialEngine::verify(const json &credential, const std::optional<KeyReference> &verification_method) const {
        auto parsed = VerifiableCredential::fromJson(credential);
        if (parsed.is_err())
            return dp::Result<CredentialVerificationResult, dp::Error>::err(parsed.error());

        const VerifiableCredential &vc = parsed.value();
        if (!vc.hasProof())
            return dp::Result<CredentialVerificationResult, dp::Error>::err(invalid_document("Credential has no proof"));

        if (config_.resolve_contexts) {
            auto resolved = loader_->resolveContexts(vc.toJson());
            if (resolved.is_err())
                return dp::Result<CredentialVerificationResult, dp::Error>::err(resolved.error());
        }

        const json document = vc.unsecured();
        const std::string issuer = vc.getIssuerString();

        CredentialVerificationResult outcome;
        outcome.verified = true;
        for (const auto &proof : vc.getProofs()) {
            auto checked = verifyProof(document, proof, ProofPurpose::AssertionMethod, verification_method, issuer);
            if (checked.is_err())
                return dp::Result<CredentialVerificationResult, dp::Error>::err(checked.error());
            outcome.verified = outcome.verified && checked.value().verified;
            outcome.results.push_back(checked.value());
        }
        return dp::Result<CredentialVerificationResult, dp::Error>::ok(outcome);
    }

} // namespace didkey
