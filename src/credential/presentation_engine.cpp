#include <didkey/common/digest.hpp>
#include <didkey/common/error.hpp>
#include <didkey/credential/presentation_engine.hpp>

namespace didkey {

    PresentationEngine::PresentationEngine(std::shared_ptr<const SuiteRegistry> registry,
                                           std::shared_ptr<const DocumentLoader> loader,
                                           std::shared_ptr<const CredentialEngine> credentials, Config config)
        : registry_(std::move(registry)), loader_(std::move(loader)), credentials_(std::move(credentials)),
          config_(std::move(config)) {}

    dp::Result<VerifiablePresentation, dp::Error> PresentationEngine::toPresentation(const json &input) const {
        if (VerifiablePresentation::isPresentation(input))
            return VerifiablePresentation::fromJson(input);

        std::vector<json> credentials;
        if (input.is_array()) {
            for (const auto &credential : input)
                credentials.push_back(credential);
        } else if (input.is_object()) {
            credentials.push_back(input);
        } else {
            return dp::Result<VerifiablePresentation, dp::Error>::err(
                invalid_document("Expected a credential, an array of credentials or a presentation"));
        }
        return dp::Result<VerifiablePresentation, dp::Error>::ok(
            VerifiablePresentation::create(credentials, config_.presentation_context));
    }

    dp::Result<json, dp::Error> PresentationEngine::sign(const json &input, const KeyReference &holder,
                                                         const std::optional<std::string> &challenge) const {
        auto presentation = toPresentation(input);
        if (presentation.is_err())
            return dp::Result<json, dp::Error>::err(presentation.error());

        auto signing = registry_->signingSuite(holder, PlainIssuance{});
        if (signing.is_err())
            return dp::Result<json, dp::Error>::err(signing.error());

        VerifiablePresentation vp = presentation.value();
        if (config_.resolve_contexts) {
            auto resolved = loader_->resolveContexts(vp.toJson());
            if (resolved.is_err())
                return dp::Result<json, dp::Error>::err(resolved.error());
        }

        ProofOptions options = signing.value().options;
        options.purpose = ProofPurpose::Authentication;
        if (challenge) {
            options.challenge = *challenge;
        } else {
            auto generated = randomAlphanumeric(config_.challenge_length);
            if (generated.is_err())
                return dp::Result<json, dp::Error>::err(generated.error());
            options.challenge = generated.value();
        }

        auto proof = signing.value().suite->createProof(vp.envelopeView(), options, *signing.value().key);
        if (proof.is_err())
            return dp::Result<json, dp::Error>::err(proof.error());

        vp.setProof(proof.value());
        return dp::Result<json, dp::Error>::ok(vp.toJson());
    }

    dp::Result<PresentationVerificationResult, dp::Error>
    PresentationEngine::verify(const json &presentation, const std::optional<KeyReference> &presentation_method,
                               const std::optional<KeyReference> &credential_method,
                               const std::optional<std::string> &expected_challenge) const {
        using VerifyResult = dp::Result<PresentationVerificationResult, dp::Error>;

        auto parsed = VerifiablePresentation::fromJson(presentation);
        if (parsed.is_err())
            return VerifyResult::err(parsed.error());

        const VerifiablePresentation &vp = parsed.value();
        if (!vp.hasProof())
            return VerifyResult::err(invalid_document("Presentation has no proof"));

        if (config_.resolve_contexts) {
            auto resolved = loader_->resolveContexts(vp.toJson());
            if (resolved.is_err())
                return VerifyResult::err(resolved.error());
        }

        PresentationVerificationResult outcome;

        // Envelope pass
        const json proof = vp.getProofJson();
        auto envelope = credentials_->verifyProof(vp.envelopeView(), proof, ProofPurpose::Authentication,
                                                  presentation_method, std::nullopt);
        if (envelope.is_err())
            return VerifyResult::err(envelope.error());

        ProofResult envelope_result = envelope.value();
        std::optional<std::string> proof_challenge;
        if (proof.contains("challenge") && proof["challenge"].is_string())
            proof_challenge = proof["challenge"].get<std::string>();
        const std::optional<std::string> challenge = expected_challenge ? expected_challenge : proof_challenge;
        if (challenge != proof_challenge) {
            envelope_result.verified = false;
            envelope_result.error = "Challenge does not match";
        }
        outcome.presentationResult.verified = envelope_result.verified;
        outcome.presentationResult.results.push_back(envelope_result);

        // Content pass
        bool credentials_verified = true;
        for (const auto &credential : vp.getCredentials()) {
            auto checked = credentials_->verify(credential, credential_method);
            if (checked.is_err())
                return VerifyResult::err(checked.error());
            credentials_verified = credentials_verified && checked.value().verified;
            outcome.credentialResults.push_back(checked.value());
        }

        outcome.verified = outcome.presentationResult.verified && credentials_verified;
        return VerifyResult::ok(outcome);
    }

} // namespace didkey
