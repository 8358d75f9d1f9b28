#include <didkey/common/error.hpp>
#include <didkey/credential/disclosure_engine.hpp>
#include <didkey/credential/verifiable_credential.hpp>

namespace didkey {

    DisclosureEngine::DisclosureEngine(std::shared_ptr<const SuiteRegistry> registry,
                                       std::shared_ptr<const DocumentLoader> loader, Config config)
        : registry_(std::move(registry)), loader_(std::move(loader)), config_(std::move(config)) {}

    dp::Result<json, dp::Error> DisclosureEngine::derive(const json &credential,
                                                         const std::vector<std::string> &selective_pointers,
                                                         const std::optional<std::string> &presentation_header) const {
        auto parsed = VerifiableCredential::fromJson(credential);
        if (parsed.is_err())
            return dp::Result<json, dp::Error>::err(parsed.error());

        const VerifiableCredential &vc = parsed.value();
        auto proof = vc.getProof();
        if (proof.is_err())
            return dp::Result<json, dp::Error>::err(proof.error());

        auto suite = registry_->deriverFor(proof.value().cryptosuite);
        if (suite.is_err())
            return dp::Result<json, dp::Error>::err(suite.error());
        if (!suite.value()->isBaseProof(proof.value())) {
            return dp::Result<json, dp::Error>::err(make_error(
                ERR_UNSUPPORTED_CRYPTOSUITE, "Only base " + proof.value().cryptosuite + " proofs can be derived"));
        }

        auto issuer = registry_->resolveKeyMaterial(proof.value().verificationMethod);
        if (issuer.is_err())
            return dp::Result<json, dp::Error>::err(issuer.error());

        if (config_.resolve_contexts) {
            auto resolved = loader_->resolveContexts(vc.toJson());
            if (resolved.is_err())
                return dp::Result<json, dp::Error>::err(resolved.error());
        }

        auto derived = suite.value()->deriveProof(vc.unsecured(), proof.value(), selective_pointers,
                                                  presentation_header, *issuer.value());
        if (derived.is_err())
            return dp::Result<json, dp::Error>::err(derived.error());

        auto reduced = VerifiableCredential::fromJson(derived.value().first);
        if (reduced.is_err())
            return dp::Result<json, dp::Error>::err(reduced.error());

        VerifiableCredential disclosed = reduced.value();
        disclosed.addProof(derived.value().second);
        return dp::Result<json, dp::Error>::ok(disclosed.toJson());
    }

} // namespace didkey
