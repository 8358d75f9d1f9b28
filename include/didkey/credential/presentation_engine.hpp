#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/config.hpp>
#include <didkey/context/document_loader.hpp>
#include <didkey/credential/credential_engine.hpp>
#include <didkey/credential/verifiable_presentation.hpp>
#include <didkey/credential/verification_result.hpp>
#include <didkey/suite/registry.hpp>

#include <memory>
#include <optional>
#include <string>

namespace didkey {

    /// Signs and verifies presentations.
    ///
    /// The holder's authentication proof covers the presentation with each embedded
    /// credential replaced by that credential's proof; credential bodies are checked
    /// separately by the CredentialEngine. Verification reports both passes.
    class PresentationEngine {
      public:
        PresentationEngine(std::shared_ptr<const SuiteRegistry> registry, std::shared_ptr<const DocumentLoader> loader,
                           std::shared_ptr<const CredentialEngine> credentials, Config config = Config{});

        /// Sign a presentation, or wrap a credential (or array of credentials) into one first.
        /// A random challenge is generated when none is given.
        dp::Result<json, dp::Error> sign(const json &input, const KeyReference &holder,
                                         const std::optional<std::string> &challenge = std::nullopt) const;

        /// Envelope pass plus one content pass per embedded credential, all evaluated.
        /// expected_challenge defaults to the proof's own challenge.
        dp::Result<PresentationVerificationResult, dp::Error>
        verify(const json &presentation, const std::optional<KeyReference> &presentation_method = std::nullopt,
               const std::optional<KeyReference> &credential_method = std::nullopt,
               const std::optional<std::string> &expected_challenge = std::nullopt) const;

      private:
        dp::Result<VerifiablePresentation, dp::Error> toPresentation(const json &input) const;

        std::shared_ptr<const SuiteRegistry> registry_;
        std::shared_ptr<const DocumentLoader> loader_;
        std::shared_ptr<const CredentialEngine> credentials_;
        Config config_;
    };

} // namespace didkey
