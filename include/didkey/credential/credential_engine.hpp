#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/config.hpp>
#include <didkey/context/document_loader.hpp>
#include <didkey/credential/verifiable_credential.hpp>
#include <didkey/credential/verification_result.hpp>
#include <didkey/suite/registry.hpp>

#include <memory>
#include <optional>
#include <string>

namespace didkey {

    /// Issues and verifies credentials
    class CredentialEngine {
      public:
        CredentialEngine(std::shared_ptr<const SuiteRegistry> registry, std::shared_ptr<const DocumentLoader> loader,
                         Config config = Config{});

        /// Sign a credential with an assertionMethod proof.
        /// issuer is replaced by the signer's verification method; the input is not modified.
        dp::Result<json, dp::Error> issue(const json &credential, const KeyReference &key,
                                          const IssuanceRequest &request = PlainIssuance{}) const;

        /// Check every proof of a credential. A failed check is a false result, not an error.
        /// verification_method, when given, replaces each proof's own method.
        dp::Result<CredentialVerificationResult, dp::Error>
        verify(const json &credential, const std::optional<KeyReference> &verification_method = std::nullopt) const;

        /// Check one proof over an unsecured document.
        /// expected_controller, when given, must be the controller of the verification method.
        dp::Result<ProofResult, dp::Error> verifyProof(const json &document, const json &proof, ProofPurpose purpose,
                                                       const std::optional<KeyReference> &verification_method,
                                                       const std::optional<std::string> &expected_controller) const;

        inline const Config &config() const { return config_; }

      private:
        std::shared_ptr<const SuiteRegistry> registry_;
        std::shared_ptr<const DocumentLoader> loader_;
        Config config_;
    };

} // namespace didkey
