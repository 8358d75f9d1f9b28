#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/config.hpp>
#include <didkey/context/context_store.hpp>
#include <didkey/context/document_loader.hpp>
#include <didkey/credential/credential_engine.hpp>
#include <didkey/credential/disclosure_engine.hpp>
#include <didkey/credential/presentation_engine.hpp>
#include <didkey/suite/registry.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace didkey {

    // ===========================================
    // DidKey - did:key identities and credentials
    // ===========================================

    /// High-level API owning the suite registry, the context store and the engines.
    /// All operations are synchronous and safe to call from several threads.
    class DidKey {
      public:
        /// @param config Library settings
        /// @param fetcher Remote document fetcher; without one only seeded and registered
        ///        contexts resolve
        explicit DidKey(Config config = Config{}, Fetcher fetcher = nullptr);

        /// Share a context store between instances
        DidKey(Config config, std::shared_ptr<ContextStore> store, Fetcher fetcher = nullptr);

        DidKey(const DidKey &) = delete;
        DidKey &operator=(const DidKey &) = delete;

        // ===========================================
        // Keys
        // ===========================================

        /// Generate a key pair
        /// @param type "P-256", "P-384", "P-521", "SM2", "Ed25519" or "Bls12381"
        /// @return Key with id, controller, publicKeyMultibase and secretKeyMultibase
        dp::Result<Key, dp::Error> generate(const std::string &type) const;

        /// Sign raw bytes (needs the secret key)
        dp::Result<Bytes, dp::Error> sign(const KeyReference &key, const Bytes &data) const;

        /// Verify raw bytes against a key or DID
        dp::Result<bool, dp::Error> verify(const KeyReference &key, const Bytes &data, const Bytes &signature) const;

        /// Key material for a DID or key record
        dp::Result<KeyHandle, dp::Error> resolveKey(const KeyReference &key) const;

        // ===========================================
        // Credentials
        // ===========================================

        /// Issue a credential
        /// @param credential Unsigned credential document
        /// @param key Issuer key (with secret)
        /// @param request PlainIssuance, or DisclosureIssuance with mandatory pointers
        dp::Result<json, dp::Error> issueCredential(const json &credential, const KeyReference &key,
                                                    const IssuanceRequest &request = PlainIssuance{}) const;

        dp::Result<CredentialVerificationResult, dp::Error>
        verifyCredential(const json &credential,
                         const std::optional<KeyReference> &verification_method = std::nullopt) const;

        /// Derive a selective disclosure from a base credential
        /// @param selective_pointers JSON pointers of the fields to reveal
        /// @param presentation_header Bound into the derived proof (bbs-2023)
        dp::Result<json, dp::Error> deriveCredential(const json &credential,
                                                     const std::vector<std::string> &selective_pointers,
                                                     const std::optional<std::string> &presentation_header =
                                                         std::nullopt) const;

        // ===========================================
        // Presentations
        // ===========================================

        dp::Result<json, dp::Error> signPresentation(const json &input, const KeyReference &holder,
                                                     const std::optional<std::string> &challenge = std::nullopt) const;

        dp::Result<PresentationVerificationResult, dp::Error>
        verifyPresentation(const json &presentation,
                           const std::optional<KeyReference> &presentation_method = std::nullopt,
                           const std::optional<KeyReference> &credential_method = std::nullopt,
                           const std::optional<std::string> &expected_challenge = std::nullopt) const;

        // ===========================================
        // Components
        // ===========================================

        inline ContextStore &contexts() { return *store_; }
        inline const ContextStore &contexts() const { return *store_; }
        inline SuiteRegistry &registry() { return *registry_; }
        inline const SuiteRegistry &registry() const { return *registry_; }
        inline const DocumentLoader &loader() const { return *loader_; }
        inline const Config &config() const { return config_; }

      private:
        Config config_;
        std::shared_ptr<ContextStore> store_;
        std::shared_ptr<SuiteRegistry> registry_;
        std::shared_ptr<DocumentLoader> loader_;
        std::shared_ptr<CredentialEngine> credentials_;
        std::unique_ptr<DisclosureEngine> disclosure_;
        std::unique_ptr<PresentationEngine> presentations_;
    };

} // namespace didkey
