#pragma once

#include <datapod/datapod.hpp>
#include <didkey/identity/key_material.hpp>
#include <didkey/suite/cryptosuite.hpp>

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>

namespace didkey {

    /// How a key family treats selective disclosure at issuance
    enum class DisclosurePolicy {
        Forbidden, // Plain proofs only
        Optional,  // Plain or selective-disclosure, by request
        Required,  // Selective-disclosure only
    };

    inline std::string disclosurePolicyToString(DisclosurePolicy policy) {
        switch (policy) {
        case DisclosurePolicy::Forbidden:
            return "Forbidden";
        case DisclosurePolicy::Optional:
            return "Optional";
        case DisclosurePolicy::Required:
            return "Required";
        default:
            return "Unknown";
        }
    }

    /// Issue with a whole-document proof
    struct PlainIssuance {};

    /// Issue with a selective-disclosure base proof
    struct DisclosureIssuance {
        std::vector<std::string> mandatoryPointers;
    };

    using IssuanceRequest = std::variant<PlainIssuance, DisclosureIssuance>;

    /// Per-family entry of the by-prefix table
    struct SuiteDescriptor {
        KeyFamily family = KeyFamily::EcdsaP256;
        DisclosurePolicy policy = DisclosurePolicy::Forbidden;
        std::shared_ptr<const Cryptosuite> plain_suite;
        std::shared_ptr<const DerivableCryptosuite> disclosure_suite;
        std::function<dp::Result<KeyHandle, dp::Error>(const Key &)> load_key;
        std::function<dp::Result<Key, dp::Error>()> generate_key;

        /// Suite for an issuance request under this family's policy
        dp::Result<std::shared_ptr<const Cryptosuite>, dp::Error> select(const IssuanceRequest &request) const;
    };

    /// A suite bound to the key that signs with it
    struct SigningSuite {
        std::shared_ptr<const Cryptosuite> suite;
        KeyHandle key;
        ProofOptions options;

        inline const std::string &verificationMethod() const { return key->verificationMethod(); }
    };

    /// Suite registry.
    ///
    /// Two independent tables: key families by publicKeyMultibase prefix (issuing), and
    /// suites by cryptosuite name (verifying). A third table holds the derivable suites.
    /// Lookups of unknown names never fall back to a default.
    class SuiteRegistry {
      public:
        SuiteRegistry() = default;
        SuiteRegistry(const SuiteRegistry &) = delete;
        SuiteRegistry &operator=(const SuiteRegistry &) = delete;

        /// Registry with the built-in families and suites
        static std::shared_ptr<SuiteRegistry> createDefault();

        // ===========================================
        // Registration
        // ===========================================

        void registerFamily(const SuiteDescriptor &descriptor);

        /// Add a verifier; derivable suites also enter the derivation table
        void registerSuite(std::shared_ptr<const Cryptosuite> suite);

        // ===========================================
        // By-prefix table
        // ===========================================

        dp::Result<SuiteDescriptor, dp::Error> descriptorFor(const std::string &public_key_multibase) const;

        /// Normalize a DID or key record and load its material
        dp::Result<KeyHandle, dp::Error> resolveKeyMaterial(const KeyReference &reference) const;

        /// Signing suite and key for an issuance request. Enforces the family's disclosure
        /// policy and requires a secret key.
        dp::Result<SigningSuite, dp::Error> signingSuite(const KeyReference &reference,
                                                         const IssuanceRequest &request) const;

        /// Generate a key for a generate() type name ("P-256", "Ed25519", ...)
        dp::Result<Key, dp::Error> generate(const std::string &type_name) const;

        // ===========================================
        // By-name tables
        // ===========================================

        dp::Result<std::shared_ptr<const Cryptosuite>, dp::Error> verifierFor(const std::string &cryptosuite) const;

        /// Derivable suite for a cryptosuite name; plain suites fail with ERR_UNSUPPORTED_CRYPTOSUITE
        dp::Result<std::shared_ptr<const DerivableCryptosuite>, dp::Error>
        deriverFor(const std::string &cryptosuite) const;

        std::vector<std::string> verifierNames() const;

      private:
        mutable std::shared_mutex mutex_;
        std::map<std::string, SuiteDescriptor> families_; // Keyed by multibase prefix
        std::map<CryptosuiteName, std::shared_ptr<const Cryptosuite>> verifiers_;
        std::map<CryptosuiteName, std::shared_ptr<const DerivableCryptosuite>> derivers_;
    };

} // namespace didkey
