#pragma once

#include <didkey/common/json.hpp>
#include <didkey/identity/key.hpp>
#include <optional>
#include <string>
#include <vector>

namespace didkey {

    /// Outcome of checking one proof
    struct ProofResult {
        bool verified = false;
        std::string cryptosuite;
        Key verificationMethod;           // Public key record the proof was checked against
        std::optional<std::string> error; // Why verification failed

        inline json toJson() const {
            json j;
            j["verified"] = verified;
            j["cryptosuite"] = cryptosuite;
            j["verificationMethod"] = verificationMethod.toJson(false, false);
            if (error)
                j["error"] = *error;
            return j;
        }
    };

    /// Outcome of checking every proof of a credential (or of a presentation envelope)
    struct CredentialVerificationResult {
        bool verified = false;
        std::vector<ProofResult> results;

        inline json toJson() const {
            json j;
            j["verified"] = verified;
            j["results"] = json::array();
            for (const auto &result : results)
                j["results"].push_back(result.toJson());
            return j;
        }
    };

    /// Envelope pass plus one content pass per embedded credential.
    /// verified is the AND of all of them.
    struct PresentationVerificationResult {
        bool verified = false;
        CredentialVerificationResult presentationResult;
        std::vector<CredentialVerificationResult> credentialResults;

        inline json toJson() const {
            json j;
            j["verified"] = verified;
            j["presentationResult"] = presentationResult.toJson();
            j["credentialResults"] = json::array();
            for (const auto &result : credentialResults)
                j["credentialResults"].push_back(result.toJson());
            return j;
        }
    };

} // namespace didkey
