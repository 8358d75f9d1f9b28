#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace didkey {

    constexpr const char *DATA_INTEGRITY_PROOF = "DataIntegrityProof";

    /// Relationship a proof asserts between the signer and the document
    enum class ProofPurpose {
        AssertionMethod, // Credentials
        Authentication,  // Presentations
    };

    inline std::string proofPurposeToString(ProofPurpose purpose) {
        switch (purpose) {
        case ProofPurpose::AssertionMethod:
            return "assertionMethod";
        case ProofPurpose::Authentication:
            return "authentication";
        default:
            return "unknown";
        }
    }

    dp::Result<ProofPurpose, dp::Error> proofPurposeFromString(const std::string &purpose);

    /// Data integrity proof attached under "proof"
    struct Proof {
        std::string type = DATA_INTEGRITY_PROOF;
        std::string cryptosuite;
        std::string created;
        std::string verificationMethod;
        ProofPurpose proofPurpose = ProofPurpose::AssertionMethod;
        std::optional<std::string> challenge;
        std::optional<std::string> domain;
        std::vector<std::string> mandatoryPointers;
        std::string proofValue;

        /// Members not listed above. Kept through toJson and hashed with the config.
        json extensions = json::object();

        json toJson() const;

        /// Proof options hashed by the suites: everything except proofValue, under the
        /// document's @context
        json configJson(const json &document) const;

        static dp::Result<Proof, dp::Error> fromJson(const json &j);
    };

} // namespace didkey
