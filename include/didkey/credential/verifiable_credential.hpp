#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/config.hpp>
#include <didkey/common/error.hpp>
#include <didkey/common/json.hpp>
#include <didkey/suite/proof.hpp>
#include <string>
#include <vector>

namespace didkey {

    /// Verifiable Credential following the W3C VC Data Model (v1.1 or v2.0 contexts).
    /// Wraps the JSON document; the document itself is what gets signed.
    class VerifiableCredential {
      public:
        VerifiableCredential() = default;

        /// Wrap a credential document. Requires an object with "@context".
        inline static dp::Result<VerifiableCredential, dp::Error> fromJson(const json &document) {
            if (!document.is_object()) {
                return dp::Result<VerifiableCredential, dp::Error>::err(
                    invalid_document("Credential must be a JSON object"));
            }
            if (!document.contains("@context")) {
                return dp::Result<VerifiableCredential, dp::Error>::err(
                    invalid_document("Credential has no @context"));
            }
            VerifiableCredential vc;
            vc.document_ = document;
            return dp::Result<VerifiableCredential, dp::Error>::ok(vc);
        }

        // === Core Properties ===

        /// Get issuer (string or object id)
        inline std::string getIssuerString() const {
            return document_.contains("issuer") ? identifierOf(document_["issuer"]) : "";
        }

        inline void setIssuer(const std::string &issuer) { document_["issuer"] = issuer; }

        /// Get issuanceDate (credentials v1), empty when absent
        inline std::string getIssuanceDate() const {
            if (document_.contains("issuanceDate") && document_["issuanceDate"].is_string())
                return document_["issuanceDate"].get<std::string>();
            return "";
        }

        inline void setIssuanceDate(const std::string &date) { document_["issuanceDate"] = date; }

        // === Proof ===

        inline bool hasProof() const { return document_.contains("proof") && !document_["proof"].is_null(); }

        /// Proof objects: one, or each entry of a proof set
        inline std::vector<json> getProofs() const {
            std::vector<json> proofs;
            if (!hasProof())
                return proofs;
            const auto &proof = document_["proof"];
            if (proof.is_array()) {
                for (const auto &p : proof)
                    proofs.push_back(p);
            } else {
                proofs.push_back(proof);
            }
            return proofs;
        }

        /// Parse the only proof. Fails for zero or several proofs.
        inline dp::Result<Proof, dp::Error> getProof() const {
            auto proofs = getProofs();
            if (proofs.size() != 1) {
                return dp::Result<Proof, dp::Error>::err(
                    invalid_document("Credential must carry exactly one proof"));
            }
            return Proof::fromJson(proofs.front());
        }

        /// The document without "proof"
        inline json unsecured() const {
            json copy = document_;
            copy.erase("proof");
            return copy;
        }

        /// Add a proof. A second proof turns "proof" into a proof set.
        inline void addProof(const Proof &proof) {
            if (!hasProof()) {
                document_["proof"] = proof.toJson();
            } else if (document_["proof"].is_array()) {
                document_["proof"].push_back(proof.toJson());
            } else {
                document_["proof"] = json::array({document_["proof"], proof.toJson()});
            }
        }

        // === Serialization ===

        inline const json &toJson() const { return document_; }

      private:
        json document_ = json::object();
    };

} // namespace didkey
