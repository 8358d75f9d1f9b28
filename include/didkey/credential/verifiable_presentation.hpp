#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/config.hpp>
#include <didkey/common/error.hpp>
#include <didkey/common/json.hpp>
#include <didkey/suite/proof.hpp>
#include <string>
#include <vector>

namespace didkey {

    /// Verifiable Presentation - bundle of credentials signed by a holder
    /// Following W3C VP Data Model
    class VerifiablePresentation {
      public:
        static constexpr const char *TYPE = "VerifiablePresentation";

        VerifiablePresentation() = default;

        /// Whether a document declares the VerifiablePresentation type
        inline static bool isPresentation(const json &document) {
            if (!document.is_object() || !document.contains("type"))
                return false;
            const auto &type = document["type"];
            if (type.is_string())
                return type.get<std::string>() == TYPE;
            if (type.is_array()) {
                for (const auto &t : type) {
                    if (t.is_string() && t.get<std::string>() == TYPE)
                        return true;
                }
            }
            return false;
        }

        /// Wrap a presentation document. Requires an object with "@context".
        inline static dp::Result<VerifiablePresentation, dp::Error> fromJson(const json &document) {
            if (!document.is_object()) {
                return dp::Result<VerifiablePresentation, dp::Error>::err(
                    invalid_document("Presentation must be a JSON object"));
            }
            if (!document.contains("@context")) {
                return dp::Result<VerifiablePresentation, dp::Error>::err(
                    invalid_document("Presentation has no @context"));
            }
            VerifiablePresentation vp;
            vp.document_ = document;
            return dp::Result<VerifiablePresentation, dp::Error>::ok(vp);
        }

        /// Create an unsigned presentation around credentials
        inline static VerifiablePresentation create(const std::vector<json> &credentials,
                                                    const std::string &context = CREDENTIALS_V2_CONTEXT) {
            VerifiablePresentation vp;
            vp.document_["@context"] = json::array({context});
            vp.document_["type"] = json::array({TYPE});
            vp.document_["verifiableCredential"] = json::array();
            for (const auto &credential : credentials)
                vp.document_["verifiableCredential"].push_back(credential);
            return vp;
        }

        // === Credentials ===

        /// Embedded credentials (a single object counts as one)
        inline std::vector<json> getCredentials() const {
            std::vector<json> credentials;
            if (!document_.contains("verifiableCredential"))
                return credentials;
            const auto &vc = document_["verifiableCredential"];
            if (vc.is_array()) {
                for (const auto &c : vc)
                    credentials.push_back(c);
            } else if (!vc.is_null()) {
                credentials.push_back(vc);
            }
            return credentials;
        }

        // === Proof ===

        inline bool hasProof() const { return document_.contains("proof") && !document_["proof"].is_null(); }

        inline dp::Result<Proof, dp::Error> getProof() const {
            if (!hasProof())
                return dp::Result<Proof, dp::Error>::err(invalid_document("Presentation has no proof"));
            return Proof::fromJson(document_["proof"]);
        }

        inline json getProofJson() const { return hasProof() ? document_["proof"] : json(); }

        inline void setProof(const Proof &proof) { document_["proof"] = proof.toJson(); }

        /// The document without "proof"
        inline json unsecured() const {
            json copy = document_;
            copy.erase("proof");
            return copy;
        }

        /// Document covered by the holder's proof: the unsecured presentation with every
        /// embedded credential replaced by that credential's proof. Credential bodies are
        /// bound through their own proofs.
        inline json envelopeView() const {
            json view = unsecured();
            if (!view.contains("verifiableCredential"))
                return view;

            auto bind = [](const json &credential) -> json {
                if (credential.is_object() && credential.contains("proof"))
                    return credential["proof"];
                return credential;
            };

            auto &vc = view["verifiableCredential"];
            if (vc.is_array()) {
                for (auto &credential : vc)
                    credential = bind(credential);
            } else {
                vc = bind(vc);
            }
            return view;
        }

        // === Serialization ===

        inline const json &toJson() const { return document_; }

      private:
        json document_ = json::object();
    };

} // namespace didkey
