#include <didkey/common/error.hpp>
#include <didkey/suite/proof.hpp>

namespace didkey {

    namespace {
        bool isKnownProofMember(const std::string &name) {
            for (const char *known : {"type", "cryptosuite", "created", "verificationMethod", "proofPurpose",
                                      "challenge", "domain", "mandatoryPointers", "proofValue"}) {
                if (name == known)
                    return true;
            }
            return false;
        }
    } // namespace

    dp::Result<ProofPurpose, dp::Error> proofPurposeFromString(const std::string &purpose) {
        if (purpose == "assertionMethod")
            return dp::Result<ProofPurpose, dp::Error>::ok(ProofPurpose::AssertionMethod);
        if (purpose == "authentication")
            return dp::Result<ProofPurpose, dp::Error>::ok(ProofPurpose::Authentication);
        return dp::Result<ProofPurpose, dp::Error>::err(
            make_error(ERR_INVALID_DOCUMENT, "Unsupported proof purpose: " + purpose));
    }

    json Proof::toJson() const {
        json j = extensions.is_object() ? extensions : json::object();
        j["type"] = type;
        j["cryptosuite"] = cryptosuite;
        j["created"] = created;
        j["verificationMethod"] = verificationMethod;
        j["proofPurpose"] = proofPurposeToString(proofPurpose);
        if (challenge)
            j["challenge"] = *challenge;
        if (domain)
            j["domain"] = *domain;
        if (!mandatoryPointers.empty())
            j["mandatoryPointers"] = mandatoryPointers;
        if (!proofValue.empty())
            j["proofValue"] = proofValue;
        return j;
    }

    json Proof::configJson(const json &document) const {
        json config = toJson();
        config.erase("proofValue");
        if (document.is_object() && document.contains("@context"))
            config["@context"] = document["@context"];
        return config;
    }

    dp::Result<Proof, dp::Error> Proof::fromJson(const json &j) {
        if (!j.is_object())
            return dp::Result<Proof, dp::Error>::err(invalid_document("Proof must be an object"));

        auto required = [&j](const char *field) -> const json * {
            if (!j.contains(field) || !j[field].is_string())
                return nullptr;
            return &j[field];
        };

        for (const char *field : {"type", "cryptosuite", "verificationMethod", "proofPurpose", "proofValue"}) {
            if (required(field) == nullptr) {
                return dp::Result<Proof, dp::Error>::err(
                    make_error(ERR_INVALID_DOCUMENT, std::string("Proof is missing string field '") + field + "'"));
            }
        }

        Proof proof;
        proof.type = j["type"].get<std::string>();
        if (proof.type != DATA_INTEGRITY_PROOF) {
            return dp::Result<Proof, dp::Error>::err(
                make_error(ERR_INVALID_DOCUMENT, "Unsupported proof type: " + proof.type));
        }

        proof.cryptosuite = j["cryptosuite"].get<std::string>();
        proof.verificationMethod = j["verificationMethod"].get<std::string>();
        proof.proofValue = j["proofValue"].get<std::string>();
        if (j.contains("created") && j["created"].is_string())
            proof.created = j["created"].get<std::string>();

        auto purpose = proofPurposeFromString(j["proofPurpose"].get<std::string>());
        if (purpose.is_err())
            return dp::Result<Proof, dp::Error>::err(purpose.error());
        proof.proofPurpose = purpose.value();

        if (j.contains("challenge") && j["challenge"].is_string())
            proof.challenge = j["challenge"].get<std::string>();
        if (j.contains("domain") && j["domain"].is_string())
            proof.domain = j["domain"].get<std::string>();

        if (j.contains("mandatoryPointers")) {
            if (!j["mandatoryPointers"].is_array()) {
                return dp::Result<Proof, dp::Error>::err(invalid_document("mandatoryPointers must be an array"));
            }
            for (const auto &pointer : j["mandatoryPointers"]) {
                if (!pointer.is_string())
                    return dp::Result<Proof, dp::Error>::err(invalid_document("mandatoryPointers must be strings"));
                proof.mandatoryPointers.push_back(pointer.get<std::string>());
            }
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!isKnownProofMember(it.key()))
                proof.extensions[it.key()] = it.value();
        }

        return dp::Result<Proof, dp::Error>::ok(proof);
    }

} // namespace didkey
