/// Selective Disclosure Demo
/// Issues base credentials with ecdsa-sd-2023 and bbs-2023 and derives a disclosure revealing one field

#include <didkey.hpp>
#include <iostream>

using namespace didkey;

namespace {
    const char *CUSTOM_CONTEXT = "https://instun.com/custom-context";

    json customContext() {
        return json::parse(R"({
            "@context": {
                "@version": 1.1,
                "@protected": true,
                "id": "@id",
                "type": "@type",
                "dog_name": {"@id": "https://instun.com/vocab#dog_name", "@type": "@json"},
                "cat_name": "https://instun.com/vocab#cat_name"
            }
        })");
    }

    json unsignedCredential() {
        return json::parse(R"({
            "@context": ["https://www.w3.org/2018/credentials/v1", "https://instun.com/custom-context"],
            "type": ["VerifiableCredential"],
            "credentialSubject": {
                "dog_name": {"name1": "Fido", "breed": "Labrador", "age": 3},
                "cat_name": "tom"
            }
        })");
    }
} // namespace

int main() {
    std::cout << "=== didkey Selective Disclosure Demo ===" << std::endl;
    std::cout << std::endl;

    DidKey dk;
    dk.contexts().put(CUSTOM_CONTEXT, customContext());

    const DisclosureIssuance request{{"/issuanceDate", "/issuer"}};
    const std::vector<std::string> reveal = {"/credentialSubject/dog_name"};

    for (const char *type : {"P-256", "Bls12381"}) {
        std::cout << "--- " << type << " ---" << std::endl;

        auto key = dk.generate(type);
        if (!key.is_ok()) {
            std::cerr << "Failed to generate " << type << " key" << std::endl;
            return 1;
        }

        // Issuer signs the whole credential, marking the always-disclosed fields
        auto base = dk.issueCredential(unsignedCredential(), key.value(), request);
        if (!base.is_ok()) {
            std::cerr << "Failed to issue base credential: " << errorMessage(base.error()) << std::endl;
            return 1;
        }
        std::cout << "Base proof: " << base.value()["proof"]["cryptosuite"].get<std::string>() << std::endl;

        // Holder reveals dog_name only
        auto derived = dk.deriveCredential(base.value(), reveal, std::string("asdf"));
        if (!derived.is_ok()) {
            std::cerr << "Failed to derive credential: " << errorMessage(derived.error()) << std::endl;
            return 1;
        }
        std::cout << "Derived credential subject: " << derived.value()["credentialSubject"].dump() << std::endl;

        auto result = dk.verifyCredential(derived.value());
        if (!result.is_ok()) {
            std::cerr << "Failed to verify derived credential: " << errorMessage(result.error()) << std::endl;
            return 1;
        }
        std::cout << "Derived credential verified: " << (result.value().verified ? "yes" : "no") << std::endl;
        if (!result.value().verified)
            return 1;

        // A derived proof is final
        auto again = dk.deriveCredential(derived.value(), reveal);
        std::cout << "Second derivation rejected: " << (again.is_err() ? "yes" : "no") << std::endl;
        std::cout << std::endl;
    }

    std::cout << "=== Demo Complete ===" << std::endl;
    return 0;
}
