/// Credential Demo
/// Issues a credential with each plain cryptosuite and verifies it, then shows tamper detection

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
    std::cout << "=== didkey Credential Demo ===" << std::endl;
    std::cout << std::endl;

    DidKey dk;
    dk.contexts().put(CUSTOM_CONTEXT, customContext());

    // === Part 1: Issue and verify with each key family ===
    std::cout << "--- Part 1: Issue and verify ---" << std::endl;

    json last_credential;
    for (const char *type : {"P-256", "P-384", "P-521", "SM2", "Ed25519"}) {
        auto key = dk.generate(type);
        if (!key.is_ok()) {
            std::cerr << "Failed to generate " << type << " key" << std::endl;
            return 1;
        }

        auto vc = dk.issueCredential(unsignedCredential(), key.value());
        if (!vc.is_ok()) {
            std::cerr << "Failed to issue credential: " << errorMessage(vc.error()) << std::endl;
            return 1;
        }

        auto result = dk.verifyCredential(vc.value());
        if (!result.is_ok()) {
            std::cerr << "Failed to verify credential: " << errorMessage(result.error()) << std::endl;
            return 1;
        }
        std::cout << "  " << type << " (" << vc.value()["proof"]["cryptosuite"].get<std::string>()
                  << "): " << (result.value().verified ? "verified" : "NOT verified") << std::endl;
        if (!result.value().verified)
            return 1;
        last_credential = vc.value();
    }
    std::cout << std::endl;

    std::cout << "Signed credential:" << std::endl;
    std::cout << last_credential.dump(2) << std::endl;
    std::cout << std::endl;

    // === Part 2: Tamper detection ===
    std::cout << "--- Part 2: Tamper detection ---" << std::endl;

    json tampered = last_credential;
    tampered["credentialSubject"]["cat_name"] = "garfield";
    auto tampered_result = dk.verifyCredential(tampered);
    if (!tampered_result.is_ok()) {
        std::cerr << "Verification error: " << errorMessage(tampered_result.error()) << std::endl;
        return 1;
    }
    std::cout << "Tampered credential verified: " << (tampered_result.value().verified ? "yes" : "no") << std::endl;
    std::cout << tampered_result.value().toJson().dump(2) << std::endl;

    std::cout << std::endl;
    std::cout << "=== Demo Complete ===" << std::endl;
    return 0;
}
