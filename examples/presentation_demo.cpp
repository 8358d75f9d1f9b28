/// Presentation Demo
/// A holder wraps an issued credential into a presentation bound to a verifier's challenge

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

    void printResult(const PresentationVerificationResult &result) {
        std::cout << "  Overall: " << (result.verified ? "verified" : "NOT verified") << std::endl;
        std::cout << "  Holder proof: " << (result.presentationResult.verified ? "valid" : "invalid") << std::endl;
        for (size_t i = 0; i < result.credentialResults.size(); ++i) {
            std::cout << "  Credential " << i << ": " << (result.credentialResults[i].verified ? "valid" : "invalid")
                      << std::endl;
        }
    }
} // namespace

int main() {
    std::cout << "=== didkey Presentation Demo ===" << std::endl;
    std::cout << std::endl;

    DidKey dk;
    dk.contexts().put(CUSTOM_CONTEXT, customContext());

    auto issuer = dk.generate("P-256");
    auto holder = dk.generate("Ed25519");
    if (!issuer.is_ok() || !holder.is_ok()) {
        std::cerr << "Failed to generate keys" << std::endl;
        return 1;
    }
    std::cout << "Issuer: " << issuer.value().controller << std::endl;
    std::cout << "Holder: " << holder.value().controller << std::endl;
    std::cout << std::endl;

    // === Part 1: Issue ===
    auto vc = dk.issueCredential(unsignedCredential(), issuer.value());
    if (!vc.is_ok()) {
        std::cerr << "Failed to issue credential: " << errorMessage(vc.error()) << std::endl;
        return 1;
    }

    // === Part 2: Present ===
    std::cout << "--- Part 2: Signing a presentation ---" << std::endl;
    const std::string challenge = "verifier-challenge-42";
    auto vp = dk.signPresentation(vc.value(), holder.value(), challenge);
    if (!vp.is_ok()) {
        std::cerr << "Failed to sign presentation: " << errorMessage(vp.error()) << std::endl;
        return 1;
    }
    std::cout << vp.value().dump(2) << std::endl;
    std::cout << std::endl;

    // === Part 3: Verify ===
    std::cout << "--- Part 3: Verifying ---" << std::endl;
    auto result = dk.verifyPresentation(vp.value(), std::nullopt, std::nullopt, challenge);
    if (!result.is_ok()) {
        std::cerr << "Verification error: " << errorMessage(result.error()) << std::endl;
        return 1;
    }
    printResult(result.value());
    if (!result.value().verified)
        return 1;
    std::cout << std::endl;

    // === Part 4: Replay with another challenge ===
    std::cout << "--- Part 4: Replay against another challenge ---" << std::endl;
    auto replay = dk.verifyPresentation(vp.value(), std::nullopt, std::nullopt, std::string("other-challenge"));
    if (replay.is_ok())
        printResult(replay.value());
    std::cout << std::endl;

    // === Part 5: Tampered credential inside the presentation ===
    std::cout << "--- Part 5: Tampered credential ---" << std::endl;
    json tampered = vp.value();
    tampered["verifiableCredential"][0]["credentialSubject"]["cat_name"] = "garfield";
    auto tampered_result = dk.verifyPresentation(tampered);
    if (tampered_result.is_ok())
        printResult(tampered_result.value());

    std::cout << std::endl;
    std::cout << "=== Demo Complete ===" << std::endl;
    return 0;
}
