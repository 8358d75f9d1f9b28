#include <didkey.hpp>
#include <doctest/doctest.h>

using namespace didkey;

namespace {
    const std::string CUSTOM_CONTEXT = "https://instun.com/custom-context";

    json demoContext() {
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

    json demoCredential() {
        return json::parse(R"({
            "@context": ["https://www.w3.org/2018/credentials/v1", "https://instun.com/custom-context"],
            "type": ["VerifiableCredential"],
            "credentialSubject": {
                "dog_name": {"name1": "Fido", "breed": "Labrador", "age": 3},
                "cat_name": "tom"
            }
        })");
    }

    Config quietConfig() {
        Config cfg;
        cfg.log_fetches = false;
        return cfg;
    }

    // DidKey is not copyable, so tests build it in place
    struct TestDidKey {
        DidKey dk{quietConfig()};

        TestDidKey() { dk.contexts().put(CUSTOM_CONTEXT, demoContext()); }

        Key generate(const std::string &type) {
            auto key = dk.generate(type);
            REQUIRE(key.is_ok());
            return key.value();
        }
    };
} // namespace

TEST_SUITE("DidKey Facade Tests") {

    TEST_CASE("Generate and sign raw data") {
        TestDidKey t;
        Key key = t.generate("Ed25519");
        Bytes data = toBytes("hello did:key");

        auto signature = t.dk.sign(key, data);
        REQUIRE(signature.is_ok());

        auto by_key = t.dk.verify(key, data, signature.value());
        REQUIRE(by_key.is_ok());
        CHECK(by_key.value());

        auto by_did = t.dk.verify(KeyReference(key.id), data, signature.value());
        REQUIRE(by_did.is_ok());
        CHECK(by_did.value());

        auto tampered = t.dk.verify(key, toBytes("hello did:web"), signature.value());
        REQUIRE(tampered.is_ok());
        CHECK_FALSE(tampered.value());
    }

    TEST_CASE("Resolve key material from a DID") {
        TestDidKey t;
        Key key = t.generate("P-384");

        auto material = t.dk.resolveKey(KeyReference(key.id));
        REQUIRE(material.is_ok());
        CHECK(material.value()->family() == KeyFamily::EcdsaP384);
        CHECK(material.value()->verificationMethod() == key.id);
        CHECK_FALSE(material.value()->hasSecretKey());

        auto with_secret = t.dk.resolveKey(key);
        REQUIRE(with_secret.is_ok());
        CHECK(with_secret.value()->hasSecretKey());
    }

    TEST_CASE("Unknown key type") {
        TestDidKey t;
        auto key = t.dk.generate("secp256k1");
        REQUIRE(key.is_err());
        CHECK(isError(key.error(), ERR_UNSUPPORTED_KEY_TYPE));
    }

    TEST_CASE("Issue and verify a credential") {
        TestDidKey t;
        Key issuer = t.generate("SM2");

        auto vc = t.dk.issueCredential(demoCredential(), issuer);
        REQUIRE(vc.is_ok());
        CHECK(vc.value()["issuer"] == issuer.id);
        CHECK(vc.value()["proof"]["cryptosuite"] == "sm2-2023");

        auto result = t.dk.verifyCredential(vc.value());
        REQUIRE(result.is_ok());
        CHECK(result.value().verified);
    }

    TEST_CASE("Selective disclosure through a presentation") {
        TestDidKey t;
        Key issuer = t.generate("Bls12381");
        Key holder = t.generate("P-256");

        auto vc = t.dk.issueCredential(demoCredential(), issuer, DisclosureIssuance{{"/issuanceDate", "/issuer"}});
        REQUIRE(vc.is_ok());

        auto derived = t.dk.deriveCredential(vc.value(), {"/credentialSubject/dog_name"}, std::string("asdf"));
        REQUIRE(derived.is_ok());
        CHECK_FALSE(derived.value()["credentialSubject"].contains("cat_name"));

        auto vp = t.dk.signPresentation(derived.value(), holder, std::string("nonce-1"));
        REQUIRE(vp.is_ok());

        auto result = t.dk.verifyPresentation(vp.value(), std::nullopt, std::nullopt, std::string("nonce-1"));
        REQUIRE(result.is_ok());
        CHECK(result.value().verified);
        CHECK(result.value().presentationResult.results[0].verificationMethod.id == holder.id);
        CHECK(result.value().credentialResults[0].results[0].verificationMethod.id == issuer.id);
    }

    TEST_CASE("Unregistered context fails without a fetcher") {
        DidKey dk(quietConfig());
        auto key = dk.generate("Ed25519");
        REQUIRE(key.is_ok());

        auto vc = dk.issueCredential(demoCredential(), key.value());
        REQUIRE(vc.is_err());
        CHECK(isError(vc.error(), ERR_DOCUMENT_RESOLUTION_FAILURE));
    }

    TEST_CASE("Fetcher supplies unknown contexts") {
        int calls = 0;
        Fetcher fetcher = [&](const std::string &url) {
            ++calls;
            if (url == CUSTOM_CONTEXT)
                return dp::Result<json, dp::Error>::ok(demoContext());
            return dp::Result<json, dp::Error>::err(document_resolution_failure("Unknown URL: " + url));
        };
        DidKey dk(quietConfig(), fetcher);

        auto key = dk.generate("Ed25519");
        REQUIRE(key.is_ok());
        auto vc = dk.issueCredential(demoCredential(), key.value());
        REQUIRE(vc.is_ok());
        auto result = dk.verifyCredential(vc.value());
        REQUIRE(result.is_ok());
        CHECK(result.value().verified);

        CHECK(calls == 1);
        CHECK(dk.contexts().contains(CUSTOM_CONTEXT));
    }

    TEST_CASE("Instances share a context store") {
        auto store = std::make_shared<ContextStore>();
        DidKey issuer_side(quietConfig(), store);
        DidKey verifier_side(quietConfig(), store);

        issuer_side.contexts().put(CUSTOM_CONTEXT, demoContext());
        CHECK(verifier_side.contexts().contains(CUSTOM_CONTEXT));

        auto key = issuer_side.generate("P-256");
        REQUIRE(key.is_ok());
        auto vc = issuer_side.issueCredential(demoCredential(), key.value());
        REQUIRE(vc.is_ok());

        auto result = verifier_side.verifyCredential(vc.value());
        REQUIRE(result.is_ok());
        CHECK(result.value().verified);
    }

    TEST_CASE("Components are exposed") {
        TestDidKey t;
        CHECK(t.dk.contexts().contains(CUSTOM_CONTEXT));
        CHECK(t.dk.registry().verifierFor("eddsa-2022").is_ok());
        CHECK(t.dk.loader().load(CREDENTIALS_V2_CONTEXT).is_ok());
        CHECK(t.dk.config().challenge_length == 32);
        CHECK_FALSE(t.dk.config().log_fetches);
    }
}
