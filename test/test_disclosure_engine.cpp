#include <didkey/common/encoding.hpp>
#include <didkey/common/error.hpp>
#include <didkey/credential/credential_engine.hpp>
#include <didkey/credential/disclosure_engine.hpp>
#include <doctest/doctest.h>

#include <algorithm>

using namespace didkey;

namespace {
    const std::string CUSTOM_CONTEXT = "https://instun.com/custom-context";
    const std::vector<std::string> MANDATORY = {"/issuanceDate", "/issuer"};
    const std::vector<std::string> SELECTIVE = {"/credentialSubject/dog_name"};

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

    struct TestDisclosure {
        std::shared_ptr<SuiteRegistry> registry = SuiteRegistry::createDefault();
        std::shared_ptr<ContextStore> store = std::make_shared<ContextStore>();
        std::shared_ptr<DocumentLoader> loader = std::make_shared<DocumentLoader>(store, nullptr, false);
        CredentialEngine credentials{registry, loader};
        DisclosureEngine disclosure{registry, loader};

        TestDisclosure() { store->put(CUSTOM_CONTEXT, demoContext()); }

        json issueBase(const std::string &type) {
            auto key = registry->generate(type);
            REQUIRE(key.is_ok());
            auto issued = credentials.issue(demoCredential(), key.value(), DisclosureIssuance{MANDATORY});
            REQUIRE(issued.is_ok());
            return issued.value();
        }
    };

    const std::vector<std::string> SD_TYPES = {"P-256", "Bls12381"};
} // namespace

TEST_SUITE("Selective Disclosure Tests") {

    TEST_CASE("Derived credential keeps mandatory and selected fields only") {
        TestDisclosure t;
        for (const auto &type : SD_TYPES) {
            CAPTURE(type);
            json issued = t.issueBase(type);

            auto derived = t.disclosure.derive(issued, SELECTIVE, std::string("asdf"));
            REQUIRE(derived.is_ok());
            const json &vc = derived.value();

            CHECK(vc["issuer"] == issued["issuer"]);
            CHECK(vc["issuanceDate"] == issued["issuanceDate"]);
            CHECK(vc["@context"] == issued["@context"]);
            CHECK(vc["credentialSubject"]["dog_name"] == issued["credentialSubject"]["dog_name"]);
            CHECK_FALSE(vc["credentialSubject"].contains("cat_name"));
            CHECK(vc["proof"]["cryptosuite"] == issued["proof"]["cryptosuite"]);
            CHECK(vc["proof"]["proofValue"] != issued["proof"]["proofValue"]);
        }
    }

    TEST_CASE("Derived credential verifies") {
        TestDisclosure t;
        for (const auto &type : SD_TYPES) {
            CAPTURE(type);
            json issued = t.issueBase(type);

            auto derived = t.disclosure.derive(issued, SELECTIVE, std::string("asdf"));
            REQUIRE(derived.is_ok());

            auto result = t.credentials.verify(derived.value());
            REQUIRE(result.is_ok());
            CHECK(result.value().verified);
            CHECK(result.value().results[0].verificationMethod.id == issued["issuer"].get<std::string>());
        }
    }

    TEST_CASE("Derive without selective pointers reveals only mandatory fields") {
        TestDisclosure t;
        for (const auto &type : SD_TYPES) {
            CAPTURE(type);
            auto derived = t.disclosure.derive(t.issueBase(type), {});
            REQUIRE(derived.is_ok());
            CHECK_FALSE(derived.value().contains("credentialSubject"));
            CHECK(derived.value().contains("issuer"));

            auto result = t.credentials.verify(derived.value());
            REQUIRE(result.is_ok());
            CHECK(result.value().verified);
        }
    }

    TEST_CASE("Tampered derived credential fails") {
        TestDisclosure t;
        for (const auto &type : SD_TYPES) {
            CAPTURE(type);
            auto derived = t.disclosure.derive(t.issueBase(type), SELECTIVE, std::string("asdf"));
            REQUIRE(derived.is_ok());

            json tampered = derived.value();
            tampered["credentialSubject"]["dog_name"]["breed"] = "Poodle";
            auto result = t.credentials.verify(tampered);
            REQUIRE(result.is_ok());
            CHECK_FALSE(result.value().verified);
        }
    }

    TEST_CASE("Re-adding a hidden field fails") {
        TestDisclosure t;
        for (const auto &type : SD_TYPES) {
            CAPTURE(type);
            auto derived = t.disclosure.derive(t.issueBase(type), SELECTIVE);
            REQUIRE(derived.is_ok());

            json widened = derived.value();
            widened["credentialSubject"]["cat_name"] = "tom";
            auto result = t.credentials.verify(widened);
            REQUIRE(result.is_ok());
            CHECK_FALSE(result.value().verified);
        }
    }

    TEST_CASE("Forged message count in a derived BBS proof fails") {
        TestDisclosure t;
        auto derived = t.disclosure.derive(t.issueBase("Bls12381"), SELECTIVE, std::string("asdf"));
        REQUIRE(derived.is_ok());

        auto raw = multibaseDecode(derived.value()["proof"]["proofValue"].get<std::string>());
        REQUIRE(raw.is_ok());
        // Header is tag, tag, variant; the message count follows
        for (uint32_t forged : {0xFFFFFFFFu, 0u, 1u}) {
            CAPTURE(forged);
            Bytes patched = raw.value();
            Bytes count;
            appendU32(count, forged);
            std::copy(count.begin(), count.end(), patched.begin() + 3);

            json tampered = derived.value();
            tampered["proof"]["proofValue"] = multibaseEncode(patched, MULTIBASE_BASE64URL);
            auto result = t.credentials.verify(tampered);
            REQUIRE(result.is_ok());
            CHECK_FALSE(result.value().verified);
        }
    }

    TEST_CASE("Plain credential cannot be derived") {
        TestDisclosure t;
        for (const char *type : {"P-256", "Ed25519", "SM2"}) {
            CAPTURE(type);
            auto key = t.registry->generate(type);
            REQUIRE(key.is_ok());
            auto issued = t.credentials.issue(demoCredential(), key.value());
            REQUIRE(issued.is_ok());

            auto derived = t.disclosure.derive(issued.value(), SELECTIVE);
            REQUIRE(derived.is_err());
            CHECK(isError(derived.error(), ERR_UNSUPPORTED_CRYPTOSUITE));
        }
    }

    TEST_CASE("Derived credential cannot be derived again") {
        TestDisclosure t;
        for (const auto &type : SD_TYPES) {
            CAPTURE(type);
            auto derived = t.disclosure.derive(t.issueBase(type), SELECTIVE);
            REQUIRE(derived.is_ok());

            auto again = t.disclosure.derive(derived.value(), SELECTIVE);
            REQUIRE(again.is_err());
            CHECK(isError(again.error(), ERR_UNSUPPORTED_CRYPTOSUITE));
        }
    }

    TEST_CASE("Selective pointer must address a value") {
        TestDisclosure t;
        for (const auto &type : SD_TYPES) {
            CAPTURE(type);
            auto derived = t.disclosure.derive(t.issueBase(type), {"/credentialSubject/horse_name"});
            REQUIRE(derived.is_err());
            CHECK(isError(derived.error(), ERR_INVALID_POINTER));
        }
    }

    TEST_CASE("Credential without proof cannot be derived") {
        TestDisclosure t;
        auto derived = t.disclosure.derive(demoCredential(), SELECTIVE);
        REQUIRE(derived.is_err());
        CHECK(isError(derived.error(), ERR_INVALID_DOCUMENT));
    }

    TEST_CASE("Input credential is not modified") {
        TestDisclosure t;
        json issued = t.issueBase("P-256");
        const json original = issued;

        auto derived = t.disclosure.derive(issued, SELECTIVE);
        REQUIRE(derived.is_ok());
        CHECK(issued == original);
    }
}
