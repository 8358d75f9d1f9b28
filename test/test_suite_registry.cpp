#include <didkey/common/error.hpp>
#include <didkey/suite/registry.hpp>
#include <doctest/doctest.h>

#include <algorithm>

using namespace didkey;

TEST_SUITE("Suite Registry Tests") {

    TEST_CASE("Default registry knows every verifier name") {
        auto registry = SuiteRegistry::createDefault();
        auto names = registry->verifierNames();
        for (const char *name : {"ecdsa-2019", "ecdsa-sd-2023", "eddsa-2022", "sm2-2023", "bbs-2023"}) {
            CAPTURE(name);
            CHECK(std::find(names.begin(), names.end(), name) != names.end());
            CHECK(registry->verifierFor(name).is_ok());
        }
    }

    TEST_CASE("Unknown cryptosuite name has no fallback") {
        auto registry = SuiteRegistry::createDefault();
        auto result = registry->verifierFor("rsa-2018");
        REQUIRE(result.is_err());
        CHECK(isError(result.error(), ERR_UNSUPPORTED_CRYPTOSUITE));
    }

    TEST_CASE("Only selective disclosure suites derive") {
        auto registry = SuiteRegistry::createDefault();
        CHECK(registry->deriverFor("ecdsa-sd-2023").is_ok());
        CHECK(registry->deriverFor("bbs-2023").is_ok());

        for (const char *name : {"ecdsa-2019", "eddsa-2022", "sm2-2023"}) {
            CAPTURE(name);
            auto result = registry->deriverFor(name);
            REQUIRE(result.is_err());
            CHECK(isError(result.error(), ERR_UNSUPPORTED_CRYPTOSUITE));
        }
    }

    TEST_CASE("Descriptor policies") {
        auto registry = SuiteRegistry::createDefault();
        CHECK(registry->descriptorFor("zDnX").value().policy == DisclosurePolicy::Optional);
        CHECK(registry->descriptorFor("z82X").value().policy == DisclosurePolicy::Optional);
        CHECK(registry->descriptorFor("z2JX").value().policy == DisclosurePolicy::Optional);
        CHECK(registry->descriptorFor("zEPX").value().policy == DisclosurePolicy::Forbidden);
        CHECK(registry->descriptorFor("z6MX").value().policy == DisclosurePolicy::Forbidden);
        CHECK(registry->descriptorFor("zUCX").value().policy == DisclosurePolicy::Required);

        auto unknown = registry->descriptorFor("zQ3X");
        REQUIRE(unknown.is_err());
        CHECK(isError(unknown.error(), ERR_UNSUPPORTED_KEY_TYPE));
    }

    TEST_CASE("Generate through the registry") {
        auto registry = SuiteRegistry::createDefault();
        auto key = registry->generate("P-521");
        REQUIRE(key.is_ok());
        CHECK(key.value().publicKeyMultibase.substr(0, 3) == "z2J");

        auto unknown = registry->generate("RSA");
        REQUIRE(unknown.is_err());
        CHECK(isError(unknown.error(), ERR_UNSUPPORTED_KEY_TYPE));
    }
}

TEST_SUITE("Signing Suite Selection Tests") {

    TEST_CASE("Optional families pick by request") {
        auto registry = SuiteRegistry::createDefault();
        auto key = registry->generate("P-256");
        REQUIRE(key.is_ok());

        auto plain = registry->signingSuite(key.value(), PlainIssuance{});
        REQUIRE(plain.is_ok());
        CHECK(plain.value().suite->toString() == "ecdsa-2019");
        CHECK(plain.value().verificationMethod() == key.value().id);

        auto disclosure = registry->signingSuite(key.value(), DisclosureIssuance{{"/issuer"}});
        REQUIRE(disclosure.is_ok());
        CHECK(disclosure.value().suite->toString() == "ecdsa-sd-2023");
        CHECK(disclosure.value().options.mandatoryPointers == std::vector<std::string>{"/issuer"});
    }

    TEST_CASE("Forbidden families reject disclosure requests") {
        auto registry = SuiteRegistry::createDefault();
        for (const char *type : {"Ed25519", "SM2"}) {
            CAPTURE(type);
            auto key = registry->generate(type);
            REQUIRE(key.is_ok());

            auto result = registry->signingSuite(key.value(), DisclosureIssuance{{"/issuer"}});
            REQUIRE(result.is_err());
            CHECK(isError(result.error(), ERR_SELECTIVE_DISCLOSURE_UNSUPPORTED));

            CHECK(registry->signingSuite(key.value(), PlainIssuance{}).is_ok());
        }
    }

    TEST_CASE("Required family rejects plain requests") {
        auto registry = SuiteRegistry::createDefault();
        auto key = registry->generate("Bls12381");
        REQUIRE(key.is_ok());

        auto plain = registry->signingSuite(key.value(), PlainIssuance{});
        REQUIRE(plain.is_err());
        CHECK(isError(plain.error(), ERR_SELECTIVE_DISCLOSURE_REQUIRED));

        auto disclosure = registry->signingSuite(key.value(), DisclosureIssuance{});
        REQUIRE(disclosure.is_ok());
        CHECK(disclosure.value().suite->toString() == "bbs-2023");
    }

    TEST_CASE("Signing needs a secret key") {
        auto registry = SuiteRegistry::createDefault();
        auto key = registry->generate("Ed25519");
        REQUIRE(key.is_ok());

        auto result = registry->signingSuite(KeyReference(key.value().id), PlainIssuance{});
        REQUIRE(result.is_err());
        CHECK(isError(result.error(), ERR_SIGNING_FAILED));
    }

    TEST_CASE("Policy is checked before the secret key") {
        auto registry = SuiteRegistry::createDefault();
        auto key = registry->generate("Bls12381");
        REQUIRE(key.is_ok());

        auto result = registry->signingSuite(KeyReference(key.value().id), PlainIssuance{});
        REQUIRE(result.is_err());
        CHECK(isError(result.error(), ERR_SELECTIVE_DISCLOSURE_REQUIRED));
    }

    TEST_CASE("Unsupported key prefix") {
        auto registry = SuiteRegistry::createDefault();
        auto result = registry->signingSuite(
            KeyReference(std::string("did:key:zQ3shokFTS3brHcDQrn82RUDfCZESWL1ZdCEJwekUDPQiYBme")), PlainIssuance{});
        REQUIRE(result.is_err());
        CHECK(isError(result.error(), ERR_UNSUPPORTED_KEY_TYPE));
    }

    TEST_CASE("Family without suites cannot sign") {
        auto registry = std::make_shared<SuiteRegistry>();
        SuiteDescriptor descriptor;
        descriptor.family = KeyFamily::EcdsaP256;
        descriptor.policy = DisclosurePolicy::Optional;
        descriptor.load_key = loadEcdsaKey;
        descriptor.generate_key = []() { return generateEcdsaKey(KeyFamily::EcdsaP256); };
        registry->registerFamily(descriptor);

        auto key = registry->generate("P-256");
        REQUIRE(key.is_ok());
        CHECK(registry->resolveKeyMaterial(key.value()).is_ok());

        auto plain = registry->signingSuite(key.value(), PlainIssuance{});
        REQUIRE(plain.is_err());
        CHECK(isError(plain.error(), ERR_UNSUPPORTED_CRYPTOSUITE));

        auto disclosure = registry->signingSuite(key.value(), DisclosureIssuance{{"/issuer"}});
        REQUIRE(disclosure.is_err());
        CHECK(isError(disclosure.error(), ERR_UNSUPPORTED_CRYPTOSUITE));

        auto selected = descriptor.select(PlainIssuance{});
        REQUIRE(selected.is_err());
        CHECK(isError(selected.error(), ERR_UNSUPPORTED_CRYPTOSUITE));
    }

    TEST_CASE("Family without a loader or generator") {
        auto registry = std::make_shared<SuiteRegistry>();
        SuiteDescriptor descriptor;
        descriptor.family = KeyFamily::Ed25519;
        registry->registerFamily(descriptor);

        auto generated = registry->generate("Ed25519");
        REQUIRE(generated.is_err());
        CHECK(isError(generated.error(), ERR_UNSUPPORTED_KEY_TYPE));

        auto defaults = SuiteRegistry::createDefault();
        auto key = defaults->generate("Ed25519");
        REQUIRE(key.is_ok());
        auto material = registry->resolveKeyMaterial(key.value());
        REQUIRE(material.is_err());
        CHECK(isError(material.error(), ERR_UNSUPPORTED_KEY_TYPE));
    }
}

TEST_SUITE("Cryptosuite Name Tests") {

    TEST_CASE("Names round trip") {
        for (auto name : {CryptosuiteName::Ecdsa2019, CryptosuiteName::EcdsaSd2023, CryptosuiteName::Eddsa2022,
                          CryptosuiteName::Sm22023, CryptosuiteName::Bbs2023}) {
            auto parsed = cryptosuiteNameFromString(cryptosuiteNameToString(name));
            REQUIRE(parsed.is_ok());
            CHECK(parsed.value() == name);
        }
        CHECK(cryptosuiteNameFromString("ecdsa-rdfc-2019").is_err());
    }

    TEST_CASE("Disclosure policy names") {
        CHECK(disclosurePolicyToString(DisclosurePolicy::Forbidden) == "Forbidden");
        CHECK(disclosurePolicyToString(DisclosurePolicy::Optional) == "Optional");
        CHECK(disclosurePolicyToString(DisclosurePolicy::Required) == "Required");
    }
}
