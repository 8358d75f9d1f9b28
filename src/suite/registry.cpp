#include <didkey/common/error.hpp>
#include <didkey/suite/bbs_suite.hpp>
#include <didkey/suite/data_integrity_suite.hpp>
#include <didkey/suite/ecdsa_sd_suite.hpp>
#include <didkey/suite/registry.hpp>

#include <mutex>

namespace didkey {

    dp::Result<std::shared_ptr<const Cryptosuite>, dp::Error>
    SuiteDescriptor::select(const IssuanceRequest &request) const {
        using SelectResult = dp::Result<std::shared_ptr<const Cryptosuite>, dp::Error>;
        const bool wants_disclosure = std::holds_alternative<DisclosureIssuance>(request);

        switch (policy) {
        case DisclosurePolicy::Required:
            if (!wants_disclosure) {
                return SelectResult::err(make_error(ERR_SELECTIVE_DISCLOSURE_REQUIRED,
                                                    keyFamilyToString(family) +
                                                        " keys only issue selective disclosure proofs"));
            }
            break;
        case DisclosurePolicy::Forbidden:
            if (wants_disclosure) {
                return SelectResult::err(make_error(ERR_SELECTIVE_DISCLOSURE_UNSUPPORTED,
                                                    keyFamilyToString(family) +
                                                        " keys do not support selective disclosure"));
            }
            break;
        case DisclosurePolicy::Optional:
        default:
            break;
        }

        std::shared_ptr<const Cryptosuite> suite =
            wants_disclosure ? std::shared_ptr<const Cryptosuite>(disclosure_suite) : plain_suite;
        if (!suite) {
            const std::string kind = wants_disclosure ? "selective disclosure" : "plain";
            return SelectResult::err(make_error(ERR_UNSUPPORTED_CRYPTOSUITE, "No " + kind + " suite registered for " +
                                                                                 keyFamilyToString(family) + " keys"));
        }
        return SelectResult::ok(suite);
    }

    std::shared_ptr<SuiteRegistry> SuiteRegistry::createDefault() {
        auto registry = std::make_shared<SuiteRegistry>();

        auto ecdsa = std::make_shared<const DataIntegritySuite>(
            CryptosuiteName::Ecdsa2019,
            std::vector<KeyFamily>{KeyFamily::EcdsaP256, KeyFamily::EcdsaP384, KeyFamily::EcdsaP521});
        auto ecdsa_sd = std::make_shared<const EcdsaSdSuite>();
        auto sm2 = std::make_shared<const DataIntegritySuite>(CryptosuiteName::Sm22023,
                                                              std::vector<KeyFamily>{KeyFamily::Sm2});
        auto eddsa = std::make_shared<const DataIntegritySuite>(CryptosuiteName::Eddsa2022,
                                                                std::vector<KeyFamily>{KeyFamily::Ed25519});
        auto bbs = std::make_shared<const BbsSuite>();

        for (auto family : {KeyFamily::EcdsaP256, KeyFamily::EcdsaP384, KeyFamily::EcdsaP521}) {
            SuiteDescriptor descriptor;
            descriptor.family = family;
            descriptor.policy = DisclosurePolicy::Optional;
            descriptor.plain_suite = ecdsa;
            descriptor.disclosure_suite = ecdsa_sd;
            descriptor.load_key = loadEcdsaKey;
            descriptor.generate_key = [family]() { return generateEcdsaKey(family); };
            registry->registerFamily(descriptor);
        }

        SuiteDescriptor sm2_descriptor;
        sm2_descriptor.family = KeyFamily::Sm2;
        sm2_descriptor.policy = DisclosurePolicy::Forbidden;
        sm2_descriptor.plain_suite = sm2;
        sm2_descriptor.load_key = loadEcdsaKey;
        sm2_descriptor.generate_key = []() { return generateEcdsaKey(KeyFamily::Sm2); };
        registry->registerFamily(sm2_descriptor);

        SuiteDescriptor ed25519_descriptor;
        ed25519_descriptor.family = KeyFamily::Ed25519;
        ed25519_descriptor.policy = DisclosurePolicy::Forbidden;
        ed25519_descriptor.plain_suite = eddsa;
        ed25519_descriptor.load_key = loadEd25519Key;
        ed25519_descriptor.generate_key = generateEd25519Key;
        registry->registerFamily(ed25519_descriptor);

        SuiteDescriptor bls_descriptor;
        bls_descriptor.family = KeyFamily::Bls12381G2;
        bls_descriptor.policy = DisclosurePolicy::Required;
        bls_descriptor.disclosure_suite = bbs;
        bls_descriptor.load_key = loadBls12381Key;
        bls_descriptor.generate_key = generateBls12381Key;
        registry->registerFamily(bls_descriptor);

        registry->registerSuite(ecdsa);
        registry->registerSuite(ecdsa_sd);
        registry->registerSuite(sm2);
        registry->registerSuite(eddsa);
        registry->registerSuite(bbs);

        return registry;
    }

    void SuiteRegistry::registerFamily(const SuiteDescriptor &descriptor) {
        std::unique_lock lock(mutex_);
        families_[keyFamilyInfo(descriptor.family).prefix] = descriptor;
    }

    void SuiteRegistry::registerSuite(std::shared_ptr<const Cryptosuite> suite) {
        if (!suite)
            return;

        std::unique_lock lock(mutex_);
        if (suite->isDerivable()) {
            if (auto derivable = std::dynamic_pointer_cast<const DerivableCryptosuite>(suite))
                derivers_[suite->name()] = derivable;
        }
        verifiers_[suite->name()] = std::move(suite);
    }

    dp::Result<SuiteDescriptor, dp::Error>
    SuiteRegistry::descriptorFor(const std::string &public_key_multibase) const {
        if (public_key_multibase.size() < MULTIBASE_PREFIX_LENGTH) {
            return dp::Result<SuiteDescriptor, dp::Error>::err(
                make_error(ERR_UNSUPPORTED_KEY_TYPE, "Unsupported key type: " + public_key_multibase));
        }

        std::shared_lock lock(mutex_);
        auto it = families_.find(public_key_multibase.substr(0, MULTIBASE_PREFIX_LENGTH));
        if (it == families_.end()) {
            return dp::Result<SuiteDescriptor, dp::Error>::err(
                make_error(ERR_UNSUPPORTED_KEY_TYPE, "Unsupported key type: " + public_key_multibase));
        }
        return dp::Result<SuiteDescriptor, dp::Error>::ok(it->second);
    }

    dp::Result<KeyHandle, dp::Error> SuiteRegistry::resolveKeyMaterial(const KeyReference &reference) const {
        auto key = normalizeKey(reference);
        if (key.is_err())
            return dp::Result<KeyHandle, dp::Error>::err(key.error());

        auto descriptor = descriptorFor(key.value().publicKeyMultibase);
        if (descriptor.is_err())
            return dp::Result<KeyHandle, dp::Error>::err(descriptor.error());
        if (!descriptor.value().load_key) {
            return dp::Result<KeyHandle, dp::Error>::err(make_error(
                ERR_UNSUPPORTED_KEY_TYPE, "No key loader registered for " + keyFamilyToString(descriptor.value().family)));
        }
        return descriptor.value().load_key(key.value());
    }

    dp::Result<SigningSuite, dp::Error> SuiteRegistry::signingSuite(const KeyReference &reference,
                                                                    const IssuanceRequest &request) const {
        auto key = normalizeKey(reference);
        if (key.is_err())
            return dp::Result<SigningSuite, dp::Error>::err(key.error());

        auto descriptor = descriptorFor(key.value().publicKeyMultibase);
        if (descriptor.is_err())
            return dp::Result<SigningSuite, dp::Error>::err(descriptor.error());

        auto suite = descriptor.value().select(request);
        if (suite.is_err())
            return dp::Result<SigningSuite, dp::Error>::err(suite.error());

        auto material = resolveKeyMaterial(key.value());
        if (material.is_err())
            return dp::Result<SigningSuite, dp::Error>::err(material.error());
        if (!material.value()->hasSecretKey()) {
            return dp::Result<SigningSuite, dp::Error>::err(
                make_error(ERR_SIGNING_FAILED, "Secret key required to sign with " + key.value().id));
        }

        SigningSuite signing;
        signing.suite = suite.value();
        signing.key = material.value();
        if (auto disclosure = std::get_if<DisclosureIssuance>(&request))
            signing.options.mandatoryPointers = disclosure->mandatoryPointers;
        return dp::Result<SigningSuite, dp::Error>::ok(signing);
    }

    dp::Result<Key, dp::Error> SuiteRegistry::generate(const std::string &type_name) const {
        auto family = keyFamilyFromTypeName(type_name);
        if (family.is_err())
            return dp::Result<Key, dp::Error>::err(family.error());

        auto descriptor = descriptorFor(keyFamilyInfo(family.value()).prefix);
        if (descriptor.is_err())
            return dp::Result<Key, dp::Error>::err(descriptor.error());
        if (!descriptor.value().generate_key) {
            return dp::Result<Key, dp::Error>::err(
                make_error(ERR_UNSUPPORTED_KEY_TYPE, "No key generator registered for " + type_name));
        }
        return descriptor.value().generate_key();
    }

    dp::Result<std::shared_ptr<const Cryptosuite>, dp::Error>
    SuiteRegistry::verifierFor(const std::string &cryptosuite) const {
        auto name = cryptosuiteNameFromString(cryptosuite);
        if (name.is_err())
            return dp::Result<std::shared_ptr<const Cryptosuite>, dp::Error>::err(name.error());

        std::shared_lock lock(mutex_);
        auto it = verifiers_.find(name.value());
        if (it == verifiers_.end()) {
            return dp::Result<std::shared_ptr<const Cryptosuite>, dp::Error>::err(
                make_error(ERR_UNSUPPORTED_CRYPTOSUITE, "Unsupported cryptosuite: " + cryptosuite));
        }
        return dp::Result<std::shared_ptr<const Cryptosuite>, dp::Error>::ok(it->second);
    }

    dp::Result<std::shared_ptr<const DerivableCryptosuite>, dp::Error>
    SuiteRegistry::deriverFor(const std::string &cryptosuite) const {
        auto name = cryptosuiteNameFromString(cryptosuite);
        if (name.is_err())
            return dp::Result<std::shared_ptr<const DerivableCryptosuite>, dp::Error>::err(name.error());

        std::shared_lock lock(mutex_);
        auto it = derivers_.find(name.value());
        if (it == derivers_.end()) {
            return dp::Result<std::shared_ptr<const DerivableCryptosuite>, dp::Error>::err(
                make_error(ERR_UNSUPPORTED_CRYPTOSUITE, "Unsupported cryptosuite: " + cryptosuite));
        }
        return dp::Result<std::shared_ptr<const DerivableCryptosuite>, dp::Error>::ok(it->second);
    }

    std::vector<std::string> SuiteRegistry::verifierNames() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> names;
        for (const auto &[name, suite] : verifiers_)
            names.push_back(cryptosuiteNameToString(name));
        return names;
    }

} // namespace didkey
