#include <didkey/didkey.hpp>

namespace didkey {

    DidKey::DidKey(Config config, Fetcher fetcher)
        : DidKey(std::move(config), std::make_shared<ContextStore>(), std::move(fetcher)) {}

    DidKey::DidKey(Config config, std::shared_ptr<ContextStore> store, Fetcher fetcher)
        : config_(std::move(config)), store_(store ? std::move(store) : std::make_shared<ContextStore>()),
          registry_(SuiteRegistry::createDefault()),
          loader_(std::make_shared<DocumentLoader>(store_, std::move(fetcher), config_.log_fetches)) {
        credentials_ = std::make_shared<CredentialEngine>(registry_, loader_, config_);
        disclosure_ = std::make_unique<DisclosureEngine>(registry_, loader_, config_);
        presentations_ = std::make_unique<PresentationEngine>(registry_, loader_, credentials_, config_);
    }

    dp::Result<Key, dp::Error> DidKey::generate(const std::string &type) const { return registry_->generate(type); }

    dp::Result<KeyHandle, dp::Error> DidKey::resolveKey(const KeyReference &key) const {
        return registry_->resolveKeyMaterial(key);
    }

    dp::Result<Bytes, dp::Error> DidKey::sign(const KeyReference &key, const Bytes &data) const {
        auto material = registry_->resolveKeyMaterial(key);
        if (material.is_err())
            return dp::Result<Bytes, dp::Error>::err(material.error());
        return material.value()->sign(data);
    }

    dp::Result<bool, dp::Error> DidKey::verify(const KeyReference &key, const Bytes &data,
                                               const Bytes &signature) const {
        auto material = registry_->resolveKeyMaterial(key);
        if (material.is_err())
            return dp::Result<bool, dp::Error>::err(material.error());
        return material.value()->verify(data, signature);
    }

    dp::Result<json, dp::Error> DidKey::issueCredential(const json &credential, const KeyReference &key,
                                                        const IssuanceRequest &request) const {
        return credentials_->issue(credential, key, request);
    }

    dp::Result<CredentialVerificationResult, dp::Error>
    DidKey::verifyCredential(const json &credential, const std::optional<KeyReference> &verification_method) const {
        return credentials_->verify(credential, verification_method);
    }

    dp::Result<json, dp::Error> DidKey::deriveCredential(const json &credential,
                                                         const std::vector<std::string> &selective_pointers,
                                                         const std::optional<std::string> &presentation_header) const {
        return disclosure_->derive(credential, selective_pointers, presentation_header);
    }

    dp::Result<json, dp::Error> DidKey::signPresentation(const json &input, const KeyReference &holder,
                                                         const std::optional<std::string> &challenge) const {
        return presentations_->sign(input, holder, challenge);
    }

    dp::Result<PresentationVerificationResult, dp::Error>
    DidKey::verifyPresentation(const json &presentation, const std::optional<KeyReference> &presentation_method,
                               const std::optional<KeyReference> &credential_method,
                               const std::optional<std::string> &expected_challenge) const {
        return presentations_->verify(presentation, presentation_method, credential_method, expected_challenge);
    }

} // namespace didkey
