#include <didkey/common/config.hpp>
#include <didkey/common/error.hpp>
#include <didkey/identity/key.hpp>

namespace didkey {

    json Key::toJson(bool include_context, bool include_secret) const {
        json j;
        if (include_context)
            j["@context"] = MULTIKEY_V1_CONTEXT;
        j["id"] = id;
        j["type"] = "Multikey";
        j["controller"] = controller;
        j["publicKeyMultibase"] = publicKeyMultibase;
        if (include_secret && hasSecretKey())
            j["secretKeyMultibase"] = *secretKeyMultibase;
        return j;
    }

    dp::Result<Key, dp::Error> Key::fromJson(const json &j) {
        if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
            return dp::Result<Key, dp::Error>::err(invalid_document("Key object requires a string 'id'"));
        }

        Key key;
        key.id = j["id"].get<std::string>();
        if (j.contains("controller") && j["controller"].is_string())
            key.controller = j["controller"].get<std::string>();
        if (j.contains("publicKeyMultibase") && j["publicKeyMultibase"].is_string())
            key.publicKeyMultibase = j["publicKeyMultibase"].get<std::string>();
        if (j.contains("secretKeyMultibase") && j["secretKeyMultibase"].is_string())
            key.secretKeyMultibase = j["secretKeyMultibase"].get<std::string>();
        return dp::Result<Key, dp::Error>::ok(key);
    }

} // namespace didkey
