#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace didkey {

    /// Multikey record of a did:key identity.
    /// id and controller are "did:key:<publicKeyMultibase>"; secretKeyMultibase is only
    /// present for locally generated keys and never needed for verification.
    struct Key {
        std::string id;
        std::string controller;
        std::string publicKeyMultibase;
        std::optional<std::string> secretKeyMultibase;

        inline bool hasSecretKey() const { return secretKeyMultibase.has_value() && !secretKeyMultibase->empty(); }

        /// Public-only copy
        inline Key publicKey() const { return Key{id, controller, publicKeyMultibase, std::nullopt}; }

        /// Export as a Multikey JSON object
        json toJson(bool include_context = true, bool include_secret = true) const;

        /// Import from a JSON object; id is required, the rest is optional
        static dp::Result<Key, dp::Error> fromJson(const json &j);

        inline bool operator==(const Key &other) const {
            return id == other.id && controller == other.controller &&
                   publicKeyMultibase == other.publicKeyMultibase && secretKeyMultibase == other.secretKeyMultibase;
        }

        inline bool operator!=(const Key &other) const { return !(*this == other); }
    };

    /// A key given either as a DID (URL) string or as a key record
    using KeyReference = std::variant<std::string, Key>;

} // namespace didkey
