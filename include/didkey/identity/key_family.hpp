#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <didkey/common/digest.hpp>
#include <string>
#include <vector>

namespace didkey {

    /// Signature algorithm family of a did:key, identified by the multibase prefix of its public key
    enum class KeyFamily {
        EcdsaP256,  // zDn
        EcdsaP384,  // z82
        EcdsaP521,  // z2J
        Sm2,        // zEP
        Ed25519,    // z6M
        Bls12381G2, // zUC
    };

    /// Multicodec varint codes and raw sizes of a key family
    struct KeyFamilyInfo {
        KeyFamily family;
        const char *type_name;   // Name accepted by generate(): "P-256", "Ed25519", ...
        const char *prefix;      // First three characters of publicKeyMultibase
        uint64_t public_codec;   // Multicodec code of the public key
        uint64_t secret_codec;   // Multicodec code of the secret key
        size_t public_key_size;  // Raw public key bytes (compressed points)
        size_t secret_key_size;  // Raw secret key bytes
        DigestAlgorithm digest;  // Hash used by the data integrity suites for this family
    };

    /// Multibase prefixes are three characters long
    constexpr size_t MULTIBASE_PREFIX_LENGTH = 3;

    /// Registry of all families in a fixed order
    const std::vector<KeyFamilyInfo> &keyFamilies();

    const KeyFamilyInfo &keyFamilyInfo(KeyFamily family);

    std::string keyFamilyToString(KeyFamily family);

    /// Parse a generate() type name ("P-256", "P-384", "P-521", "SM2", "Ed25519", "Bls12381")
    dp::Result<KeyFamily, dp::Error> keyFamilyFromTypeName(const std::string &type_name);

    /// Identify the family from the prefix of a publicKeyMultibase value
    dp::Result<KeyFamily, dp::Error> keyFamilyFromMultibase(const std::string &public_key_multibase);

    /// Comma-separated list of supported generate() type names
    std::string supportedKeyTypes();

} // namespace didkey
