#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/encoding.hpp>
#include <didkey/identity/key.hpp>
#include <didkey/identity/key_family.hpp>
#include <optional>
#include <string>

namespace didkey {

    /// Components of a did:key URL (did:key:<multibase>[#fragment])
    struct ParsedDid {
        std::string authority;                 // did:key:<multibase>
        std::optional<std::string> fragment;   // Text after '#', if any
        std::string publicKeyMultibase;        // authority without "did:key:"
    };

    /// Decoded multicodec public key
    struct DecodedPublicKey {
        KeyFamily family;
        Bytes bytes;
    };

    /// Scheme and method of every identifier this library produces
    constexpr const char *DID_KEY_PREFIX = "did:key:";

    // ===========================================
    // Identity codec
    // ===========================================

    /// "did:key:" + multibase
    std::string encodeDid(const std::string &public_key_multibase);

    /// Split on '#', strip "did:key:". Fails with ERR_MALFORMED_DID when the prefix is missing
    /// or the multibase is empty.
    dp::Result<ParsedDid, dp::Error> parseDid(const std::string &did);

    /// Multibase (base58btc) of multicodec header + raw public key bytes
    std::string encodePublicKey(KeyFamily family, const Bytes &public_key);

    /// Decode a publicKeyMultibase, checking its multicodec header and length against its prefix
    dp::Result<DecodedPublicKey, dp::Error> decodePublicKey(const std::string &public_key_multibase);

    std::string encodeSecretKey(KeyFamily family, const Bytes &secret_key);
    dp::Result<Bytes, dp::Error> decodeSecretKey(KeyFamily family, const std::string &secret_key_multibase);

    /// Turn a DID string or key record into a complete key record.
    /// A DID string becomes a public-only key; a record missing publicKeyMultibase gets it from
    /// its id; a record whose publicKeyMultibase disagrees with its id fails with ERR_MISMATCHED_KEY.
    dp::Result<Key, dp::Error> normalizeKey(const KeyReference &reference);

    /// Authority (DID without fragment) of a DID URL, or the input if it is not a did:key URL
    std::string didAuthority(const std::string &did_url);

} // namespace didkey

