#include <didkey/common/error.hpp>
#include <didkey/identity/did_key.hpp>

namespace didkey {

    std::string encodeDid(const std::string &public_key_multibase) { return DID_KEY_PREFIX + public_key_multibase; }

    dp::Result<ParsedDid, dp::Error> parseDid(const std::string &did) {
        ParsedDid parsed;

        size_t hash_pos = did.find('#');
        parsed.authority = did.substr(0, hash_pos);
        if (hash_pos != std::string::npos)
            parsed.fragment = did.substr(hash_pos + 1);

        const std::string prefix = DID_KEY_PREFIX;
        if (parsed.authority.compare(0, prefix.size(), prefix) != 0) {
            return dp::Result<ParsedDid, dp::Error>::err(
                make_error(ERR_MALFORMED_DID, "Invalid DID: must start with 'did:key:': " + did));
        }

        parsed.publicKeyMultibase = parsed.authority.substr(prefix.size());
        if (parsed.publicKeyMultibase.empty()) {
            return dp::Result<ParsedDid, dp::Error>::err(
                make_error(ERR_MALFORMED_DID, "Invalid DID: missing public key multibase: " + did));
        }

        return dp::Result<ParsedDid, dp::Error>::ok(parsed);
    }

    std::string didAuthority(const std::string &did_url) { return did_url.substr(0, did_url.find('#')); }

    std::string encodePublicKey(KeyFamily family, const Bytes &public_key) {
        Bytes data;
        appendVarint(data, keyFamilyInfo(family).public_codec);
        append(data, public_key);
        return multibaseEncode(data, MULTIBASE_BASE58BTC);
    }

    dp::Result<DecodedPublicKey, dp::Error> decodePublicKey(const std::string &public_key_multibase) {
        auto family = keyFamilyFromMultibase(public_key_multibase);
        if (family.is_err())
            return dp::Result<DecodedPublicKey, dp::Error>::err(family.error());
        const auto &info = keyFamilyInfo(family.value());

        if (public_key_multibase[0] != MULTIBASE_BASE58BTC) {
            return dp::Result<DecodedPublicKey, dp::Error>::err(
                malformed_did("Public key multibase must be base58btc encoded"));
        }

        auto raw = multibaseDecode(public_key_multibase);
        if (raw.is_err()) {
            return dp::Result<DecodedPublicKey, dp::Error>::err(
                make_error(ERR_MALFORMED_DID, "Invalid public key multibase: " + errorMessage(raw.error())));
        }

        size_t offset = 0;
        auto codec = readVarint(raw.value(), offset);
        if (codec.is_err() || codec.value() != info.public_codec) {
            return dp::Result<DecodedPublicKey, dp::Error>::err(
                make_error(ERR_MALFORMED_DID, std::string("Public key multicodec header does not match ") +
                                                  info.type_name));
        }

        Bytes key_bytes(raw.value().begin() + static_cast<std::ptrdiff_t>(offset), raw.value().end());
        if (key_bytes.size() != info.public_key_size) {
            return dp::Result<DecodedPublicKey, dp::Error>::err(make_error(
                ERR_MALFORMED_DID, std::string(info.type_name) + " public key must be " +
                                       std::to_string(info.public_key_size) + " bytes"));
        }

        return dp::Result<DecodedPublicKey, dp::Error>::ok(DecodedPublicKey{family.value(), key_bytes});
    }

    std::string encodeSecretKey(KeyFamily family, const Bytes &secret_key) {
        Bytes data;
        appendVarint(data, keyFamilyInfo(family).secret_codec);
        append(data, secret_key);
        return multibaseEncode(data, MULTIBASE_BASE58BTC);
    }

    dp::Result<Bytes, dp::Error> decodeSecretKey(KeyFamily family, const std::string &secret_key_multibase) {
        const auto &info = keyFamilyInfo(family);

        auto raw = multibaseDecode(secret_key_multibase);
        if (raw.is_err()) {
            return dp::Result<Bytes, dp::Error>::err(
                make_error(ERR_MISMATCHED_KEY, "Invalid secret key multibase: " + errorMessage(raw.error())));
        }

        size_t offset = 0;
        auto codec = readVarint(raw.value(), offset);
        if (codec.is_err() || codec.value() != info.secret_codec) {
            return dp::Result<Bytes, dp::Error>::err(make_error(
                ERR_MISMATCHED_KEY, std::string("Secret key multicodec header does not match ") + info.type_name));
        }

        Bytes key_bytes(raw.value().begin() + static_cast<std::ptrdiff_t>(offset), raw.value().end());
        if (key_bytes.size() != info.secret_key_size) {
            return dp::Result<Bytes, dp::Error>::err(make_error(
                ERR_MISMATCHED_KEY, std::string(info.type_name) + " secret key must be " +
                                        std::to_string(info.secret_key_size) + " bytes"));
        }
        return dp::Result<Bytes, dp::Error>::ok(key_bytes);
    }

    dp::Result<Key, dp::Error> normalizeKey(const KeyReference &reference) {
        if (const auto *did = std::get_if<std::string>(&reference)) {
            auto parsed = parseDid(*did);
            if (parsed.is_err())
                return dp::Result<Key, dp::Error>::err(parsed.error());
            return dp::Result<Key, dp::Error>::ok(
                Key{*did, parsed.value().authority, parsed.value().publicKeyMultibase, std::nullopt});
        }

        Key key = std::get<Key>(reference);
        auto parsed = parseDid(key.id);
        if (parsed.is_err())
            return dp::Result<Key, dp::Error>::err(parsed.error());

        if (key.publicKeyMultibase.empty()) {
            key.publicKeyMultibase = parsed.value().publicKeyMultibase;
        } else if (key.publicKeyMultibase != parsed.value().publicKeyMultibase) {
            return dp::Result<Key, dp::Error>::err(
                make_error(ERR_MISMATCHED_KEY, "Mismatched DID: " + key.id + " does not embed " +
                                                   key.publicKeyMultibase));
        }

        if (key.controller.empty())
            key.controller = parsed.value().authority;

        return dp::Result<Key, dp::Error>::ok(key);
    }

} // namespace didkey
