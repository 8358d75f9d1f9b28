/// did:key Demo
/// Demonstrates key generation, DID encoding/parsing and raw signatures for every key family

#include <didkey.hpp>
#include <iostream>
#include <vector>

using namespace didkey;

int main() {
    std::cout << "=== didkey did:key Demo ===" << std::endl;
    std::cout << std::endl;

    DidKey dk;

    // === Part 1: Generate keys ===
    std::cout << "--- Part 1: Generating keys ---" << std::endl;

    std::vector<Key> keys;
    for (const char *type : {"P-256", "P-384", "P-521", "SM2", "Ed25519", "Bls12381"}) {
        auto key_result = dk.generate(type);
        if (!key_result.is_ok()) {
            std::cerr << "Failed to generate " << type << " key: " << errorMessage(key_result.error()) << std::endl;
            return 1;
        }
        keys.push_back(key_result.value());
        std::cout << "  " << type << ": " << key_result.value().controller << std::endl;
    }
    std::cout << std::endl;

    // === Part 2: Parse a DID ===
    std::cout << "--- Part 2: Parsing a DID URL ---" << std::endl;

    const Key &ed = keys[4];
    auto parsed = parseDid(ed.id);
    if (!parsed.is_ok()) {
        std::cerr << "Failed to parse " << ed.id << std::endl;
        return 1;
    }
    std::cout << "Verification method: " << ed.id << std::endl;
    std::cout << "  Authority: " << parsed.value().authority << std::endl;
    std::cout << "  Fragment: " << parsed.value().fragment.value_or("") << std::endl;

    auto decoded = decodePublicKey(parsed.value().publicKeyMultibase);
    if (decoded.is_ok()) {
        std::cout << "  Family: " << keyFamilyToString(decoded.value().family) << std::endl;
        std::cout << "  Public key bytes: " << decoded.value().bytes.size() << std::endl;
    }

    auto bad = parseDid("did:key:zQ3shokFTS3brHcDQrn82RUDfCZESWL1ZdCEJwekUDPQiYBme");
    std::cout << "secp256k1 did:key rejected: " << (bad.is_err() ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    // === Part 3: Raw signatures ===
    std::cout << "--- Part 3: Raw signatures ---" << std::endl;

    Bytes message = toBytes("Hello, did:key");
    for (const auto &key : keys) {
        auto signature = dk.sign(key, message);
        if (!signature.is_ok()) {
            std::cerr << "Signing failed: " << errorMessage(signature.error()) << std::endl;
            return 1;
        }
        // Verify with only the DID, as a relying party would
        auto verified = dk.verify(KeyReference(key.id), message, signature.value());
        bool ok = verified.is_ok() && verified.value();
        std::cout << "  " << key.publicKeyMultibase.substr(0, 3) << "... signature (" << signature.value().size()
                  << " bytes): " << (ok ? "valid" : "INVALID") << std::endl;
        if (!ok)
            return 1;
    }
    std::cout << std::endl;

    // === Part 4: Key record ===
    std::cout << "--- Part 4: Key record ---" << std::endl;
    std::cout << ed.toJson(true, false).dump(2) << std::endl;

    std::cout << std::endl;
    std::cout << "=== Demo Complete ===" << std::endl;
    return 0;
}
