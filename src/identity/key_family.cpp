#include <didkey/common/error.hpp>
#include <didkey/identity/key_family.hpp>

namespace didkey {

    const std::vector<KeyFamilyInfo> &keyFamilies() {
        static const std::vector<KeyFamilyInfo> families = {
            {KeyFamily::EcdsaP256, "P-256", "zDn", 0x1200, 0x1306, 33, 32, DigestAlgorithm::SHA256},
            {KeyFamily::EcdsaP384, "P-384", "z82", 0x1201, 0x1307, 49, 48, DigestAlgorithm::SHA384},
            {KeyFamily::EcdsaP521, "P-521", "z2J", 0x1202, 0x1308, 67, 66, DigestAlgorithm::SHA512},
            {KeyFamily::Sm2, "SM2", "zEP", 0x1206, 0x1310, 33, 32, DigestAlgorithm::SM3},
            {KeyFamily::Ed25519, "Ed25519", "z6M", 0xed, 0x1300, 32, 32, DigestAlgorithm::SHA256},
            {KeyFamily::Bls12381G2, "Bls12381", "zUC", 0xeb, 0x130a, 96, 32, DigestAlgorithm::SHA256},
        };
        return families;
    }

    const KeyFamilyInfo &keyFamilyInfo(KeyFamily family) {
        for (const auto &info : keyFamilies()) {
            if (info.family == family)
                return info;
        }
        return keyFamilies().front();
    }

    std::string keyFamilyToString(KeyFamily family) {
        switch (family) {
        case KeyFamily::EcdsaP256:
            return "P-256";
        case KeyFamily::EcdsaP384:
            return "P-384";
        case KeyFamily::EcdsaP521:
            return "P-521";
        case KeyFamily::Sm2:
            return "SM2";
        case KeyFamily::Ed25519:
            return "Ed25519";
        case KeyFamily::Bls12381G2:
            return "Bls12381";
        default:
            return "Unknown";
        }
    }

    std::string supportedKeyTypes() {
        std::string names;
        for (const auto &info : keyFamilies()) {
            if (!names.empty())
                names += ", ";
            names += info.type_name;
        }
        return names;
    }

    dp::Result<KeyFamily, dp::Error> keyFamilyFromTypeName(const std::string &type_name) {
        for (const auto &info : keyFamilies()) {
            if (type_name == info.type_name)
                return dp::Result<KeyFamily, dp::Error>::ok(info.family);
        }
        return dp::Result<KeyFamily, dp::Error>::err(make_error(
            ERR_UNSUPPORTED_KEY_TYPE,
            "Unsupported key type: " + type_name + ", supported types are: " + supportedKeyTypes()));
    }

    dp::Result<KeyFamily, dp::Error> keyFamilyFromMultibase(const std::string &public_key_multibase) {
        std::string prefix = public_key_multibase.substr(0, MULTIBASE_PREFIX_LENGTH);
        for (const auto &info : keyFamilies()) {
            if (prefix == info.prefix)
                return dp::Result<KeyFamily, dp::Error>::ok(info.family);
        }
        return dp::Result<KeyFamily, dp::Error>::err(
            make_error(ERR_UNSUPPORTED_KEY_TYPE, "Unsupported multibase multikey header: \"" + prefix + "\""));
    }

} // namespace didkey
