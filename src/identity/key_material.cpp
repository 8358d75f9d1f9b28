#include <didkey/common/error.hpp>
#include <didkey/identity/key_material.hpp>

namespace didkey {

    Key makeKey(KeyFamily family, const Bytes &public_key, const Bytes &secret_key) {
        Key key;
        key.publicKeyMultibase = encodePublicKey(family, public_key);
        key.id = encodeDid(key.publicKeyMultibase);
        key.controller = key.id;
        if (!secret_key.empty())
            key.secretKeyMultibase = encodeSecretKey(family, secret_key);
        return key;
    }

} // namespace didkey
