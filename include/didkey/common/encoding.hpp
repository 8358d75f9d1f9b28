#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

namespace didkey {

    using Bytes = std::vector<uint8_t>;

    /// Multibase prefix characters used by did:key material and proof values
    constexpr char MULTIBASE_BASE58BTC = 'z';
    constexpr char MULTIBASE_BASE64URL = 'u';

    // ===========================================
    // Base58 (bitcoin alphabet)
    // ===========================================

    std::string base58Encode(const Bytes &data);
    dp::Result<Bytes, dp::Error> base58Decode(const std::string &encoded);

    // ===========================================
    // Base64url, no padding
    // ===========================================

    std::string base64UrlEncode(const Bytes &data);
    dp::Result<Bytes, dp::Error> base64UrlDecode(const std::string &encoded);

    // ===========================================
    // Multibase
    // ===========================================

    /// Encode with the given multibase prefix ('z' or 'u')
    std::string multibaseEncode(const Bytes &data, char base = MULTIBASE_BASE58BTC);

    /// Decode a 'z' or 'u' multibase string
    dp::Result<Bytes, dp::Error> multibaseDecode(const std::string &encoded);

    // ===========================================
    // Unsigned varint (multicodec headers)
    // ===========================================

    void appendVarint(Bytes &out, uint64_t value);
    dp::Result<uint64_t, dp::Error> readVarint(const Bytes &data, size_t &offset);

    // ===========================================
    // Length-prefixed framing for proof values
    // ===========================================

    void appendU32(Bytes &out, uint32_t value);
    void appendLengthPrefixed(Bytes &out, const Bytes &value);
    dp::Result<uint32_t, dp::Error> readU32(const Bytes &data, size_t &offset);
    dp::Result<Bytes, dp::Error> readLengthPrefixed(const Bytes &data, size_t &offset);

    inline Bytes toBytes(const std::string &s) { return Bytes(s.begin(), s.end()); }

    inline void append(Bytes &out, const Bytes &value) { out.insert(out.end(), value.begin(), value.end()); }

} // namespace didkey
