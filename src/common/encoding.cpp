#include <didkey/common/encoding.hpp>
#include <didkey/common/error.hpp>
#include <algorithm>
#include <cstring>

namespace didkey {

    namespace {
        const char *BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
        const std::string BASE64URL_CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    } // namespace

    std::string base58Encode(const Bytes &data) {
        size_t zeros = 0;
        while (zeros < data.size() && data[zeros] == 0)
            ++zeros;

        // Big-number division by 58, digits stored little-endian
        std::vector<uint8_t> digits;
        digits.reserve(data.size() * 138 / 100 + 1);
        for (size_t i = zeros; i < data.size(); ++i) {
            uint32_t carry = data[i];
            for (auto &digit : digits) {
                carry += static_cast<uint32_t>(digit) << 8;
                digit = static_cast<uint8_t>(carry % 58);
                carry /= 58;
            }
            while (carry > 0) {
                digits.push_back(static_cast<uint8_t>(carry % 58));
                carry /= 58;
            }
        }

        std::string encoded(zeros, '1');
        for (auto it = digits.rbegin(); it != digits.rend(); ++it)
            encoded += BASE58_ALPHABET[*it];
        return encoded;
    }

    dp::Result<Bytes, dp::Error> base58Decode(const std::string &encoded) {
        size_t ones = 0;
        while (ones < encoded.size() && encoded[ones] == '1')
            ++ones;

        std::vector<uint8_t> bytes;
        bytes.reserve(encoded.size() * 733 / 1000 + 1);
        for (size_t i = ones; i < encoded.size(); ++i) {
            const char *pos = std::strchr(BASE58_ALPHABET, encoded[i]);
            if (pos == nullptr || *pos == '\0') {
                return dp::Result<Bytes, dp::Error>::err(
                    dp::Error::invalid_argument("Invalid base58 character"));
            }
            uint32_t carry = static_cast<uint32_t>(pos - BASE58_ALPHABET);
            for (auto &byte : bytes) {
                carry += static_cast<uint32_t>(byte) * 58;
                byte = static_cast<uint8_t>(carry & 0xFF);
                carry >>= 8;
            }
            while (carry > 0) {
                bytes.push_back(static_cast<uint8_t>(carry & 0xFF));
                carry >>= 8;
            }
        }

        Bytes decoded(ones, 0);
        decoded.insert(decoded.end(), bytes.rbegin(), bytes.rend());
        return dp::Result<Bytes, dp::Error>::ok(decoded);
    }

    std::string base64UrlEncode(const Bytes &data) {
        std::string encoded;
        encoded.reserve((data.size() + 2) / 3 * 4);
        for (size_t i = 0; i < data.size(); i += 3) {
            uint32_t temp = 0;
            size_t chunk = std::min<size_t>(3, data.size() - i);
            for (size_t j = 0; j < 3; ++j) {
                temp <<= 8;
                if (j < chunk)
                    temp |= data[i + j];
            }
            for (size_t k = 0; k < chunk + 1; ++k)
                encoded += BASE64URL_CHARS[(temp >> (6 * (3 - k))) & 0x3F];
        }
        return encoded;
    }

    dp::Result<Bytes, dp::Error> base64UrlDecode(const std::string &encoded) {
        if (encoded.size() % 4 == 1) {
            return dp::Result<Bytes, dp::Error>::err(dp::Error::invalid_argument("Invalid base64url length"));
        }

        Bytes decoded;
        decoded.reserve(encoded.size() * 3 / 4);
        for (size_t i = 0; i < encoded.size(); i += 4) {
            uint32_t temp = 0;
            size_t chunk = std::min<size_t>(4, encoded.size() - i);
            for (size_t j = 0; j < chunk; ++j) {
                size_t pos = BASE64URL_CHARS.find(encoded[i + j]);
                if (pos == std::string::npos) {
                    return dp::Result<Bytes, dp::Error>::err(
                        dp::Error::invalid_argument("Invalid base64url character"));
                }
                temp |= static_cast<uint32_t>(pos) << (6 * (3 - j));
            }
            decoded.push_back((temp >> 16) & 0xFF);
            if (chunk >= 3)
                decoded.push_back((temp >> 8) & 0xFF);
            if (chunk >= 4)
                decoded.push_back(temp & 0xFF);
        }
        return dp::Result<Bytes, dp::Error>::ok(decoded);
    }

    std::string multibaseEncode(const Bytes &data, char base) {
        if (base == MULTIBASE_BASE64URL)
            return std::string(1, MULTIBASE_BASE64URL) + base64UrlEncode(data);
        return std::string(1, MULTIBASE_BASE58BTC) + base58Encode(data);
    }

    dp::Result<Bytes, dp::Error> multibaseDecode(const std::string &encoded) {
        if (encoded.empty()) {
            return dp::Result<Bytes, dp::Error>::err(dp::Error::invalid_argument("Empty multibase string"));
        }
        switch (encoded[0]) {
        case MULTIBASE_BASE58BTC:
            return base58Decode(encoded.substr(1));
        case MULTIBASE_BASE64URL:
            return base64UrlDecode(encoded.substr(1));
        default:
            return dp::Result<Bytes, dp::Error>::err(dp::Error::invalid_argument(
                dp::String(("Unsupported multibase prefix: " + encoded.substr(0, 1)).c_str())));
        }
    }

    void appendVarint(Bytes &out, uint64_t value) {
        while (value >= 0x80) {
            out.push_back(static_cast<uint8_t>(value & 0x7F) | 0x80);
            value >>= 7;
        }
        out.push_back(static_cast<uint8_t>(value));
    }

    dp::Result<uint64_t, dp::Error> readVarint(const Bytes &data, size_t &offset) {
        uint64_t value = 0;
        for (int shift = 0; shift < 63; shift += 7) {
            if (offset >= data.size()) {
                return dp::Result<uint64_t, dp::Error>::err(dp::Error::invalid_argument("Truncated varint"));
            }
            uint8_t byte = data[offset++];
            value |= static_cast<uint64_t>(byte & 0x7F) << shift;
            if ((byte & 0x80) == 0)
                return dp::Result<uint64_t, dp::Error>::ok(value);
        }
        return dp::Result<uint64_t, dp::Error>::err(dp::Error::invalid_argument("Varint too long"));
    }

    void appendU32(Bytes &out, uint32_t value) {
        out.push_back(static_cast<uint8_t>(value >> 24));
        out.push_back(static_cast<uint8_t>(value >> 16));
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value));
    }

    void appendLengthPrefixed(Bytes &out, const Bytes &value) {
        appendU32(out, static_cast<uint32_t>(value.size()));
        append(out, value);
    }

    dp::Result<uint32_t, dp::Error> readU32(const Bytes &data, size_t &offset) {
        if (data.size() < 4 || offset > data.size() - 4) {
            return dp::Result<uint32_t, dp::Error>::err(dp::Error::invalid_argument("Truncated u32"));
        }
        uint32_t value = (static_cast<uint32_t>(data[offset]) << 24) |
                         (static_cast<uint32_t>(data[offset + 1]) << 16) |
                         (static_cast<uint32_t>(data[offset + 2]) << 8) | static_cast<uint32_t>(data[offset + 3]);
        offset += 4;
        return dp::Result<uint32_t, dp::Error>::ok(value);
    }

    dp::Result<Bytes, dp::Error> readLengthPrefixed(const Bytes &data, size_t &offset) {
        auto length = readU32(data, offset);
        if (length.is_err())
            return dp::Result<Bytes, dp::Error>::err(length.error());
        if (length.value() > data.size() - offset) {
            return dp::Result<Bytes, dp::Error>::err(dp::Error::invalid_argument("Truncated length-prefixed field"));
        }
        Bytes value(data.begin() + static_cast<std::ptrdiff_t>(offset),
                    data.begin() + static_cast<std::ptrdiff_t>(offset + length.value()));
        offset += length.value();
        return dp::Result<Bytes, dp::Error>::ok(value);
    }

} // namespace didkey
