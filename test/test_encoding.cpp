#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <didkey/common/digest.hpp>
#include <didkey/common/encoding.hpp>
#include <didkey/common/error.hpp>
#include <didkey/common/json.hpp>

#include <cctype>
#include <cstdio>

using namespace didkey;

namespace {
    std::string toHex(const Bytes &bytes) {
        std::string hex;
        char buf[3];
        for (auto b : bytes) {
            std::snprintf(buf, sizeof(buf), "%02x", b);
            hex += buf;
        }
        return hex;
    }
} // namespace

TEST_SUITE("Encoding Tests") {

    TEST_CASE("Base58 encodes known vector") { CHECK(base58Encode(toBytes("hello world")) == "StV1DL6CwTryKyV"); }

    TEST_CASE("Base58 keeps leading zero bytes") {
        Bytes data = {0x00, 0x00, 0x01};
        CHECK(base58Encode(data) == "112");

        auto decoded = base58Decode("112");
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == data);
    }

    TEST_CASE("Base58 decode round trip") {
        auto decoded = base58Decode("StV1DL6CwTryKyV");
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == toBytes("hello world"));
    }

    TEST_CASE("Base58 rejects characters outside the alphabet") {
        CHECK(base58Decode("0OIl").is_err());
        CHECK(base58Decode("abc+").is_err());
    }

    TEST_CASE("Base64url without padding") {
        CHECK(base64UrlEncode(toBytes("hello")) == "aGVsbG8");
        CHECK(base64UrlEncode(Bytes{0xfb, 0xff}) == "-_8");

        auto decoded = base64UrlDecode("aGVsbG8");
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value() == toBytes("hello"));

        CHECK(base64UrlDecode("a").is_err());
        CHECK(base64UrlDecode("aG=s").is_err());
    }

    TEST_CASE("Multibase prefixes") {
        Bytes data = toBytes("hello world");
        CHECK(multibaseEncode(data) == "zStV1DL6CwTryKyV");
        CHECK(multibaseEncode(data, MULTIBASE_BASE64URL).front() == 'u');

        auto from_base58 = multibaseDecode("zStV1DL6CwTryKyV");
        REQUIRE(from_base58.is_ok());
        CHECK(from_base58.value() == data);

        auto from_base64 = multibaseDecode(multibaseEncode(data, MULTIBASE_BASE64URL));
        REQUIRE(from_base64.is_ok());
        CHECK(from_base64.value() == data);

        CHECK(multibaseDecode("").is_err());
        CHECK(multibaseDecode("fdeadbeef").is_err());
    }

    TEST_CASE("Varint multicodec headers") {
        Bytes ed25519;
        appendVarint(ed25519, 0xed);
        CHECK(ed25519 == Bytes{0xed, 0x01});

        Bytes p256;
        appendVarint(p256, 0x1200);
        CHECK(p256 == Bytes{0x80, 0x24});

        size_t offset = 0;
        auto value = readVarint(p256, offset);
        REQUIRE(value.is_ok());
        CHECK(value.value() == 0x1200);
        CHECK(offset == 2);

        Bytes truncated = {0x80};
        offset = 0;
        CHECK(readVarint(truncated, offset).is_err());
    }

    TEST_CASE("Length-prefixed framing") {
        Bytes out;
        appendU32(out, 7);
        appendLengthPrefixed(out, toBytes("abc"));
        CHECK(out.size() == 4 + 4 + 3);

        size_t offset = 0;
        auto number = readU32(out, offset);
        REQUIRE(number.is_ok());
        CHECK(number.value() == 7);

        auto field = readLengthPrefixed(out, offset);
        REQUIRE(field.is_ok());
        CHECK(field.value() == toBytes("abc"));
        CHECK(offset == out.size());

        // Length claims more bytes than remain
        Bytes short_field;
        appendU32(short_field, 10);
        short_field.push_back(0x01);
        offset = 0;
        CHECK(readLengthPrefixed(short_field, offset).is_err());
    }
}

TEST_SUITE("Digest Tests") {

    TEST_CASE("SHA-256 known vector") {
        auto hash = digest(DigestAlgorithm::SHA256, std::string("abc"));
        REQUIRE(hash.is_ok());
        CHECK(toHex(hash.value()) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    TEST_CASE("Digest sizes") {
        CHECK(digest(DigestAlgorithm::SHA384, std::string("abc")).value().size() == 48);
        CHECK(digest(DigestAlgorithm::SHA512, std::string("abc")).value().size() == 64);
        CHECK(digest(DigestAlgorithm::SM3, std::string("abc")).value().size() == 32);
    }

    TEST_CASE("Random alphanumeric challenge") {
        auto first = randomAlphanumeric(32);
        auto second = randomAlphanumeric(32);
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        CHECK(first.value().size() == 32);
        CHECK(first.value() != second.value());
        for (char c : first.value())
            CHECK(std::isalnum(static_cast<unsigned char>(c)));
    }
}

TEST_SUITE("JSON Helper Tests") {

    TEST_CASE("Canonical form sorts keys") {
        json a = json::parse(R"({"b": 1, "a": [1, 2], "c": {"y": true, "x": null}})");
        json b = json::parse(R"({"c": {"x": null, "y": true}, "a": [1, 2], "b": 1})");
        CHECK(canonicalize(a) == R"({"a":[1,2],"b":1,"c":{"x":null,"y":true}})");
        CHECK(canonicalize(a) == canonicalize(b));
    }

    TEST_CASE("Pointer escaping") {
        CHECK(escapePointerToken("a/b~c") == "a~1b~0c");
        CHECK(unescapePointerToken("a~1b~0c") == "a/b~c");
        CHECK(joinPointer({"credentialSubject", "a/b"}) == "/credentialSubject/a~1b");
    }

    TEST_CASE("Split pointer") {
        auto tokens = splitPointer("/credentialSubject/a~1b/c~0d");
        REQUIRE(tokens.is_ok());
        REQUIRE(tokens.value().size() == 3);
        CHECK(tokens.value()[0] == "credentialSubject");
        CHECK(tokens.value()[1] == "a/b");
        CHECK(tokens.value()[2] == "c~d");

        auto whole = splitPointer("");
        REQUIRE(whole.is_ok());
        CHECK(whole.value().empty());
    }

    TEST_CASE("Reject malformed pointers") {
        auto no_slash = splitPointer("credentialSubject");
        REQUIRE(no_slash.is_err());
        CHECK(isError(no_slash.error(), ERR_INVALID_POINTER));

        auto bad_escape = splitPointer("/a~2");
        REQUIRE(bad_escape.is_err());
        CHECK(isError(bad_escape.error(), ERR_INVALID_POINTER));
    }

    TEST_CASE("Context helpers") {
        json doc = json::parse(R"({"@context": ["https://www.w3.org/2018/credentials/v1", {"x": "y"}]})");
        auto urls = contextUrls(doc);
        REQUIRE(urls.size() == 1);
        CHECK(urls[0] == "https://www.w3.org/2018/credentials/v1");
        CHECK(hasContext(doc, "https://www.w3.org/2018/credentials/v1"));
        CHECK_FALSE(hasContext(doc, "https://www.w3.org/ns/credentials/v2"));
    }

    TEST_CASE("Identifier of string or object") {
        CHECK(identifierOf(json("did:key:z6Mk")) == "did:key:z6Mk");
        CHECK(identifierOf(json::parse(R"({"id": "did:key:z6Mk", "name": "x"})")) == "did:key:z6Mk");
        CHECK(identifierOf(json(42)).empty());
    }

    TEST_CASE("Timestamp format") {
        auto ts = currentTimestamp();
        CHECK(ts.size() == 20);
        CHECK(ts[4] == '-');
        CHECK(ts[10] == 'T');
        CHECK(ts.back() == 'Z');
    }
}
