#include <didkey/crypto/bbs.hpp>
#include <doctest/doctest.h>

using namespace didkey;

namespace {
    std::vector<bbs::Fr> messages(size_t n) {
        std::vector<bbs::Fr> msgs;
        for (size_t i = 0; i < n; ++i)
            msgs.push_back(bbs::hashToScalar(toBytes("message-" + std::to_string(i))));
        return msgs;
    }
} // namespace

TEST_SUITE("BBS Signature Tests") {

    TEST_CASE("Sign and verify") {
        const auto &params = bbs::Params::standard();
        auto keys = bbs::keygen(params);
        auto msgs = messages(4);

        auto signature = bbs::sign(params, keys.sk, msgs);
        CHECK(bbs::verify(params, keys.pk, msgs, signature));
    }

    TEST_CASE("Changed message fails") {
        const auto &params = bbs::Params::standard();
        auto keys = bbs::keygen(params);
        auto msgs = messages(3);
        auto signature = bbs::sign(params, keys.sk, msgs);

        msgs[1] = bbs::hashToScalar(toBytes("other"));
        CHECK_FALSE(bbs::verify(params, keys.pk, msgs, signature));
    }

    TEST_CASE("Other key fails") {
        const auto &params = bbs::Params::standard();
        auto signer = bbs::keygen(params);
        auto other = bbs::keygen(params);
        auto msgs = messages(2);
        auto signature = bbs::sign(params, signer.sk, msgs);

        CHECK_FALSE(bbs::verify(params, other.pk, msgs, signature));
    }

    TEST_CASE("Public key derives from the secret") {
        const auto &params = bbs::Params::standard();
        auto keys = bbs::keygen(params);
        CHECK(bbs::publicKeyOf(params, keys.sk) == keys.pk);
    }

    TEST_CASE("Signature bytes round trip") {
        const auto &params = bbs::Params::standard();
        auto keys = bbs::keygen(params);
        auto msgs = messages(2);
        auto signature = bbs::sign(params, keys.sk, msgs);

        auto restored = bbs::Signature::fromBytes(signature.toBytes());
        REQUIRE(restored.is_ok());
        CHECK(bbs::verify(params, keys.pk, msgs, restored.value()));

        CHECK(bbs::Signature::fromBytes(Bytes{0x01, 0x02}).is_err());
    }
}

TEST_SUITE("BBS Proof Tests") {

    TEST_CASE("Proof discloses a subset") {
        const auto &params = bbs::Params::standard();
        auto keys = bbs::keygen(params);
        auto msgs = messages(5);
        auto signature = bbs::sign(params, keys.sk, msgs);

        auto proof = bbs::createProof(params, keys.pk, signature, msgs, {1, 3}, "nonce");
        CHECK(proof.hidden_indices == std::vector<size_t>{2, 4, 5});

        std::vector<std::pair<size_t, bbs::Fr>> disclosed = {{1, msgs[0]}, {3, msgs[2]}};
        CHECK(bbs::verifyProof(params, keys.pk, proof, disclosed, msgs.size()));
    }

    TEST_CASE("Wrong disclosed value fails") {
        const auto &params = bbs::Params::standard();
        auto keys = bbs::keygen(params);
        auto msgs = messages(4);
        auto signature = bbs::sign(params, keys.sk, msgs);

        auto proof = bbs::createProof(params, keys.pk, signature, msgs, {1, 2}, "");
        std::vector<std::pair<size_t, bbs::Fr>> disclosed = {{1, msgs[0]}, {2, msgs[3]}};
        CHECK_FALSE(bbs::verifyProof(params, keys.pk, proof, disclosed, msgs.size()));
    }

    TEST_CASE("Wrong message count fails") {
        const auto &params = bbs::Params::standard();
        auto keys = bbs::keygen(params);
        auto msgs = messages(4);
        auto signature = bbs::sign(params, keys.sk, msgs);

        auto proof = bbs::createProof(params, keys.pk, signature, msgs, {1}, "");
        std::vector<std::pair<size_t, bbs::Fr>> disclosed = {{1, msgs[0]}};
        CHECK(bbs::verifyProof(params, keys.pk, proof, disclosed, msgs.size()));
        CHECK_FALSE(bbs::verifyProof(params, keys.pk, proof, disclosed, msgs.size() + 1));
    }

    TEST_CASE("Huge message count is rejected without allocating") {
        const auto &params = bbs::Params::standard();
        auto keys = bbs::keygen(params);
        auto msgs = messages(3);
        auto signature = bbs::sign(params, keys.sk, msgs);

        auto proof = bbs::createProof(params, keys.pk, signature, msgs, {1}, "");
        std::vector<std::pair<size_t, bbs::Fr>> disclosed = {{1, msgs[0]}};
        CHECK_FALSE(bbs::verifyProof(params, keys.pk, proof, disclosed, 0xFFFFFFFFu));
        CHECK_FALSE(bbs::verifyProof(params, keys.pk, proof, disclosed, 0));
    }

    TEST_CASE("Proof bytes round trip keeps the nonce binding") {
        const auto &params = bbs::Params::standard();
        auto keys = bbs::keygen(params);
        auto msgs = messages(3);
        auto signature = bbs::sign(params, keys.sk, msgs);

        auto proof = bbs::createProof(params, keys.pk, signature, msgs, {1}, "asdf");
        auto restored = bbs::SDProof::fromBytes(proof.toBytes());
        REQUIRE(restored.is_ok());
        CHECK(restored.value().nonce == "asdf");

        std::vector<std::pair<size_t, bbs::Fr>> disclosed = {{1, msgs[0]}};
        CHECK(bbs::verifyProof(params, keys.pk, restored.value(), disclosed, msgs.size()));

        // Changing the bound nonce breaks the challenge
        auto rebound = restored.value();
        rebound.nonce = "other";
        CHECK_FALSE(bbs::verifyProof(params, keys.pk, rebound, disclosed, msgs.size()));
    }
}
