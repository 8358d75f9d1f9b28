#pragma once

#include <datapod/datapod.hpp>
#include <didkey/common/encoding.hpp>
#include <mcl/bn.hpp>
#include <string>
#include <utility>
#include <vector>

namespace didkey::bbs {

    using mcl::bn::Fp12;
    using mcl::bn::Fr;
    using mcl::bn::G1;
    using mcl::bn::G2;

    /// Initialize mcl for BLS12-381 (idempotent, thread-safe)
    void initPairing();

    /// BBS parameters over BLS12-381.
    /// g1 in G1, g2 in G2; per-message generators h_i come from hash-to-curve with domain_tag.
    struct Params {
        G1 g1;
        G2 g2;
        std::string domain_tag;

        /// Process-wide parameters (initializes the pairing on first use)
        static const Params &standard();

        /// Per-message generator h_i (1-based index)
        G1 h(size_t i) const;

        /// B = g1 * prod h_i^{m_i}
        G1 commit(const std::vector<Fr> &msgs) const;
    };

    /// Secret key x in Fr; public key X = g2^x in G2
    struct KeyPair {
        Fr sk;
        G2 pk;
    };

    /// Signature (A, e) with A = B^{1/(x + e)}
    struct Signature {
        G1 A;
        Fr e;

        Bytes toBytes() const;
        static dp::Result<Signature, dp::Error> fromBytes(const Bytes &bytes);
    };

    /// Zero-knowledge proof of a signature over messages of which only some are revealed.
    /// The relation proven is E1^e * prod_j Ej^{-m_j} = E0 over the hidden indices j, with
    /// E0 = e(B_pub, g2) / e(A, pk), E1 = e(A, g2), Ej = e(h_j, g2).
    struct SDProof {
        G1 A;
        Fp12 T;                            // Commitment E1^{r_e} / prod Ej^{r_j}
        Fr z_e;                            // r_e + c * e
        std::vector<size_t> hidden_indices; // 1-based, ascending
        std::vector<Fr> z_m;               // r_j + c * m_j
        std::string nonce;                 // Bound into the Fiat-Shamir challenge

        Bytes toBytes() const;
        static dp::Result<SDProof, dp::Error> fromBytes(const Bytes &bytes);
    };

    KeyPair keygen(const Params &params);

    /// Public key for a secret scalar
    G2 publicKeyOf(const Params &params, const Fr &sk);

    Signature sign(const Params &params, const Fr &sk, const std::vector<Fr> &msgs);

    /// Check e(A, pk + g2^e) == e(B, g2)
    bool verify(const Params &params, const G2 &pk, const std::vector<Fr> &msgs, const Signature &sig);

    /// Prove knowledge of a signature over msgs revealing only disclosed_indices (1-based)
    SDProof createProof(const Params &params, const G2 &pk, const Signature &sig, const std::vector<Fr> &msgs,
                        const std::vector<size_t> &disclosed_indices, const std::string &nonce);

    /// Verify a proof against the disclosed (index, value) pairs out of total_messages
    bool verifyProof(const Params &params, const G2 &pk, const SDProof &proof,
                     const std::vector<std::pair<size_t, Fr>> &disclosed, size_t total_messages);

    /// Map arbitrary bytes to a scalar
    Fr hashToScalar(const Bytes &data);

    // ===========================================
    // mcl serialization helpers
    // ===========================================

    template <class T> Bytes serialize(const T &value) {
        Bytes buf(1024);
        size_t n = value.serialize(buf.data(), buf.size());
        buf.resize(n);
        return buf;
    }

    template <class T> bool deserialize(T &value, const Bytes &bytes) {
        if (bytes.empty())
            return false;
        size_t n = value.deserialize(bytes.data(), bytes.size());
        return n != 0 && n == bytes.size();
    }

} // namespace didkey::bbs
