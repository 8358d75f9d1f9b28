#include <didkey/common/error.hpp>
#include <didkey/crypto/bbs.hpp>

#include <algorithm>
#include <mutex>

namespace didkey::bbs {

    void initPairing() {
        static std::once_flag once;
        std::call_once(once, [] { mcl::bn::initPairing(mcl::BLS12_381); });
    }

    // ===========================================
    // Params
    // ===========================================

    const Params &Params::standard() {
        static const Params params = [] {
            initPairing();
            Params p;
            p.domain_tag = "DIDKEY:BBS:BLS12-381:v1";
            mcl::bn::hashAndMapToG1(p.g1, p.domain_tag + "|g1");
            mcl::bn::hashAndMapToG2(p.g2, p.domain_tag + "|g2");
            return p;
        }();
        return params;
    }

    G1 Params::h(size_t i) const {
        G1 hi;
        mcl::bn::hashAndMapToG1(hi, domain_tag + "|H|" + std::to_string(i));
        return hi;
    }

    G1 Params::commit(const std::vector<Fr> &msgs) const {
        G1 B = g1;
        for (size_t i = 0; i < msgs.size(); ++i) {
            G1 term;
            G1::mul(term, h(i + 1), msgs[i]);
            G1::add(B, B, term);
        }
        return B;
    }

    Fr hashToScalar(const Bytes &data) {
        Fr s;
        s.setHashOf(data.data(), data.size());
        return s;
    }

    // ===========================================
    // Signatures
    // ===========================================

    KeyPair keygen(const Params &params) {
        KeyPair kp;
        do {
            kp.sk.setByCSPRNG();
        } while (kp.sk.isZero());
        kp.pk = publicKeyOf(params, kp.sk);
        return kp;
    }

    G2 publicKeyOf(const Params &params, const Fr &sk) {
        G2 pk;
        G2::mul(pk, params.g2, sk);
        return pk;
    }

    Signature sign(const Params &params, const Fr &sk, const std::vector<Fr> &msgs) {
        Fr e;
        Fr denom;
        do {
            e.setByCSPRNG();
            Fr::add(denom, sk, e);
        } while (denom.isZero());

        Fr inv;
        Fr::inv(inv, denom);

        Signature sig;
        G1::mul(sig.A, params.commit(msgs), inv);
        sig.e = e;
        return sig;
    }

    bool verify(const Params &params, const G2 &pk, const std::vector<Fr> &msgs, const Signature &sig) {
        if (sig.A.isZero())
            return false;

        G2 g2e;
        G2::mul(g2e, params.g2, sig.e);
        G2 rhs_g2;
        G2::add(rhs_g2, pk, g2e);

        Fp12 left;
        Fp12 right;
        mcl::bn::pairing(left, sig.A, rhs_g2);
        mcl::bn::pairing(right, params.commit(msgs), params.g2);
        return left == right;
    }

    // ===========================================
    // Selective disclosure proofs
    // ===========================================

    namespace {
        Fp12 divide(const Fp12 &a, const Fp12 &b) {
            Fp12 inv;
            Fp12::inv(inv, b);
            Fp12 out;
            Fp12::mul(out, a, inv);
            return out;
        }

        Fp12 power(const Fp12 &base, const Fr &exponent) {
            Fp12 out;
            Fp12::pow(out, base, exponent);
            return out;
        }

        Fp12 pair(const G1 &p, const G2 &q) {
            Fp12 e;
            mcl::bn::pairing(e, p, q);
            return e;
        }

        // B_pub = g1 * prod_{i in D} h_i^{m_i}
        G1 commitDisclosed(const Params &params, const std::vector<std::pair<size_t, Fr>> &disclosed) {
            G1 Bpub = params.g1;
            for (const auto &[index, value] : disclosed) {
                G1 term;
                G1::mul(term, params.h(index), value);
                G1::add(Bpub, Bpub, term);
            }
            return Bpub;
        }

        Fr challenge(const Params &params, const G2 &pk, const G1 &A, const G1 &Bpub,
                     const std::vector<size_t> &hidden, const Fp12 &E0, const Fp12 &E1,
                     const std::vector<Fp12> &Ej, const Fp12 &T, const std::string &nonce) {
            Bytes buf;
            appendLengthPrefixed(buf, toBytes(params.domain_tag));
            appendLengthPrefixed(buf, toBytes("BBS:SDP:GTv1"));

            appendLengthPrefixed(buf, serialize(pk));
            appendLengthPrefixed(buf, serialize(A));
            appendLengthPrefixed(buf, serialize(Bpub));

            appendU32(buf, static_cast<uint32_t>(hidden.size()));
            for (auto index : hidden)
                appendU32(buf, static_cast<uint32_t>(index));

            appendLengthPrefixed(buf, serialize(E0));
            appendLengthPrefixed(buf, serialize(E1));
            appendU32(buf, static_cast<uint32_t>(Ej.size()));
            for (const auto &e : Ej)
                appendLengthPrefixed(buf, serialize(e));

            appendLengthPrefixed(buf, serialize(T));
            appendLengthPrefixed(buf, toBytes(nonce));

            return hashToScalar(buf);
        }
    } // namespace

    SDProof createProof(const Params &params, const G2 &pk, const Signature &sig, const std::vector<Fr> &msgs,
                        const std::vector<size_t> &disclosed_indices, const std::string &nonce) {
        const size_t L = msgs.size();

        std::vector<bool> is_disclosed(L + 1, false);
        for (auto i : disclosed_indices) {
            if (i >= 1 && i <= L)
                is_disclosed[i] = true;
        }

        std::vector<size_t> hidden;
        std::vector<std::pair<size_t, Fr>> disclosed;
        for (size_t i = 1; i <= L; ++i) {
            if (is_disclosed[i])
                disclosed.emplace_back(i, msgs[i - 1]);
            else
                hidden.push_back(i);
        }

        G1 Bpub = commitDisclosed(params, disclosed);

        Fp12 E0 = divide(pair(Bpub, params.g2), pair(sig.A, pk));
        Fp12 E1 = pair(sig.A, params.g2);

        std::vector<Fp12> Ej;
        Ej.reserve(hidden.size());
        for (auto j : hidden)
            Ej.push_back(pair(params.h(j), params.g2));

        Fr r_e;
        r_e.setByCSPRNG();
        std::vector<Fr> r_m(hidden.size());
        for (auto &r : r_m)
            r.setByCSPRNG();

        Fp12 T = power(E1, r_e);
        for (size_t k = 0; k < hidden.size(); ++k)
            T = divide(T, power(Ej[k], r_m[k]));

        Fr c = challenge(params, pk, sig.A, Bpub, hidden, E0, E1, Ej, T, nonce);

        SDProof proof;
        proof.A = sig.A;
        proof.T = T;
        proof.z_e = r_e + sig.e * c;
        proof.hidden_indices = hidden;
        proof.z_m.resize(hidden.size());
        for (size_t k = 0; k < hidden.size(); ++k)
            proof.z_m[k] = r_m[k] + msgs[hidden[k] - 1] * c;
        proof.nonce = nonce;
        return proof;
    }

    bool verifyProof(const Params &params, const G2 &pk, const SDProof &proof,
                     const std::vector<std::pair<size_t, Fr>> &disclosed, size_t total_messages) {
        if (proof.A.isZero() || proof.z_m.size() != proof.hidden_indices.size())
            return false;

        // Disclosed and hidden indices must partition 1..L; the count check bounds L by the proof size
        if (disclosed.size() + proof.hidden_indices.size() != total_messages)
            return false;
        std::vector<int> seen(total_messages + 1, 0);
        for (const auto &entry : disclosed) {
            if (entry.first < 1 || entry.first > total_messages || seen[entry.first]++)
                return false;
        }
        for (auto j : proof.hidden_indices) {
            if (j < 1 || j > total_messages || seen[j]++)
                return false;
        }

        G1 Bpub = commitDisclosed(params, disclosed);

        Fp12 E0 = divide(pair(Bpub, params.g2), pair(proof.A, pk));
        Fp12 E1 = pair(proof.A, params.g2);

        std::vector<Fp12> Ej;
        Ej.reserve(proof.hidden_indices.size());
        for (auto j : proof.hidden_indices)
            Ej.push_back(pair(params.h(j), params.g2));

        Fr c = challenge(params, pk, proof.A, Bpub, proof.hidden_indices, E0, E1, Ej, proof.T, proof.nonce);

        // E1^{z_e} / prod Ej^{z_j} == T * E0^c
        Fp12 lhs = power(E1, proof.z_e);
        for (size_t k = 0; k < proof.z_m.size(); ++k)
            lhs = divide(lhs, power(Ej[k], proof.z_m[k]));

        Fp12 rhs;
        Fp12::mul(rhs, proof.T, power(E0, c));
        return lhs == rhs;
    }

    // ===========================================
    // Serialization
    // ===========================================

    Bytes Signature::toBytes() const {
        Bytes out;
        appendLengthPrefixed(out, serialize(A));
        appendLengthPrefixed(out, serialize(e));
        return out;
    }

    dp::Result<Signature, dp::Error> Signature::fromBytes(const Bytes &bytes) {
        initPairing();
        size_t offset = 0;
        Signature sig;

        auto a_bytes = readLengthPrefixed(bytes, offset);
        auto e_bytes = a_bytes.is_ok() ? readLengthPrefixed(bytes, offset) : a_bytes;
        if (a_bytes.is_err() || e_bytes.is_err() || !deserialize(sig.A, a_bytes.value()) ||
            !deserialize(sig.e, e_bytes.value()) || offset != bytes.size()) {
            return dp::Result<Signature, dp::Error>::err(invalid_document("Malformed BBS signature"));
        }
        return dp::Result<Signature, dp::Error>::ok(sig);
    }

    Bytes SDProof::toBytes() const {
        Bytes out;
        appendLengthPrefixed(out, serialize(A));
        appendLengthPrefixed(out, serialize(T));
        appendLengthPrefixed(out, serialize(z_e));

        appendU32(out, static_cast<uint32_t>(hidden_indices.size()));
        for (auto index : hidden_indices)
            appendU32(out, static_cast<uint32_t>(index));

        appendU32(out, static_cast<uint32_t>(z_m.size()));
        for (const auto &z : z_m)
            appendLengthPrefixed(out, serialize(z));

        appendLengthPrefixed(out, didkey::toBytes(nonce));
        return out;
    }

    dp::Result<SDProof, dp::Error> SDProof::fromBytes(const Bytes &bytes) {
        initPairing();
        auto malformed = [] { return dp::Result<SDProof, dp::Error>::err(invalid_document("Malformed BBS proof")); };

        size_t offset = 0;
        SDProof proof;

        auto a_bytes = readLengthPrefixed(bytes, offset);
        if (a_bytes.is_err() || !deserialize(proof.A, a_bytes.value()))
            return malformed();
        auto t_bytes = readLengthPrefixed(bytes, offset);
        if (t_bytes.is_err() || !deserialize(proof.T, t_bytes.value()))
            return malformed();
        auto ze_bytes = readLengthPrefixed(bytes, offset);
        if (ze_bytes.is_err() || !deserialize(proof.z_e, ze_bytes.value()))
            return malformed();

        auto hidden_count = readU32(bytes, offset);
        if (hidden_count.is_err() || hidden_count.value() > bytes.size())
            return malformed();
        for (uint32_t i = 0; i < hidden_count.value(); ++i) {
            auto index = readU32(bytes, offset);
            if (index.is_err())
                return malformed();
            proof.hidden_indices.push_back(index.value());
        }

        auto z_count = readU32(bytes, offset);
        if (z_count.is_err() || z_count.value() > bytes.size())
            return malformed();
        for (uint32_t i = 0; i < z_count.value(); ++i) {
            auto z_bytes = readLengthPrefixed(bytes, offset);
            Fr z;
            if (z_bytes.is_err() || !deserialize(z, z_bytes.value()))
                return malformed();
            proof.z_m.push_back(z);
        }

        auto nonce = readLengthPrefixed(bytes, offset);
        if (nonce.is_err() || offset != bytes.size())
            return malformed();
        proof.nonce.assign(nonce.value().begin(), nonce.value().end());

        return dp::Result<SDProof, dp::Error>::ok(proof);
    }

} // namespace didkey::bbs
