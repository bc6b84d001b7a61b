#include "pairing/pairing.hpp"
#include "common/debug_control.hpp"
#include <chrono>

namespace groth16 {

Fq12 Pairing::pairing(const G1& p, const G2& q) {
    return multi_pairing({{p, q}});
}

Fq12 Pairing::multi_pairing(const PairList& pairs) {
    bn254::init();
    auto start = std::chrono::high_resolution_clock::now();

    std::vector<G1> g1_terms;
    std::vector<G2> g2_terms;
    g1_terms.reserve(pairs.size());
    g2_terms.reserve(pairs.size());
    for (const auto& [p, q] : pairs) {
        if (p.isZero() || q.isZero()) continue;
        G1 p_affine = p;
        G2 q_affine = q;
        p_affine.normalize();
        q_affine.normalize();
        g1_terms.push_back(p_affine);
        g2_terms.push_back(q_affine);
    }

    Fq12 result;
    if (g1_terms.empty()) {
        result.clear();
        result.a.a.a = 1;
    } else {
        Fq12 miller;
        mcl::bn::millerLoopVec(miller, g1_terms.data(), g2_terms.data(), g1_terms.size());
        mcl::bn::finalExp(result, miller);
    }

    GROTH16_IF_PROFILE {
        auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::high_resolution_clock::now() - start).count();
        std::cerr << "[pairing] " << pairs.size() << "-term multi-pairing: " << elapsed << " ms" << std::endl;
    }
    return result;
}

} // namespace groth16
