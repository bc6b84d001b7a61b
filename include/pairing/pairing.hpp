#pragma once

#include "curve/bn254.hpp"
#include <utility>
#include <vector>

namespace groth16 {

/**
 * Optimal ate pairing on BN254, computed by mcl.
 *
 * multi_pairing runs one Miller loop over all pairs and a single final
 * exponentiation. Pairs with an identity component contribute 1 and are
 * dropped before the loop.
 */
class Pairing {
public:
    using PairList = std::vector<std::pair<G1, G2>>;

    static Fq12 pairing(const G1& p, const G2& q);

    static Fq12 multi_pairing(const PairList& pairs);

    static bool product_is_one(const PairList& pairs) { return multi_pairing(pairs).isOne(); }
};

} // namespace groth16
