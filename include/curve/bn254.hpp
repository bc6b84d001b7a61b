#pragma once

#include <mcl/bn256.hpp>
#include <optional>
#include <string>

namespace groth16 {

/**
 * BN254 (alt_bn128) arithmetic, provided by mcl configured with BN_SNARK1.
 *
 * Fq2 = Fq[u]/(u^2 + 1) stores the real part in .a and the imaginary part in
 * .b. G1 is y^2 = x^3 + 3 over Fq, G2 the D-type twist y^2 = x^3 + 3/(9+u)
 * over Fq2. Points are kept in Jacobian coordinates by mcl; equality is
 * projective.
 *
 * mcl keeps its curve parameters in process-wide state. bn254::init() must
 * run before any of these types is constructed from a value; every function
 * declared below (and every codec and verifier entry point) calls it.
 */
using Fq = mcl::bn::Fp;
using Fr = mcl::bn::Fr;
using Fq2 = mcl::bn::Fp2;
using Fq12 = mcl::bn::Fp12;
using G1 = mcl::bn::G1;
using G2 = mcl::bn::G2;

template <typename Field>
struct AffinePoint {
    Field x;
    Field y;
};

using G1Affine = AffinePoint<Fq>;
using G2Affine = AffinePoint<Fq2>;

namespace bn254 {

// Idempotent and thread-safe
void init();

const G1& g1_generator();
const G2& g2_generator();
G1 g1_identity();
G2 g2_identity();

// b in y^2 = x^3 + b
const Fq& g1_coeff_b();
const Fq2& g2_coeff_b();

Fq2 make_fq2(const Fq& real, const Fq& imaginary);

std::optional<Fq> sqrt(const Fq& value);
std::optional<Fq2> sqrt(const Fq2& value);

// No validation; pair with is_on_curve / is_in_subgroup
G1 g1_from_affine(const Fq& x, const Fq& y);
G2 g2_from_affine(const Fq2& x, const Fq2& y);

// nullopt for the identity
std::optional<G1Affine> to_affine(const G1& point);
std::optional<G2Affine> to_affine(const G2& point);

// The identity counts as on the curve and in the subgroup
bool is_on_curve(const G1& point);
bool is_on_curve(const G2& point);
bool is_in_subgroup(const G2& point);

Fq neg(const Fq& value);
Fq2 neg(const Fq2& value);
G1 neg(const G1& point);
G2 neg(const G2& point);
G1 mul(const G1& point, const Fr& scalar);
G2 mul(const G2& point, const Fr& scalar);

// "0x" followed by 64 lowercase hex digits
std::string to_string(const Fq& value);
std::string to_string(const Fr& value);
// "(x, y)" in affine form, or "identity"
std::string to_string(const G1& point);

} // namespace bn254
} // namespace groth16
