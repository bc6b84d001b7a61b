#include "curve/bn254.hpp"
#include "common/debug_control.hpp"
#include <mutex>
#include <stdexcept>

namespace groth16 {
namespace bn254 {

namespace {

std::once_flag init_flag;

Fq fq_from_hex(const char* hex) {
    Fq value;
    bool ok = false;
    value.setStr(&ok, hex, 16);
    if (!ok) {
        throw std::runtime_error(std::string("bad BN254 constant ") + hex);
    }
    return value;
}

template <typename Field>
std::string padded_hex(const Field& value) {
    std::string digits = value.getStr(16);
    if (digits.compare(0, 2, "0x") == 0) {
        digits.erase(0, 2);
    }
    return "0x" + std::string(64 - digits.size(), '0') + digits;
}

template <typename Point, typename Field>
bool satisfies_curve_equation(const Point& point, const Field& b) {
    if (point.isZero()) return true;
    Point normalized = point;
    normalized.normalize();
    const Field& x = normalized.x;
    const Field& y = normalized.y;
    return y * y == x * x * x + b;
}

} // namespace

void init() {
    std::call_once(init_flag, [] {
        mcl::bn::initPairing(mcl::BN_SNARK1);
        GROTH16_DEBUG_PRINT("[bn254] mcl initialised with BN_SNARK1\n");
    });
}

const G1& g1_generator() {
    init();
    static const G1 generator = g1_from_affine(Fq(1), Fq(2));
    return generator;
}

const G2& g2_generator() {
    init();
    static const G2 generator = g2_from_affine(
        make_fq2(fq_from_hex("1800deef121f1e76426a00665e5c4479674322d4f75edadd46debd5cd992f6ed"),
                 fq_from_hex("198e9393920d483a7260bfb731fb5d25f1aa493335a9e71297e485b7aef312c2")),
        make_fq2(fq_from_hex("12c85ea5db8c6deb4aab71808dcb408fe3d1e7690c43d37b4ce6cc0166fa7daa"),
                 fq_from_hex("090689d0585ff075ec9e99ad690c3395bc4b313370b38ef355acdadcd122975b")));
    return generator;
}

G1 g1_identity() {
    init();
    G1 point;
    point.clear();
    return point;
}

G2 g2_identity() {
    init();
    G2 point;
    point.clear();
    return point;
}

const Fq& g1_coeff_b() {
    init();
    static const Fq b(3);
    return b;
}

const Fq2& g2_coeff_b() {
    init();
    // 3 / (9 + u)
    static const Fq2 b = make_fq2(Fq(3), Fq(0)) / make_fq2(Fq(9), Fq(1));
    return b;
}

Fq2 make_fq2(const Fq& real, const Fq& imaginary) {
    init();
    Fq2 value;
    value.set(real, imaginary);
    return value;
}

std::optional<Fq> sqrt(const Fq& value) {
    init();
    Fq root;
    if (!Fq::squareRoot(root, value)) {
        return std::nullopt;
    }
    return root;
}

std::optional<Fq2> sqrt(const Fq2& value) {
    init();
    Fq2 root;
    if (!Fq2::squareRoot(root, value)) {
        return std::nullopt;
    }
    return root;
}

G1 g1_from_affine(const Fq& x, const Fq& y) {
    init();
    G1 point;
    point.x = x;
    point.y = y;
    point.z = 1;
    return point;
}

G2 g2_from_affine(const Fq2& x, const Fq2& y) {
    init();
    G2 point;
    point.x = x;
    point.y = y;
    point.z = make_fq2(Fq(1), Fq(0));
    return point;
}

std::optional<G1Affine> to_affine(const G1& point) {
    init();
    if (point.isZero()) return std::nullopt;
    G1 normalized = point;
    normalized.normalize();
    return G1Affine{normalized.x, normalized.y};
}

std::optional<G2Affine> to_affine(const G2& point) {
    init();
    if (point.isZero()) return std::nullopt;
    G2 normalized = point;
    normalized.normalize();
    return G2Affine{normalized.x, normalized.y};
}

bool is_on_curve(const G1& point) {
    return satisfies_curve_equation(point, g1_coeff_b());
}

bool is_on_curve(const G2& point) {
    return satisfies_curve_equation(point, g2_coeff_b());
}

bool is_in_subgroup(const G2& point) {
    init();
    return point.isZero() || point.isValidOrder();
}

Fq neg(const Fq& value) {
    init();
    Fq out;
    Fq::neg(out, value);
    return out;
}

Fq2 neg(const Fq2& value) {
    init();
    Fq2 out;
    Fq2::neg(out, value);
    return out;
}

G1 neg(const G1& point) {
    init();
    G1 out;
    G1::neg(out, point);
    return out;
}

G2 neg(const G2& point) {
    init();
    G2 out;
    G2::neg(out, point);
    return out;
}

G1 mul(const G1& point, const Fr& scalar) {
    init();
    G1 out;
    G1::mul(out, point, scalar);
    return out;
}

G2 mul(const G2& point, const Fr& scalar) {
    init();
    G2 out;
    G2::mul(out, point, scalar);
    return out;
}

std::string to_string(const Fq& value) {
    init();
    return padded_hex(value);
}

std::string to_string(const Fr& value) {
    init();
    return padded_hex(value);
}

std::string to_string(const G1& point) {
    auto affine = to_affine(point);
    if (!affine) return "identity";
    return "(" + to_string(affine->x) + ", " + to_string(affine->y) + ")";
}

} // namespace bn254
} // namespace groth16
