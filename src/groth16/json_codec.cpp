#include "groth16/json_codec.hpp"
#include "codec/field_codec.hpp"
#include "codec/hex.hpp"
#include "groth16/errors.hpp"
#include <string>

namespace groth16 {

namespace {

const nlohmann::json& member(const nlohmann::json& json, const char* key) {
    if (!json.is_object()) {
        throw InvalidDataError(std::string("expected a JSON object holding \"") + key + "\"");
    }
    auto it = json.find(key);
    if (it == json.end()) {
        throw InvalidDataError(std::string("missing \"") + key + "\"");
    }
    return *it;
}

std::string coordinate_hex(const Fq& value) {
    return "0x" + to_hex(fq_to_bytes(value));
}

// 32 big-endian bytes appended to out; range is checked later by the point decoder
void append_coordinate(Bytes& out, const nlohmann::json& json, const char* key) {
    const auto& value = member(json, key);
    if (!value.is_string()) {
        throw InvalidDataError(std::string("\"") + key + "\" must be a hex string");
    }
    Bytes bytes = from_hex(value.get<std::string>());
    if (bytes.size() != FQ_SIZE) {
        throw BufferLengthError(std::string("JSON coordinate \"") + key + "\"", FQ_SIZE, bytes.size());
    }
    out.insert(out.end(), bytes.begin(), bytes.end());
}

nlohmann::json fq2_to_json(const Fq2& value) {
    return {
        {"real", coordinate_hex(value.a)},
        {"imaginary", coordinate_hex(value.b)},
    };
}

// Uncompressed wire order: imaginary part first
void append_fq2(Bytes& out, const nlohmann::json& json, const char* key) {
    const auto& value = member(json, key);
    append_coordinate(out, value, "imaginary");
    append_coordinate(out, value, "real");
}

} // namespace

nlohmann::json g1_to_json(const G1& point) {
    auto affine = bn254::to_affine(point);
    if (!affine) {
        throw InvalidPointError("the G1 identity has no JSON form");
    }
    return {
        {"x", coordinate_hex(affine->x)},
        {"y", coordinate_hex(affine->y)},
    };
}

G1 g1_from_json(const nlohmann::json& json, PointCheck check) {
    Bytes bytes;
    bytes.reserve(G1_UNCOMPRESSED_SIZE);
    append_coordinate(bytes, json, "x");
    append_coordinate(bytes, json, "y");
    return PointCodec::decode_g1(bytes, PointFormat::Uncompressed, check);
}

nlohmann::json g2_to_json(const G2& point) {
    auto affine = bn254::to_affine(point);
    if (!affine) {
        throw InvalidPointError("the G2 identity has no JSON form");
    }
    return {
        {"x", fq2_to_json(affine->x)},
        {"y", fq2_to_json(affine->y)},
    };
}

G2 g2_from_json(const nlohmann::json& json, PointCheck check) {
    Bytes bytes;
    bytes.reserve(G2_UNCOMPRESSED_SIZE);
    append_fq2(bytes, json, "x");
    append_fq2(bytes, json, "y");
    return PointCodec::decode_g2(bytes, PointFormat::Uncompressed, check);
}

nlohmann::json verifying_key_to_json(const VerifyingKey& vk) {
    nlohmann::json k = nlohmann::json::array();
    for (const auto& point : vk.k()) {
        k.push_back(g1_to_json(point));
    }
    return {
        {"g1", {{"alpha", g1_to_json(vk.alpha())}, {"k", k}}},
        {"g2", {
            {"beta", g2_to_json(vk.beta_wire())},
            {"delta", g2_to_json(vk.delta())},
            {"gamma", g2_to_json(vk.gamma())},
        }},
    };
}

VerifyingKey verifying_key_from_json(const nlohmann::json& json, PointCheck check) {
    const auto& g1 = member(json, "g1");
    const auto& g2 = member(json, "g2");

    const auto& k_json = member(g1, "k");
    if (!k_json.is_array()) {
        throw InvalidDataError("\"k\" must be an array");
    }
    std::vector<G1> k;
    k.reserve(k_json.size());
    for (const auto& point : k_json) {
        k.push_back(g1_from_json(point, check));
    }

    return VerifyingKey::from_points(g1_from_json(member(g1, "alpha"), check),
                                     g2_from_json(member(g2, "beta"), check),
                                     g2_from_json(member(g2, "gamma"), check),
                                     g2_from_json(member(g2, "delta"), check),
                                     std::move(k));
}

nlohmann::json proof_to_json(const Proof& proof) {
    return {
        {"ar", g1_to_json(proof.ar())},
        {"krs", g1_to_json(proof.krs())},
        {"bs", g2_to_json(proof.bs())},
    };
}

Proof proof_from_json(const nlohmann::json& json, PointCheck check) {
    return Proof(g1_from_json(member(json, "ar"), check),
                 g2_from_json(member(json, "bs"), check),
                 g1_from_json(member(json, "krs"), check));
}

void to_json(nlohmann::json& json, const VerifyingKey& vk) {
    json = verifying_key_to_json(vk);
}

void from_json(const nlohmann::json& json, VerifyingKey& vk) {
    vk = verifying_key_from_json(json);
}

void to_json(nlohmann::json& json, const Proof& proof) {
    json = proof_to_json(proof);
}

void from_json(const nlohmann::json& json, Proof& proof) {
    proof = proof_from_json(json);
}

} // namespace groth16
