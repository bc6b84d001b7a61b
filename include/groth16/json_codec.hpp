#pragma once

#include "codec/point_codec.hpp"
#include "groth16/proof.hpp"
#include "groth16/verifying_key.hpp"
#include <nlohmann/json.hpp>

namespace groth16 {

/**
 * Human-readable JSON form of points, verifying keys and proofs.
 *
 *   G1     {"x": "0x..", "y": "0x.."}
 *   G2     {"x": {"real": "0x..", "imaginary": "0x.."}, "y": {...}}
 *   VK     {"g1": {"alpha": G1, "k": [G1, ...]},
 *           "g2": {"beta": G2, "delta": G2, "gamma": G2}}
 *   Proof  {"ar": G1, "krs": G1, "bs": G2}
 *
 * Coordinates are affine, 32-byte big-endian, lowercase hex with a 0x prefix
 * (the prefix is optional on input). "beta" is the point as encoded on the
 * wire, not the negated value VerifyingKey keeps.
 *
 * Decoding goes through PointCodec's uncompressed path, so it fails exactly
 * as the binary decoders do: InvalidDataError for a missing key, a non-string
 * coordinate or bad hex, BufferLengthError for a coordinate that is not 32
 * bytes, FieldError for a value >= p, InvalidPointError per PointCheck.
 * Identities cannot be written.
 */
nlohmann::json g1_to_json(const G1& point);
G1 g1_from_json(const nlohmann::json& json, PointCheck check = PointCheck::Full);

nlohmann::json g2_to_json(const G2& point);
G2 g2_from_json(const nlohmann::json& json, PointCheck check = PointCheck::Full);

nlohmann::json verifying_key_to_json(const VerifyingKey& vk);
VerifyingKey verifying_key_from_json(const nlohmann::json& json, PointCheck check = PointCheck::Full);

nlohmann::json proof_to_json(const Proof& proof);
Proof proof_from_json(const nlohmann::json& json, PointCheck check = PointCheck::Full);

// nlohmann ADL hooks; from_json applies PointCheck::Full
void to_json(nlohmann::json& json, const VerifyingKey& vk);
void from_json(const nlohmann::json& json, VerifyingKey& vk);
void to_json(nlohmann::json& json, const Proof& proof);
void from_json(const nlohmann::json& json, Proof& proof);

} // namespace groth16
