#pragma once

#include "codec/point_codec.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace groth16 {

enum class VerifierMode {
    Real,
    // Accepts every proof without curve arithmetic; for tests and dry runs
    Mock,
};

// Which digest binds the public values to the second public input
enum class PublicValuesHash {
    Sha256,
    Blake3,
    // SHA-256 first, then BLAKE3
    Any,
};

const char* to_string(VerifierMode mode);
const char* to_string(PublicValuesHash hash);

/**
 * VerifierConfig - behaviour of a Groth16Verifier, fixed at construction.
 *
 * JSON form (every key optional):
 *   {"mode": "real" | "mock",
 *    "point_check": "full" | "curve-only" | "unchecked",
 *    "public_values_hash": "sha256" | "blake3" | "any"}
 */
struct VerifierConfig {
    VerifierMode mode = VerifierMode::Real;
    PointCheck point_check = PointCheck::Full;
    PublicValuesHash public_values_hash = PublicValuesHash::Any;

    static VerifierConfig mock() {
        VerifierConfig config;
        config.mode = VerifierMode::Mock;
        return config;
    }

    // ConfigError for a non-object, a non-string value or an unknown name
    static VerifierConfig from_json(const nlohmann::json& json);
    static VerifierConfig from_json_string(const std::string& text);
    nlohmann::json to_json() const;

    bool operator==(const VerifierConfig& rhs) const {
        return mode == rhs.mode && point_check == rhs.point_check &&
               public_values_hash == rhs.public_values_hash;
    }
    bool operator!=(const VerifierConfig& rhs) const { return !(*this == rhs); }
};

} // namespace groth16
