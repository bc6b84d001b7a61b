#include "groth16/verifier_config.hpp"
#include "groth16/errors.hpp"
#include <array>
#include <utility>

namespace groth16 {

namespace {

template <typename Enum, size_t N>
Enum parse_enum(const nlohmann::json& json, const char* key, Enum fallback,
                const std::array<Enum, N>& values) {
    if (!json.contains(key)) {
        return fallback;
    }
    const auto& value = json.at(key);
    if (!value.is_string()) {
        throw ConfigError(std::string("\"") + key + "\" must be a string");
    }
    const std::string name = value.get<std::string>();
    for (Enum candidate : values) {
        if (name == to_string(candidate)) {
            return candidate;
        }
    }
    throw ConfigError(std::string("unknown ") + key + " \"" + name + "\"");
}

const std::array<VerifierMode, 2> ALL_MODES = {VerifierMode::Real, VerifierMode::Mock};
const std::array<PointCheck, 3> ALL_POINT_CHECKS = {
    PointCheck::Full, PointCheck::CurveOnly, PointCheck::Unchecked
};
const std::array<PublicValuesHash, 3> ALL_HASHES = {
    PublicValuesHash::Sha256, PublicValuesHash::Blake3, PublicValuesHash::Any
};

} // namespace

const char* to_string(VerifierMode mode) {
    switch (mode) {
        case VerifierMode::Real: return "real";
        case VerifierMode::Mock: return "mock";
    }
    return "unknown";
}

const char* to_string(PublicValuesHash hash) {
    switch (hash) {
        case PublicValuesHash::Sha256: return "sha256";
        case PublicValuesHash::Blake3: return "blake3";
        case PublicValuesHash::Any: return "any";
    }
    return "unknown";
}

VerifierConfig VerifierConfig::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError("expected a JSON object");
    }
    VerifierConfig config;
    config.mode = parse_enum(json, "mode", config.mode, ALL_MODES);
    config.point_check = parse_enum(json, "point_check", config.point_check, ALL_POINT_CHECKS);
    config.public_values_hash = parse_enum(json, "public_values_hash", config.public_values_hash, ALL_HASHES);
    return config;
}

VerifierConfig VerifierConfig::from_json_string(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(e.what());
    }
    return from_json(json);
}

nlohmann::json VerifierConfig::to_json() const {
    return {
        {"mode", to_string(mode)},
        {"point_check", to_string(point_check)},
        {"public_values_hash", to_string(public_values_hash)},
    };
}

} // namespace groth16
