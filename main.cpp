#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "codec/hex.hpp"
#include "common/debug_control.hpp"
#include "groth16/batch_verifier.hpp"
#include "groth16/errors.hpp"
#include "groth16/verifier_config.hpp"

using namespace groth16;

namespace {

constexpr int EXIT_VERIFIED = 0;
constexpr int EXIT_REJECTED = 1;
constexpr int EXIT_USAGE = 2;

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <manifest.json>\n"
              << "\n"
              << "Manifest (hex strings, optional \"config\" object):\n"
              << "  {\"vk\": ..., \"proof\": ..., \"public_values\": ..., \"vk_hash\": ...}\n"
              << "  {\"config\": {...}, \"proofs\": [{\"vk\": ..., ...}, ...]}\n"
              << "\n"
              << "Config keys: mode (real|mock), point_check (full|curve-only|unchecked),\n"
              << "             public_values_hash (sha256|blake3|any)\n"
              << "\n"
              << "Exit code: 0 all proofs verified, 1 at least one rejected, 2 usage or I/O error\n";
}

VerificationRequest parse_request(const nlohmann::json& entry) {
    VerificationRequest request;
    request.vk = from_hex(entry.at("vk").get<std::string>());
    request.proof = from_hex(entry.at("proof").get<std::string>());
    request.public_values = from_hex(entry.at("public_values").get<std::string>());
    request.vk_hash_tag = digest_from_hex(entry.at("vk_hash").get<std::string>());
    return request;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 2) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    const std::string manifest_path = argv[1];
    std::ifstream file(manifest_path);
    if (!file.is_open()) {
        std::cerr << "[cli] Failed to open manifest: " << manifest_path << std::endl;
        return EXIT_USAGE;
    }

    VerifierConfig config;
    std::vector<VerificationRequest> requests;
    try {
        nlohmann::json manifest = nlohmann::json::parse(file);
        if (manifest.contains("config")) {
            config = VerifierConfig::from_json(manifest["config"]);
        }
        if (manifest.contains("proofs")) {
            for (const auto& entry : manifest["proofs"]) {
                requests.push_back(parse_request(entry));
            }
        } else {
            requests.push_back(parse_request(manifest));
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[cli] Malformed manifest: " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const Groth16Error& e) {
        std::cerr << "[cli] " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    GROTH16_DEBUG_COUT("[cli] config " << config.to_json().dump() << ", "
                       << requests.size() << " proof(s)\n");

    BatchVerifier verifier(config);
    std::vector<VerificationResult> results = verifier.verify_all(requests);

    bool all_verified = true;
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        std::cout << "proof " << i << ": " << to_string(result.status);
        if (!result.verified()) {
            all_verified = false;
            std::cout << " (" << to_string(*result.error_kind) << ": " << result.message << ")";
        }
        std::cout << std::endl;
    }

    return all_verified ? EXIT_VERIFIED : EXIT_REJECTED;
}
