#include "test_data_loader.hpp"
#include "codec/hex.hpp"
#include <fstream>
#include <stdexcept>
#include <utility>

namespace groth16 {

TestDataLoader::TestDataLoader(const std::string& test_data_dir)
    : test_data_dir_(test_data_dir) {}

std::string TestDataLoader::file_path(const std::string& filename) const {
    return test_data_dir_ + "/" + filename;
}

nlohmann::json TestDataLoader::load_json(const std::string& filename) const {
    std::ifstream file(file_path(filename));
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path(filename));
    }
    return nlohmann::json::parse(file);
}

const TestDataLoader::ProofCase& TestDataLoader::Groth16Fixture::find_case(const std::string& name) const {
    for (const auto& c : cases) {
        if (c.name == name) {
            return c;
        }
    }
    throw std::out_of_range("No proof case named " + name);
}

TestDataLoader::Groth16Fixture TestDataLoader::load_groth16_fixture(const std::string& filename) const {
    auto json = load_json(filename);

    Groth16Fixture fixture;
    fixture.vk_gnark = from_hex(json["vk_gnark"].get<std::string>());
    fixture.vk_uncompressed = from_hex(json["vk_uncompressed"].get<std::string>());
    fixture.vk_compressed = from_hex(json["vk_compressed"].get<std::string>());
    fixture.program_vkey_hash = digest_from_hex(json["program_vkey_hash"].get<std::string>());
    fixture.vk_hash_prefix = from_hex(json["vk_hash_prefix"].get<std::string>());

    const auto& cases = json["cases"];
    for (auto it = cases.begin(); it != cases.end(); ++it) {
        const auto& entry = it.value();
        ProofCase c;
        c.name = it.key();
        c.public_values = from_hex(entry["public_values"].get<std::string>());
        c.proof = from_hex(entry["proof"].get<std::string>());
        c.proof_compressed = from_hex(entry["proof_compressed"].get<std::string>());
        for (const auto& input : entry["public_inputs"]) {
            c.public_inputs.push_back(digest_from_hex(input.get<std::string>()));
        }
        fixture.cases.push_back(std::move(c));
    }
    return fixture;
}

} // namespace groth16
