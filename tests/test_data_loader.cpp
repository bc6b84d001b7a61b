// Loads the synthetic fixture (see tests/test_verifier.cpp for its provenance).
#include <gtest/gtest.h>
#include "test_data_loader.hpp"
#include <filesystem>

using namespace groth16;

class TestDataLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Use TEST_DATA_DIR defined in CMakeLists.txt
        test_data_dir_ = TEST_DATA_DIR;

        // Check if test data directory exists
        if (!std::filesystem::exists(test_data_dir_)) {
            GTEST_SKIP() << "Test data directory not found: " << test_data_dir_;
        }
    }

    std::string test_data_dir_;
};

TEST_F(TestDataLoaderTest, LoadGroth16Fixture) {
    TestDataLoader loader(test_data_dir_);
    auto fixture = loader.load_groth16_fixture();

    // Three K points in every layout
    EXPECT_EQ(fixture.vk_gnark.size(), 292u + 3 * 32);
    EXPECT_EQ(fixture.vk_uncompressed.size(), 452u + 3 * 64);
    EXPECT_EQ(fixture.vk_compressed.size(), 228u + 3 * 32);
    EXPECT_EQ(fixture.vk_hash_prefix.size(), 4u);
    EXPECT_EQ(fixture.program_vkey_hash[0], 0x00);
    EXPECT_EQ(fixture.program_vkey_hash[31], 0x13);
}

TEST_F(TestDataLoaderTest, LoadProofCases) {
    TestDataLoader loader(test_data_dir_);
    auto fixture = loader.load_groth16_fixture();

    ASSERT_EQ(fixture.cases.size(), 2u);
    for (const auto& c : fixture.cases) {
        EXPECT_EQ(c.proof.size(), 260u) << c.name;
        EXPECT_EQ(c.proof_compressed.size(), 128u) << c.name;
        EXPECT_EQ(c.public_inputs.size(), 2u) << c.name;
        EXPECT_FALSE(c.public_values.empty()) << c.name;
    }

    const auto& sha = fixture.find_case("sha256");
    EXPECT_EQ(std::string(sha.public_values.begin(), sha.public_values.end()), "fibonacci: n=10 -> 55");
    EXPECT_EQ(sha.public_inputs[0], fixture.program_vkey_hash);
    EXPECT_THROW(fixture.find_case("keccak"), std::out_of_range);
}

TEST_F(TestDataLoaderTest, MissingFileThrows) {
    TestDataLoader loader(test_data_dir_);
    EXPECT_THROW(loader.load_json("does_not_exist.json"), std::runtime_error);
}
