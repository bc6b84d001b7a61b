#include <gtest/gtest.h>
#include "codec/hex.hpp"
#include "groth16/errors.hpp"
#include "groth16/proof.hpp"
#include "test_data_loader.hpp"
#include "test_utils.hpp"
#include <filesystem>
#include <random>

using namespace groth16;

class ProofTest : public ::testing::Test {
protected:
    void SetUp() override {
        bn254::init();
        test_data_dir_ = TEST_DATA_DIR;
        if (!std::filesystem::exists(test_data_dir_)) {
            GTEST_SKIP() << "Test data directory not found: " << test_data_dir_;
        }
        fixture_ = TestDataLoader(test_data_dir_).load_groth16_fixture();
    }

    std::string test_data_dir_;
    TestDataLoader::Groth16Fixture fixture_;
    std::mt19937_64 rng_{42};
};

TEST_F(ProofTest, Sizes) {
    EXPECT_EQ(PROOF_UNCOMPRESSED_SIZE, 256u);
    EXPECT_EQ(PROOF_COMPRESSED_SIZE, 128u);
    EXPECT_EQ(VK_HASH_PREFIX_SIZE, 4u);
}

TEST_F(ProofTest, SplitPrefix) {
    const auto& c = fixture_.find_case("sha256");
    auto [prefix, body] = split_vk_hash_prefix(c.proof);
    ASSERT_TRUE(prefix.has_value());
    EXPECT_EQ(Bytes(prefix->begin(), prefix->end()), fixture_.vk_hash_prefix);
    EXPECT_EQ(body.size(), PROOF_UNCOMPRESSED_SIZE);
    EXPECT_EQ(body.data(), c.proof.data() + 4);

    auto [no_prefix, same] = split_vk_hash_prefix(c.proof_compressed);
    EXPECT_FALSE(no_prefix.has_value());
    EXPECT_EQ(same.size(), PROOF_COMPRESSED_SIZE);

    Bytes prefixed_compressed = fixture_.vk_hash_prefix;
    prefixed_compressed.insert(prefixed_compressed.end(), c.proof_compressed.begin(), c.proof_compressed.end());
    auto [short_prefix, short_body] = split_vk_hash_prefix(prefixed_compressed);
    EXPECT_TRUE(short_prefix.has_value());
    EXPECT_EQ(short_body.size(), PROOF_COMPRESSED_SIZE);
}

TEST_F(ProofTest, VkHashPrefixIsSha256Head) {
    VkHashPrefix prefix = vk_hash_prefix(fixture_.vk_gnark);
    EXPECT_EQ(to_hex(prefix), to_hex(fixture_.vk_hash_prefix));
    EXPECT_NE(vk_hash_prefix(fixture_.vk_uncompressed), prefix);
}

TEST_F(ProofTest, CompressedAndUncompressedAgree) {
    for (const auto& c : fixture_.cases) {
        auto [prefix, body] = split_vk_hash_prefix(c.proof);
        Proof uncompressed = Proof::from_bytes(body, PointFormat::Uncompressed);
        Proof compressed = Proof::from_bytes(c.proof_compressed, PointFormat::Compressed);
        EXPECT_EQ(uncompressed, compressed) << c.name;

        // Length-based detection
        EXPECT_EQ(Proof::from_bytes(body), uncompressed);
        EXPECT_EQ(Proof::from_bytes(c.proof_compressed), compressed);
    }
}

TEST_F(ProofTest, SerializeMatchesFixture) {
    const auto& c = fixture_.find_case("blake3");
    Proof proof = Proof::from_bytes(c.proof_compressed);
    EXPECT_EQ(proof.to_bytes(PointFormat::Compressed), c.proof_compressed);
    EXPECT_EQ(proof.to_bytes(PointFormat::Uncompressed), Bytes(c.proof.begin() + 4, c.proof.end()));
}

TEST_F(ProofTest, GnarkCompressedRoundTrip) {
    Proof proof(test::random_g1(rng_), test::random_g2(rng_), test::random_g1(rng_));
    Bytes bytes = proof.to_bytes(PointFormat::GnarkCompressed);
    EXPECT_EQ(bytes.size(), PROOF_COMPRESSED_SIZE);
    EXPECT_EQ(Proof::from_bytes(bytes, PointFormat::GnarkCompressed), proof);
}

TEST_F(ProofTest, WrongLengthRejected) {
    EXPECT_THROW(Proof::from_bytes(Bytes(255, 0)), BufferLengthError);
    EXPECT_THROW(Proof::from_bytes(Bytes(129, 0)), BufferLengthError);
    EXPECT_THROW(Proof::from_bytes(Bytes(260, 0)), BufferLengthError);
    EXPECT_THROW(Proof::from_bytes(Bytes(256, 0), PointFormat::Compressed), BufferLengthError);
}

TEST_F(ProofTest, AccessorsExposePoints) {
    const auto& c = fixture_.find_case("sha256");
    Proof proof = Proof::from_bytes(c.proof_compressed);
    EXPECT_TRUE(bn254::is_on_curve(proof.ar()));
    EXPECT_TRUE(bn254::is_in_subgroup(proof.bs()));
    EXPECT_TRUE(bn254::is_on_curve(proof.krs()));
    EXPECT_NE(proof.ar(), proof.krs());
}
