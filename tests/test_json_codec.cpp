#include <gtest/gtest.h>
#include "codec/field_codec.hpp"
#include "groth16/errors.hpp"
#include "groth16/json_codec.hpp"
#include "groth16/verifier.hpp"
#include "test_data_loader.hpp"
#include "test_utils.hpp"
#include <filesystem>
#include <random>

using namespace groth16;

class JsonCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        bn254::init();
        test_data_dir_ = TEST_DATA_DIR;
        if (!std::filesystem::exists(test_data_dir_)) {
            GTEST_SKIP() << "Test data directory not found: " << test_data_dir_;
        }
        fixture_ = TestDataLoader(test_data_dir_).load_groth16_fixture();
        vk_ = VerifyingKey::from_bytes(fixture_.vk_gnark);
    }

    Proof fixture_proof(const std::string& name) const {
        auto [prefix, body] = split_vk_hash_prefix(fixture_.find_case(name).proof);
        return Proof::from_bytes(body);
    }

    std::string test_data_dir_;
    TestDataLoader::Groth16Fixture fixture_;
    VerifyingKey vk_;
    std::mt19937_64 rng_{42};
};

TEST_F(JsonCodecTest, G1Layout) {
    nlohmann::json json = g1_to_json(bn254::g1_generator());
    EXPECT_EQ(json["x"].get<std::string>(), "0x0000000000000000000000000000000000000000000000000000000000000001");
    EXPECT_EQ(json["y"].get<std::string>(), "0x0000000000000000000000000000000000000000000000000000000000000002");
    EXPECT_EQ(g1_from_json(json), bn254::g1_generator());
}

TEST_F(JsonCodecTest, G2Layout) {
    nlohmann::json json = g2_to_json(bn254::g2_generator());
    EXPECT_EQ(json["x"]["real"].get<std::string>(),
              "0x1800deef121f1e76426a00665e5c4479674322d4f75edadd46debd5cd992f6ed");
    EXPECT_EQ(json["x"]["imaginary"].get<std::string>(),
              "0x198e9393920d483a7260bfb731fb5d25f1aa493335a9e71297e485b7aef312c2");
    EXPECT_EQ(g2_from_json(json), bn254::g2_generator());
}

TEST_F(JsonCodecTest, VerifyingKeyRoundTrip) {
    nlohmann::json json = vk_;
    ASSERT_TRUE(json.contains("g1"));
    ASSERT_TRUE(json.contains("g2"));
    EXPECT_EQ(json["g1"]["k"].size(), vk_.k().size());

    // Through text, as a key file would be stored
    auto parsed = nlohmann::json::parse(json.dump(2));
    EXPECT_EQ(parsed.get<VerifyingKey>(), vk_);
}

TEST_F(JsonCodecTest, BetaIsWrittenAsEncoded) {
    nlohmann::json json = verifying_key_to_json(vk_);
    EXPECT_EQ(g2_from_json(json["g2"]["beta"]), vk_.beta_wire());
    EXPECT_NE(g2_from_json(json["g2"]["beta"]), vk_.beta());
}

TEST_F(JsonCodecTest, ProofRoundTrip) {
    for (const auto& c : fixture_.cases) {
        Proof proof = fixture_proof(c.name);
        nlohmann::json json = proof;
        EXPECT_EQ(json.size(), 3u);
        EXPECT_EQ(nlohmann::json::parse(json.dump()).get<Proof>(), proof) << c.name;
    }
}

TEST_F(JsonCodecTest, KeyAndProofFromJsonStillVerify) {
    for (const auto& c : fixture_.cases) {
        VerifyingKey vk = verifying_key_from_json(verifying_key_to_json(vk_));
        Proof proof = proof_from_json(proof_to_json(fixture_proof(c.name)));
        std::vector<Fr> inputs;
        for (const auto& input : c.public_inputs) {
            inputs.push_back(fr_from_bytes(input));
        }
        EXPECT_TRUE(pairing_check(vk, proof, inputs)) << c.name;
    }
}

TEST_F(JsonCodecTest, HexPrefixIsOptionalOnInput) {
    nlohmann::json json = g1_to_json(bn254::g1_generator());
    json["x"] = json["x"].get<std::string>().substr(2);
    EXPECT_EQ(g1_from_json(json), bn254::g1_generator());
}

TEST_F(JsonCodecTest, MalformedJsonRejected) {
    nlohmann::json json = g1_to_json(bn254::g1_generator());

    nlohmann::json missing = json;
    missing.erase("y");
    EXPECT_THROW(g1_from_json(missing), InvalidDataError);

    nlohmann::json not_string = json;
    not_string["x"] = 1;
    EXPECT_THROW(g1_from_json(not_string), InvalidDataError);

    nlohmann::json bad_hex = json;
    bad_hex["x"] = "0xzz";
    EXPECT_THROW(g1_from_json(bad_hex), InvalidDataError);

    nlohmann::json short_hex = json;
    short_hex["x"] = "0x01";
    EXPECT_THROW(g1_from_json(short_hex), BufferLengthError);

    EXPECT_THROW(g1_from_json(nlohmann::json::array()), InvalidDataError);
    EXPECT_THROW(verifying_key_from_json(nlohmann::json{{"g1", {{"alpha", json}, {"k", 3}}}}), InvalidDataError);
}

TEST_F(JsonCodecTest, CoordinateAboveModulusRejected) {
    nlohmann::json json = g1_to_json(bn254::g1_generator());
    json["x"] = "0x30644e72e131a029b85045b68181585d97816a916871ca8d3c208c16d87cfd47";
    EXPECT_THROW(g1_from_json(json), FieldError);
}

TEST_F(JsonCodecTest, PointsAreValidated) {
    nlohmann::json off_curve = g1_to_json(bn254::g1_generator());
    off_curve["y"] = "0x0000000000000000000000000000000000000000000000000000000000000003";
    EXPECT_THROW(g1_from_json(off_curve), InvalidPointError);
    EXPECT_THROW(g1_from_json(off_curve, PointCheck::CurveOnly), InvalidPointError);
    EXPECT_NO_THROW(g1_from_json(off_curve, PointCheck::Unchecked));

    // On the twist, outside the order-r subgroup
    Fq2 x = bn254::make_fq2(Fq(1), Fq(0));
    auto y = bn254::sqrt(x * x * x + bn254::g2_coeff_b());
    ASSERT_TRUE(y.has_value());
    nlohmann::json outside = g2_to_json(bn254::g2_from_affine(x, *y));
    EXPECT_THROW(g2_from_json(outside), InvalidPointError);
    EXPECT_NO_THROW(g2_from_json(outside, PointCheck::CurveOnly));

    // The ADL hook always runs the full check
    nlohmann::json proof = proof_to_json(fixture_proof("sha256"));
    proof["bs"] = outside;
    EXPECT_THROW(proof.get<Proof>(), InvalidPointError);
}

TEST_F(JsonCodecTest, IdentityHasNoJsonForm) {
    EXPECT_THROW(g1_to_json(bn254::g1_identity()), InvalidPointError);
    EXPECT_THROW(g2_to_json(bn254::g2_identity()), InvalidPointError);
}

TEST_F(JsonCodecTest, RandomKeyRoundTrip) {
    std::vector<G1> k = {test::random_g1(rng_), test::random_g1(rng_)};
    VerifyingKey vk = VerifyingKey::from_points(test::random_g1(rng_), test::random_g2(rng_),
                                                test::random_g2(rng_), test::random_g2(rng_), k);
    EXPECT_EQ(verifying_key_from_json(verifying_key_to_json(vk)), vk);
}
