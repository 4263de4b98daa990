#include "crypto/cp_abe.hpp"
#include "crypto/digest.hpp"
#include <gtest/gtest.h>

using namespace hierfed;

class CpAbeTest : public ::testing::Test {
protected:
  void SetUp() override {
    for (const char *attribute : {"facility", "region:north", "region:south"}) {
      AttributeKey key = CpAbe::generateAttributeKey(attribute, 1);
      params_.public_keys[attribute] = key.public_key;
      keys_[attribute] = key;
    }
    params_.epoch = 1;
  }

  std::vector<AttributeKey> holding(std::initializer_list<const char *> names) {
    std::vector<AttributeKey> out;
    for (const char *name : names) {
      out.push_back(keys_.at(name));
    }
    return out;
  }

  const std::string policy_ = "facility AND (region:north OR region:south)";
  AttributePublicParams params_;
  std::map<std::string, AttributeKey> keys_;
};

TEST_F(CpAbeTest, SatisfyingKeysDecrypt) {
  auto ciphertext = CpAbe::encrypt("model-v2", policy_, params_);
  ASSERT_TRUE(ciphertext.isSuccess()) << ciphertext.message();
  EXPECT_EQ(ciphertext.value().wrapped_shares.size(), 3u);
  EXPECT_EQ(ciphertext.value().epoch, 1u);

  auto north = CpAbe::decrypt(ciphertext.value(), holding({"facility", "region:north"}));
  ASSERT_TRUE(north.isSuccess()) << north.message();
  EXPECT_EQ(north.value(), "model-v2");

  auto south = CpAbe::decrypt(ciphertext.value(), holding({"region:south", "facility"}));
  ASSERT_TRUE(south.isSuccess());
  EXPECT_EQ(south.value(), "model-v2");
}

TEST_F(CpAbeTest, MissingAttributeIsRefused) {
  auto ciphertext = CpAbe::encrypt("model-v2", policy_, params_);
  ASSERT_TRUE(ciphertext.isSuccess());

  auto result = CpAbe::decrypt(ciphertext.value(), holding({"region:north", "region:south"}));
  EXPECT_EQ(result.error(), ErrorCode::CryptoPolicyNotSatisfied);
}

TEST_F(CpAbeTest, KeysFromAnotherEpochAreRefused) {
  params_.epoch = 2;
  for (const char *attribute : {"facility", "region:north"}) {
    AttributeKey rotated = CpAbe::generateAttributeKey(attribute, 2);
    params_.public_keys[attribute] = rotated.public_key;
  }
  auto ciphertext = CpAbe::encrypt("model-v3", policy_, params_);
  ASSERT_TRUE(ciphertext.isSuccess());

  auto result = CpAbe::decrypt(ciphertext.value(), holding({"facility", "region:north"}));
  EXPECT_EQ(result.error(), ErrorCode::CryptoKeyEpochMismatch);
}

TEST_F(CpAbeTest, UnknownAttributeCannotBeEncryptedTo) {
  auto result = CpAbe::encrypt("x", "facility AND region:east", params_);
  EXPECT_EQ(result.error(), ErrorCode::CryptoInvalidPolicy);
}

TEST_F(CpAbeTest, TamperedCiphertextFailsAuthentication) {
  auto ciphertext = CpAbe::encrypt("model-v2", policy_, params_);
  ASSERT_TRUE(ciphertext.isSuccess());

  auto body = fromBase64(ciphertext.value().ciphertext);
  ASSERT_TRUE(body.has_value());
  (*body)[0] ^= 0x01;
  PolicyCiphertext tampered = ciphertext.value();
  tampered.ciphertext = toBase64(*body);

  auto result = CpAbe::decrypt(tampered, holding({"facility", "region:north"}));
  EXPECT_EQ(result.error(), ErrorCode::CryptoDecryptionFailed);
}

TEST_F(CpAbeTest, PublishedKeyOmitsSecret) {
  AttributeKey published = keys_.at("facility");
  published.secret_key.clear();
  nlohmann::json j = published;
  EXPECT_FALSE(j.contains("secret_key"));
  EXPECT_EQ(j.get<AttributeKey>().public_key, published.public_key);
}
