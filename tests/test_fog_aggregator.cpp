#include "crypto/signature.hpp"
#include "fog/fog_aggregator.hpp"
#include "mpc/field.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace hierfed;
using namespace hierfed::testing;
using namespace std::chrono_literals;

class FogAggregatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    authority_ = std::make_unique<TrustedAuthority>(config_);
    fog_ = std::make_unique<FogAggregator>(config_, 1);
    fog_->setAuthorityKey(authority_->publicKey());
    for (int k = 0; k < 3; ++k) {
      facilities_.push_back(makeFacility(config_, k));
      registerWith(*authority_, *facilities_.back());
    }
  }

  RoundAnnouncement announcement(uint64_t round,
                                 std::vector<std::string> participants) const {
    RoundAnnouncement a;
    a.round = round;
    a.base_version = 1;
    a.threshold = 2;
    a.participants = std::move(participants);
    a.fog_nodes = {"fog-0", "fog-1", "fog-2"};
    a.global_parameters = config_.initial_parameters;
    return a;
  }

  // Announces `round` everywhere and returns shares[facility][fog]
  std::vector<std::vector<ShareMessage>> contribute(uint64_t round) {
    auto a = announcement(round, {"facility-0", "facility-1", "facility-2"});
    EXPECT_TRUE(fog_->announceRound(a).isSuccess());
    std::vector<std::vector<ShareMessage>> out;
    for (auto &facility : facilities_) {
      EXPECT_TRUE(facility->announceRound(a).isSuccess());
      facility->setLocalData(encodeFloat64Payload({0.5, 1.0, -1.5, 2.0}));
      auto shares = facility->prepareContribution();
      EXPECT_TRUE(shares.isSuccess());
      out.push_back(shares.value());
    }
    return out;
  }

  DeploymentConfig config_ = testConfig();
  std::unique_ptr<TrustedAuthority> authority_;
  std::unique_ptr<FogAggregator> fog_;
  std::vector<std::unique_ptr<Facility>> facilities_;
};

TEST_F(FogAggregatorTest, SumsOneShareFromEachFacility) {
  auto shares = contribute(1);
  for (const auto &facility : shares) {
    ASSERT_TRUE(fog_->acceptShare(facility[1]).isSuccess());
  }
  EXPECT_TRUE(fog_->waitForShares(std::chrono::steady_clock::now() + 10ms));

  auto partial = fog_->finalizeRound(1);
  ASSERT_TRUE(partial.isSuccess()) << partial.message();
  EXPECT_EQ(partial.value().x, 2u);
  EXPECT_EQ(partial.value().fog_index, 1);
  EXPECT_EQ(partial.value().participants,
            (std::vector<std::string>{"facility-0", "facility-1", "facility-2"}));
  for (size_t c = 0; c < partial.value().values.size(); ++c) {
    FieldElement expected = 0;
    for (const auto &facility : shares) {
      expected = PrimeField::add(expected, facility[1].values[c]);
    }
    EXPECT_EQ(partial.value().values[c], expected);
  }
  EXPECT_TRUE(SignatureUtils::verifySignature(
      partialSumSigningMessage(partial.value()), partial.value().signature,
      fog_->publicKey()));
}

TEST_F(FogAggregatorTest, SecondShareFromSameFacilityIsDuplicate) {
  auto shares = contribute(1);
  ASSERT_TRUE(fog_->acceptShare(shares[0][1]).isSuccess());
  EXPECT_EQ(fog_->acceptShare(shares[0][1]).error(),
            ErrorCode::ProtocolDuplicateMessage);
  EXPECT_EQ(fog_->sharesReceived(), 1u);
}

TEST_F(FogAggregatorTest, ShareForAnotherPointIsRejected) {
  auto shares = contribute(1);
  EXPECT_EQ(fog_->acceptShare(shares[0][0]).error(),
            ErrorCode::ProtocolInvalidMessage);
}

TEST_F(FogAggregatorTest, TamperedShareFailsSignature) {
  auto shares = contribute(1);
  ShareMessage tampered = shares[0][1];
  tampered.values[0] = PrimeField::add(tampered.values[0], 1);
  EXPECT_EQ(fog_->acceptShare(tampered).error(), ErrorCode::CryptoInvalidSignature);

  ShareMessage forged_identity = shares[1][1];
  forged_identity.identity.attributes.push_back("hospital");
  EXPECT_EQ(fog_->acceptShare(forged_identity).error(),
            ErrorCode::CryptoInvalidSignature);
}

TEST_F(FogAggregatorTest, ValuesOutsideFieldAreRejected) {
  auto shares = contribute(1);
  ShareMessage out_of_range = shares[0][1];
  out_of_range.values[0] = PrimeField::MODULUS;
  EXPECT_EQ(fog_->acceptShare(out_of_range).error(),
            ErrorCode::AggregationInvalidData);
}

TEST_F(FogAggregatorTest, NonParticipantIsUnknown) {
  auto shares = contribute(1);
  FogAggregator narrow(config_, 1);
  narrow.setAuthorityKey(authority_->publicKey());
  ASSERT_TRUE(narrow.announceRound(announcement(1, {"facility-0", "facility-1"})).isSuccess());
  EXPECT_TRUE(narrow.acceptShare(shares[0][1]).isSuccess());
  EXPECT_EQ(narrow.acceptShare(shares[2][1]).error(), ErrorCode::ProtocolUnknownSender);
}

TEST_F(FogAggregatorTest, WaitsForAuthorityKey) {
  auto shares = contribute(1);
  FogAggregator keyless(config_, 1);
  ASSERT_TRUE(keyless.announceRound(announcement(1, {"facility-0"})).isSuccess());
  EXPECT_FALSE(keyless.hasAuthorityKey());
  EXPECT_EQ(keyless.acceptShare(shares[0][1]).error(), ErrorCode::ProtocolNotReady);
}

TEST_F(FogAggregatorTest, FinalizedRoundRejectsLateShares) {
  auto shares = contribute(1);
  ASSERT_TRUE(fog_->acceptShare(shares[0][1]).isSuccess());
  EXPECT_FALSE(fog_->waitForShares(std::chrono::steady_clock::now() + 20ms));
  ASSERT_TRUE(fog_->finalizeRound(1).isSuccess());

  EXPECT_EQ(fog_->acceptShare(shares[1][1]).error(), ErrorCode::ProtocolStaleMessage);
  EXPECT_EQ(fog_->finalizeRound(1).error(), ErrorCode::ProtocolStaleMessage);
  EXPECT_EQ(fog_->announceRound(announcement(1, {"facility-0"})).error(),
            ErrorCode::ProtocolStaleMessage);
}

TEST_F(FogAggregatorTest, SharesFromOlderRoundsAreStale) {
  auto shares = contribute(2);
  ShareMessage old_round = shares[0][1];
  old_round.round = 1;
  EXPECT_EQ(fog_->acceptShare(old_round).error(), ErrorCode::ProtocolStaleMessage);
}

TEST_F(FogAggregatorTest, ShareAheadOfAnnouncementIsNotReady) {
  auto shares = contribute(2);
  ShareMessage ahead = shares[0][1];
  ahead.round = 3;
  EXPECT_EQ(fog_->acceptShare(ahead).error(), ErrorCode::ProtocolNotReady);

  FogAggregator idle(config_, 1);
  idle.setAuthorityKey(authority_->publicKey());
  EXPECT_EQ(idle.acceptShare(shares[0][1]).error(), ErrorCode::ProtocolNotReady);
}

TEST_F(FogAggregatorTest, EmptyRoundHasNoPartialSum) {
  ASSERT_TRUE(fog_->announceRound(announcement(1, {"facility-0"})).isSuccess());
  EXPECT_EQ(fog_->finalizeRound(1).error(), ErrorCode::AggregationInsufficientShares);
}
