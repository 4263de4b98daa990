#include "crypto/signature.hpp"
#include "mpc/field.hpp"
#include "mpc/shamir.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace hierfed;
using namespace hierfed::testing;

class FacilityTest : public ::testing::Test {
protected:
  void SetUp() override { makeSubject(testConfig(base_overrides_)); }

  void makeSubject(DeploymentConfig config) {
    config_ = std::make_unique<DeploymentConfig>(std::move(config));
    authority_ = std::make_unique<TrustedAuthority>(*config_);
    facility_ = makeFacility(*config_, 0);
  }

  RoundAnnouncement announcement(uint64_t round,
                                 std::vector<std::string> participants = {
                                     "facility-0", "facility-1"}) const {
    RoundAnnouncement a;
    a.round = round;
    a.base_version = 1;
    a.threshold = config_->reconstruction_threshold;
    a.participants = std::move(participants);
    a.fog_nodes = {"fog-0", "fog-1", "fog-2"};
    a.global_parameters = config_->initial_parameters;
    a.collection_deadline_ms = unixMillis() + 1000;
    return a;
  }

  EncryptedModel sealModel(uint64_t version, const std::vector<double> &parameters,
                           const std::string &policy) const {
    nlohmann::json body = {{"version", version}, {"parameters", parameters}};
    auto payload = CpAbe::encrypt(body.dump(), policy,
                                  authority_->publicParams().attributes);
    EXPECT_TRUE(payload.isSuccess());
    return EncryptedModel{version, version - 1, payload.value()};
  }

  const nlohmann::json base_overrides_ = {
      {"initial_parameters", {0.5, -0.5, 1.0, 0.0}}};
  std::unique_ptr<DeploymentConfig> config_;
  std::unique_ptr<TrustedAuthority> authority_;
  std::unique_ptr<Facility> facility_;
};

TEST_F(FacilityTest, ContributesOnlyWithIdentityRoundAndData) {
  EXPECT_FALSE(facility_->readyToContribute());
  ASSERT_TRUE(facility_->announceRound(announcement(1)).isSuccess());
  facility_->setLocalData(encodeFloat64Payload({0.1, 0.2, 0.3, 0.4}));
  EXPECT_FALSE(facility_->readyToContribute());
  EXPECT_EQ(facility_->prepareContribution().error(), ErrorCode::ProtocolNotReady);

  registerWith(*authority_, *facility_);
  EXPECT_TRUE(facility_->readyToContribute());
}

TEST_F(FacilityTest, SharesReconstructToUpdatedModel) {
  registerWith(*authority_, *facility_);
  ASSERT_TRUE(facility_->announceRound(announcement(1)).isSuccess());
  facility_->setLocalData(encodeFloat64Payload({0.25, 0.5, -1.0, 2.0}));

  auto shares = facility_->prepareContribution();
  ASSERT_TRUE(shares.isSuccess()) << shares.message();
  ASSERT_EQ(shares.value().size(), 3u);

  std::vector<Share> points;
  for (size_t j = 0; j < shares.value().size(); ++j) {
    const auto &message = shares.value()[j];
    EXPECT_EQ(message.round, 1u);
    EXPECT_EQ(message.fog_index, static_cast<int>(j));
    EXPECT_EQ(message.x, j + 1);
    EXPECT_TRUE(message.identity.attribute_keys.empty());
    EXPECT_TRUE(SignatureUtils::verifySignature(shareSigningMessage(message),
                                                message.signature,
                                                facility_->publicKey()));
    points.push_back(Share{message.x, message.values});
  }

  ShamirSharing sharing(2, 3);
  std::vector<Share> last_two = {points[2], points[1]};
  auto secret = sharing.reconstruct(last_two);
  ASSERT_TRUE(secret.isSuccess());
  auto decoded = PrimeField::decodeVector(secret.value());
  std::vector<double> expected = {0.75, 0.0, 0.0, 2.0};
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_NEAR(decoded[i], expected[i], 1e-6);
  }
  EXPECT_TRUE(facility_->ledger().hasSpent(1));
}

TEST_F(FacilityTest, SharesOnlyGoToListedFogs) {
  registerWith(*authority_, *facility_);
  RoundAnnouncement round = announcement(1);
  round.fog_nodes = {"fog-0", "fog-2"};
  ASSERT_TRUE(facility_->announceRound(round).isSuccess());
  facility_->setLocalData(encodeFloat64Payload({0.25, 0.5, -1.0, 2.0}));

  auto shares = facility_->prepareContribution();
  ASSERT_TRUE(shares.isSuccess()) << shares.message();
  ASSERT_EQ(shares.value().size(), 2u);
  EXPECT_EQ(shares.value()[0].fog_index, 0);
  EXPECT_EQ(shares.value()[0].x, 1u);
  EXPECT_EQ(shares.value()[1].fog_index, 2);
  EXPECT_EQ(shares.value()[1].x, 3u);

  ShamirSharing sharing(2, 3);
  auto secret = sharing.reconstruct({Share{shares.value()[0].x, shares.value()[0].values},
                                     Share{shares.value()[1].x, shares.value()[1].values}});
  ASSERT_TRUE(secret.isSuccess());
  auto decoded = PrimeField::decodeVector(secret.value());
  EXPECT_NEAR(decoded[3], 2.0, 1e-6);
}

TEST_F(FacilityTest, AnnouncementWithUnusableFogListIsRejected) {
  registerWith(*authority_, *facility_);
  RoundAnnouncement unknown = announcement(1);
  unknown.fog_nodes = {"fog-0", "fog-9"};
  ASSERT_TRUE(facility_->announceRound(unknown).isSuccess());
  facility_->setLocalData("");
  EXPECT_EQ(facility_->prepareContribution().error(),
            ErrorCode::AggregationInvalidData);
  EXPECT_FALSE(facility_->ledger().hasSpent(1));

  RoundAnnouncement too_few = announcement(2);
  too_few.fog_nodes = {"fog-1"};
  ASSERT_TRUE(facility_->announceRound(too_few).isSuccess());
  EXPECT_EQ(facility_->prepareContribution().error(),
            ErrorCode::AggregationInvalidData);
  EXPECT_FALSE(facility_->ledger().hasSpent(2));
}

TEST_F(FacilityTest, ContributesOncePerRound) {
  registerWith(*authority_, *facility_);
  ASSERT_TRUE(facility_->announceRound(announcement(1)).isSuccess());
  facility_->setLocalData("");
  ASSERT_TRUE(facility_->prepareContribution().isSuccess());

  facility_->setLocalData("");
  EXPECT_FALSE(facility_->readyToContribute());
  EXPECT_EQ(facility_->prepareContribution().error(), ErrorCode::RoundNotActive);

  ASSERT_TRUE(facility_->announceRound(announcement(2)).isSuccess());
  EXPECT_TRUE(facility_->readyToContribute());
}

TEST_F(FacilityTest, UnselectedFacilityStaysOut) {
  registerWith(*authority_, *facility_);
  ASSERT_TRUE(facility_->announceRound(announcement(1, {"facility-1", "facility-2"})).isSuccess());
  facility_->setLocalData("");
  EXPECT_FALSE(facility_->readyToContribute());
  EXPECT_EQ(facility_->prepareContribution().error(), ErrorCode::RoundNotActive);
}

TEST_F(FacilityTest, OlderAnnouncementIsStale) {
  ASSERT_TRUE(facility_->announceRound(announcement(3)).isSuccess());
  EXPECT_EQ(facility_->announceRound(announcement(3)).error(),
            ErrorCode::ProtocolStaleMessage);
  EXPECT_EQ(facility_->announceRound(announcement(2)).error(),
            ErrorCode::ProtocolStaleMessage);
  EXPECT_EQ(facility_->currentRound()->round, 3u);
}

TEST_F(FacilityTest, WrongDimensionPayloadSpendsNoBudget) {
  registerWith(*authority_, *facility_);
  ASSERT_TRUE(facility_->announceRound(announcement(1)).isSuccess());
  facility_->setLocalData(encodeFloat64Payload({1.0, 2.0}));
  EXPECT_EQ(facility_->prepareContribution().error(),
            ErrorCode::AggregationDimensionMismatch);
  EXPECT_FALSE(facility_->ledger().hasSpent(1));
}

TEST_F(FacilityTest, PrivatizedUpdateIsNoisedAndRecorded) {
  auto overrides = base_overrides_;
  overrides["dp_enabled"] = true;
  makeSubject(testConfig(overrides));
  registerWith(*authority_, *facility_);
  ASSERT_TRUE(facility_->announceRound(announcement(1)).isSuccess());
  facility_->setLocalData("");

  auto shares = facility_->prepareContribution();
  ASSERT_TRUE(shares.isSuccess());
  ShamirSharing sharing(2, 3);
  auto secret = sharing.reconstruct(
      {Share{shares.value()[0].x, shares.value()[0].values},
       Share{shares.value()[1].x, shares.value()[1].values}});
  ASSERT_TRUE(secret.isSuccess());
  EXPECT_NE(PrimeField::decodeVector(secret.value()), config_->initial_parameters);

  EXPECT_EQ(facility_->ledger().roundsSpent(), 1u);
  EXPECT_DOUBLE_EQ(facility_->ledger().totalEpsilon(), config_->dp_epsilon);
}

TEST_F(FacilityTest, InstallsNewerModelItCanDecrypt) {
  registerWith(*authority_, *facility_);
  auto model = sealModel(2, {1.0, 2.0, 3.0, 4.0}, "facility AND region:north");

  auto installed = facility_->receiveModel(model);
  ASSERT_TRUE(installed.isSuccess()) << installed.message();
  EXPECT_EQ(facility_->model().version, 2u);
  EXPECT_EQ(facility_->model().parameters, (std::vector<double>{1.0, 2.0, 3.0, 4.0}));

  EXPECT_EQ(facility_->receiveModel(model).error(), ErrorCode::ProtocolStaleMessage);
}

TEST_F(FacilityTest, ModelOutsidePolicyIsNotInstalled) {
  registerWith(*authority_, *facility_);
  auto model = sealModel(2, {1.0, 2.0, 3.0, 4.0}, "hospital");
  EXPECT_EQ(facility_->receiveModel(model).error(),
            ErrorCode::CryptoPolicyNotSatisfied);
  EXPECT_EQ(facility_->model().version, 1u);
  EXPECT_EQ(facility_->model().parameters, config_->initial_parameters);
}

TEST_F(FacilityTest, RejectsIdentityIssuedToSomeoneElse) {
  auto other = makeFacility(*config_, 1);
  registerWith(*authority_, *other);
  auto foreign = other->identity();
  ASSERT_TRUE(foreign.has_value());
  EXPECT_EQ(facility_->acceptIdentity(*foreign, authority_->publicKey()).error(),
            ErrorCode::RegistrationRejected);
  EXPECT_FALSE(facility_->isRegistered());
}
