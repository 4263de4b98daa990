#include "fog/fog_aggregator.hpp"
#include "leader/round_coordinator.hpp"
#include "test_support.hpp"
#include "validator/validator.hpp"
#include <algorithm>
#include <future>
#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <set>

using namespace hierfed;
using namespace hierfed::testing;

// Runs every tier in-process: the fixture is the coordinator's transport and
// wires announcements, shares, partial sums and votes directly.
class RoundCoordinatorTest : public ::testing::Test, public RoundTransport {
protected:
  void SetUp() override { build(nlohmann::json::object()); }

  void build(const nlohmann::json &overrides) {
    coordinator_.reset();
    facilities_.clear();
    fogs_.clear();
    validators_.clear();

    config_ = std::make_unique<DeploymentConfig>(testConfig(overrides));
    authority_ = std::make_unique<TrustedAuthority>(*config_);
    for (int k = 0; k < static_cast<int>(config_->registry.facilities.size()); ++k) {
      facilities_.push_back(makeFacility(*config_, k));
      registerWith(*authority_, *facilities_.back());
      ready_facilities_.insert(k);
    }
    for (int i = 0; i < config_->fogCount(); ++i) {
      fogs_.push_back(std::make_unique<FogAggregator>(*config_, i));
      fogs_.back()->setAuthorityKey(authority_->publicKey());
      ready_fogs_.insert(i);
      forwarding_fogs_.insert(i);
    }
    for (int v = 0; v < config_->validatorCount(); ++v) {
      validators_.push_back(std::make_unique<Validator>(*config_, v));
    }
    coordinator_ = std::make_unique<RoundCoordinator>(*config_, *this);
  }

  void giveData(int k, const std::vector<double> &delta) {
    facilities_[k]->setLocalData(encodeFloat64Payload(delta));
  }

  // ===== RoundTransport =====

  PeerReadiness checkReadiness() override {
    if (on_readiness_) {
      on_readiness_();
    }
    PeerReadiness peers;
    for (int k : ready_facilities_) {
      peers.facilities.push_back(facilities_[k]->id());
    }
    for (int i : ready_fogs_) {
      peers.fog_keys[fogs_[i]->id()] = fogs_[i]->publicKey();
    }
    for (const auto &validator : validators_) {
      peers.validator_keys[validator->id()] = validator->publicKey();
    }
    return peers;
  }

  Result<std::vector<std::string>> registeredFacilities() override {
    if (!registry_available_) {
      return Result<std::vector<std::string>>(ErrorCode::NetworkConnectionFailed,
                                              "authority down");
    }
    std::vector<std::string> registered;
    for (const auto &identity : authority_->facilities()) {
      if (identity.registered) {
        registered.push_back(identity.facility_id);
      }
    }
    return registered;
  }

  void announceRound(const RoundAnnouncement &announcement,
                     const PeerReadiness &) override {
    ++announcements_;
    announced_fogs_ = announcement.fog_nodes;
    for (auto &fog : fogs_) {
      const auto &listed = announcement.fog_nodes;
      if (std::find(listed.begin(), listed.end(), fog->id()) != listed.end()) {
        EXPECT_TRUE(fog->announceRound(announcement).isSuccess());
      }
    }
    for (auto &facility : facilities_) {
      const auto &selected = announcement.participants;
      if (std::find(selected.begin(), selected.end(), facility->id()) ==
          selected.end()) {
        continue;
      }
      EXPECT_TRUE(facility->announceRound(announcement).isSuccess());
      if (!facility->readyToContribute()) {
        continue;
      }
      auto shares = facility->prepareContribution();
      ASSERT_TRUE(shares.isSuccess()) << shares.message();
      int k = static_cast<int>(&facility - facilities_.data());
      for (const auto &share : shares.value()) {
        if (dropped_shares_.count({k, share.fog_index}) != 0) {
          continue;
        }
        EXPECT_TRUE(fogs_[share.fog_index]->acceptShare(share).isSuccess());
      }
    }
    for (int i : forwarding_fogs_) {
      auto partial = fogs_[i]->finalizeRound(announcement.round);
      if (!partial) {
        continue;
      }
      sent_partials_.push_back(partial.value());
      EXPECT_TRUE(coordinator_->acceptPartialSum(partial.value()).isSuccess());
      EXPECT_EQ(coordinator_->acceptPartialSum(partial.value()).error(),
                ErrorCode::ProtocolDuplicateMessage);
    }
  }

  void requestVotes(const ValidationRequest &request, const PeerReadiness &,
                    std::chrono::steady_clock::time_point,
                    const std::function<void(const Vote &)> &deliver) override {
    last_request_ = request;
    for (size_t v = 0; v < validators_.size(); ++v) {
      ValidationRequest seen = request;
      if (byzantine_.count(static_cast<int>(v)) != 0) {
        seen.candidate.hash = std::string(64, '0');
      }
      auto vote = validators_[v]->validate(seen);
      ASSERT_TRUE(vote.isSuccess());
      sent_votes_.push_back(vote.value());
      deliver(vote.value());
    }
  }

  Result<AttributePublicParams> fetchPublicParams() override {
    return authority_->publicParams().attributes;
  }

  // Same recovery as the facility service: refresh keys once on an epoch
  // mismatch, then retry
  void publishModel(const EncryptedModel &model) override {
    published_.push_back(model);
    for (auto &facility : facilities_) {
      auto installed = facility->receiveModel(model);
      if (installed.error() == ErrorCode::CryptoKeyEpochMismatch) {
        auto refreshed = authority_->refreshKeys(facility->signedRefreshRequest());
        if (refreshed &&
            facility->acceptIdentity(refreshed.value(), authority_->publicKey())) {
          installed = facility->receiveModel(model);
        }
      }
      delivery_[facility->id()] = installed.error();
    }
  }

  std::unique_ptr<DeploymentConfig> config_;
  std::unique_ptr<TrustedAuthority> authority_;
  std::vector<std::unique_ptr<Facility>> facilities_;
  std::vector<std::unique_ptr<FogAggregator>> fogs_;
  std::vector<std::unique_ptr<Validator>> validators_;
  std::unique_ptr<RoundCoordinator> coordinator_;

  std::set<int> ready_facilities_;
  std::set<int> ready_fogs_;
  std::set<int> forwarding_fogs_;
  std::set<std::pair<int, int>> dropped_shares_; // (facility, fog) lost in transit
  bool registry_available_ = true;
  std::set<int> byzantine_;
  std::function<void()> on_readiness_;

  int announcements_ = 0;
  std::vector<std::string> announced_fogs_;
  std::optional<ValidationRequest> last_request_;
  std::vector<FogPartialSum> sent_partials_;
  std::vector<Vote> sent_votes_;
  std::vector<EncryptedModel> published_;
  std::map<std::string, ErrorCode> delivery_;
};

TEST_F(RoundCoordinatorTest, TwoOfThreeFogNodesFinalizeRound) {
  giveData(0, {0.1, 0.2, 0.3, 0.4});
  giveData(1, {0.3, 0.0, -0.3, 0.2});
  giveData(2, {0.2, 0.4, 0.0, 0.0});
  forwarding_fogs_ = {0, 2};

  auto result = coordinator_->runRound();
  ASSERT_TRUE(result.isSuccess()) << result.message();
  EXPECT_EQ(result.value(), 2u);

  auto model = coordinator_->globalModel();
  EXPECT_EQ(model.version, 2u);
  std::vector<double> expected = {0.2, 0.2, 0.0, 0.2};
  ASSERT_EQ(model.parameters.size(), expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_NEAR(model.parameters[i], expected[i], 1e-5);
  }

  auto status = coordinator_->status();
  EXPECT_EQ(status.round, 1u);
  EXPECT_EQ(status.state, "Idle");
  EXPECT_EQ(status.model_version, 2u);
  EXPECT_EQ(status.last_outcome, "finalized v2");
  EXPECT_EQ(coordinator_->state(), RoundState::Idle);
  EXPECT_FALSE(coordinator_->isRoundInFlight());

  ASSERT_EQ(published_.size(), 1u);
  EXPECT_EQ(published_[0].version, 2u);
  ASSERT_TRUE(coordinator_->encryptedModel().has_value());
  for (const auto &facility : facilities_) {
    EXPECT_EQ(delivery_[facility->id()], ErrorCode::Success) << facility->id();
    EXPECT_EQ(facility->model().version, 2u);
    EXPECT_NEAR(facility->model().parameters[0], 0.2, 1e-5);
  }
}

TEST_F(RoundCoordinatorTest, SinglePartialSumAbortsAndNextRoundProceeds) {
  giveData(0, {0.1, 0.1, 0.1, 0.1});
  giveData(1, {0.3, 0.3, 0.3, 0.3});
  forwarding_fogs_ = {1};

  auto aborted = coordinator_->runRound();
  EXPECT_EQ(aborted.error(), ErrorCode::RoundInsufficientPartialSums);
  EXPECT_EQ(coordinator_->globalModel().version, 1u);
  EXPECT_TRUE(published_.empty());
  EXPECT_EQ(coordinator_->status().round, 1u);
  EXPECT_EQ(coordinator_->state(), RoundState::Idle);
  EXPECT_EQ(coordinator_->status().last_outcome.rfind("aborted", 0), 0u);

  giveData(0, {0.1, 0.1, 0.1, 0.1});
  giveData(1, {0.3, 0.3, 0.3, 0.3});
  forwarding_fogs_ = {0, 1, 2};
  auto next = coordinator_->runRound();
  ASSERT_TRUE(next.isSuccess()) << next.message();
  EXPECT_EQ(next.value(), 2u);
  EXPECT_EQ(coordinator_->status().round, 2u);
  EXPECT_NEAR(coordinator_->globalModel().parameters[3], 0.2, 1e-5);
}

TEST_F(RoundCoordinatorTest, OneByzantineValidatorIsTolerated) {
  giveData(0, {0.1, 0.1, 0.1, 0.1});
  giveData(1, {0.1, 0.1, 0.1, 0.1});
  byzantine_ = {3};

  auto result = coordinator_->runRound();
  ASSERT_TRUE(result.isSuccess()) << result.message();
  EXPECT_EQ(coordinator_->globalModel().version, 2u);
}

TEST_F(RoundCoordinatorTest, TwoByzantineValidatorsBlockFinalization) {
  giveData(0, {0.1, 0.1, 0.1, 0.1});
  giveData(1, {0.1, 0.1, 0.1, 0.1});
  byzantine_ = {0, 2};

  auto result = coordinator_->runRound();
  EXPECT_EQ(result.error(), ErrorCode::ValidationRejected);
  EXPECT_EQ(coordinator_->globalModel().version, 1u);
  EXPECT_TRUE(published_.empty());
  EXPECT_FALSE(coordinator_->encryptedModel().has_value());
}

TEST_F(RoundCoordinatorTest, LateMessagesAfterFinalizationAreStale) {
  giveData(0, {0.1, 0.1, 0.1, 0.1});
  giveData(1, {0.1, 0.1, 0.1, 0.1});
  ASSERT_TRUE(coordinator_->runRound().isSuccess());
  ASSERT_FALSE(sent_partials_.empty());
  ASSERT_FALSE(sent_votes_.empty());

  EXPECT_EQ(coordinator_->acceptPartialSum(sent_partials_.back()).error(),
            ErrorCode::ProtocolStaleMessage);
  EXPECT_EQ(coordinator_->acceptVote(sent_votes_.front()).error(),
            ErrorCode::ProtocolStaleMessage);
}

TEST_F(RoundCoordinatorTest, TooFewReadyFacilitiesAbortBeforeAnnouncing) {
  ready_facilities_ = {0};
  giveData(0, {0.1, 0.1, 0.1, 0.1});

  auto result = coordinator_->runRound();
  EXPECT_EQ(result.error(), ErrorCode::RoundInsufficientParticipants);
  EXPECT_EQ(announcements_, 0);
  EXPECT_EQ(coordinator_->state(), RoundState::Idle);
  EXPECT_EQ(coordinator_->globalModel().version, 1u);
}

TEST_F(RoundCoordinatorTest, ConcurrentStartIsRefused) {
  giveData(0, {0.1, 0.1, 0.1, 0.1});
  giveData(1, {0.1, 0.1, 0.1, 0.1});
  ErrorCode concurrent = ErrorCode::Success;
  on_readiness_ = [&] {
    concurrent = std::async(std::launch::async, [this] {
                   return coordinator_->runRound().error();
                 }).get();
  };

  auto result = coordinator_->runRound();
  EXPECT_EQ(concurrent, ErrorCode::RoundInProgress);
  ASSERT_TRUE(result.isSuccess()) << result.message();
  EXPECT_EQ(coordinator_->status().round, 1u);
}

TEST_F(RoundCoordinatorTest, RevokedFacilityMissesLaterModels) {
  giveData(0, {0.1, 0.1, 0.1, 0.1});
  giveData(3, {0.1, 0.1, 0.1, 0.1});
  ASSERT_TRUE(coordinator_->runRound().isSuccess());
  EXPECT_EQ(facilities_[3]->model().version, 2u);

  // Still answering readiness and holding data, but no longer registered
  ASSERT_TRUE(authority_->revoke("facility-3").isSuccess());
  giveData(0, {0.1, 0.1, 0.1, 0.1});
  giveData(1, {0.1, 0.1, 0.1, 0.1});
  giveData(3, {0.1, 0.1, 0.1, 0.1});
  ASSERT_TRUE(coordinator_->runRound().isSuccess());

  auto participants = coordinator_->status().participants;
  EXPECT_EQ(std::count(participants.begin(), participants.end(), "facility-3"), 0);
  EXPECT_FALSE(facilities_[3]->ledger().hasSpent(2));

  EXPECT_EQ(published_.back().payload.epoch, 2u);
  EXPECT_EQ(delivery_["facility-0"], ErrorCode::Success);
  EXPECT_EQ(facilities_[0]->model().version, 3u);
  EXPECT_EQ(delivery_["facility-3"], ErrorCode::CryptoKeyEpochMismatch);
  EXPECT_EQ(facilities_[3]->model().version, 2u);
}

TEST_F(RoundCoordinatorTest, PrivatizedRoundFinalizes) {
  build({{"dp_enabled", true}});
  giveData(0, {0.1, 0.1, 0.1, 0.1});
  giveData(1, {0.1, 0.1, 0.1, 0.1});
  giveData(2, {0.1, 0.1, 0.1, 0.1});

  auto result = coordinator_->runRound();
  ASSERT_TRUE(result.isSuccess()) << result.message();
  for (int k = 0; k < 3; ++k) {
    EXPECT_TRUE(facilities_[k]->ledger().hasSpent(1));
  }
  EXPECT_FALSE(facilities_[3]->ledger().hasSpent(1));
}

TEST_F(RoundCoordinatorTest, UnreachableRegistryAbortsBeforeAnnouncing) {
  giveData(0, {0.1, 0.1, 0.1, 0.1});
  giveData(1, {0.1, 0.1, 0.1, 0.1});
  registry_available_ = false;

  auto result = coordinator_->runRound();
  EXPECT_EQ(result.error(), ErrorCode::RoundAborted);
  EXPECT_EQ(announcements_, 0);
  EXPECT_EQ(coordinator_->globalModel().version, 1u);
}

TEST_F(RoundCoordinatorTest, UnreadyFogIsLeftOutOfAnnouncement) {
  giveData(0, {0.1, 0.2, 0.3, 0.4});
  giveData(1, {0.3, 0.0, -0.3, 0.2});
  ready_fogs_ = {1, 2};

  auto result = coordinator_->runRound();
  ASSERT_TRUE(result.isSuccess()) << result.message();
  EXPECT_EQ(announced_fogs_, (std::vector<std::string>{"fog-1", "fog-2"}));
  EXPECT_FALSE(fogs_[0]->currentRound().has_value());
  EXPECT_NEAR(coordinator_->globalModel().parameters[0], 0.2, 1e-5);
  EXPECT_NEAR(coordinator_->globalModel().parameters[3], 0.3, 1e-5);
}

TEST_F(RoundCoordinatorTest, LostShareNarrowsOnlyOneFogsParticipantSet) {
  giveData(0, {0.1, 0.1, 0.1, 0.1});
  giveData(1, {0.2, 0.2, 0.2, 0.2});
  giveData(2, {0.6, 0.6, 0.6, 0.6});
  dropped_shares_ = {{2, 0}};

  auto result = coordinator_->runRound();
  ASSERT_TRUE(result.isSuccess()) << result.message();
  ASSERT_TRUE(last_request_.has_value());
  EXPECT_EQ(last_request_->candidate.participants,
            (std::vector<std::string>{"facility-0", "facility-1", "facility-2"}));
  EXPECT_EQ(coordinator_->status().participants.size(), 3u);
  EXPECT_NEAR(coordinator_->globalModel().parameters[0], 0.3, 1e-5);
}

TEST_F(RoundCoordinatorTest, PartialSumsOverDifferentSetsAreNeverMixed) {
  giveData(0, {0.1, 0.1, 0.1, 0.1});
  giveData(1, {0.2, 0.2, 0.2, 0.2});
  giveData(2, {0.6, 0.6, 0.6, 0.6});
  dropped_shares_ = {{2, 0}};
  forwarding_fogs_ = {0, 1};

  auto result = coordinator_->runRound();
  EXPECT_EQ(result.error(), ErrorCode::RoundInsufficientPartialSums);
  EXPECT_EQ(coordinator_->globalModel().version, 1u);
  EXPECT_TRUE(published_.empty());
}
