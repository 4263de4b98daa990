#include "config/deployment_config.hpp"
#include <gtest/gtest.h>

using namespace hierfed;

class DeploymentConfigTest : public ::testing::Test {};

TEST_F(DeploymentConfigTest, DefaultsDescribeReferenceDeployment) {
  auto config = DeploymentConfig::fromJson(nlohmann::json::object());
  EXPECT_EQ(config.registry.facilities.size(), 4u);
  EXPECT_EQ(config.fogCount(), 3);
  EXPECT_EQ(config.validatorCount(), 4);
  EXPECT_EQ(config.reconstruction_threshold, 2);
  EXPECT_EQ(config.registry.authority.port, 7600);
  EXPECT_EQ(config.registry.fog_nodes[2].port, 8602);
  EXPECT_EQ(config.registry.facilities[1].id, "facility-1");
  EXPECT_TRUE(config.dp_enabled);
  EXPECT_EQ(config.initial_parameters.size(), 4u);
}

TEST_F(DeploymentConfigTest, VoteQuorumIsTwoThirdsRoundedUp) {
  EXPECT_EQ(DeploymentConfig::fromJson(nlohmann::json::object()).voteQuorum(), 3);
  auto seven = DeploymentConfig::fromJson(
      {{"registry", {{"validator_count", 7}}}, {"max_byzantine", 2}});
  EXPECT_EQ(seven.voteQuorum(), 5);
  auto one = DeploymentConfig::fromJson(
      {{"registry", {{"validator_count", 1}}}, {"max_byzantine", 0}});
  EXPECT_EQ(one.voteQuorum(), 1);
}

TEST_F(DeploymentConfigTest, RegistryCountsExpandToPortLayout) {
  auto config = DeploymentConfig::fromJson(
      {{"registry", {{"facility_count", 6}, {"fog_count", 5}, {"host", "10.0.0.1"}}},
       {"reconstruction_threshold", 3}});
  EXPECT_EQ(config.registry.facilities.size(), 6u);
  EXPECT_EQ(config.registry.facilities[5].port, 9605);
  EXPECT_EQ(config.registry.fog_nodes[4].host, "10.0.0.1");
  EXPECT_TRUE(config.registry.findFacility("facility-5").has_value());
  EXPECT_FALSE(config.registry.findFacility("facility-6").has_value());
}

TEST_F(DeploymentConfigTest, InitialParametersSetDimension) {
  auto config = DeploymentConfig::fromJson({{"initial_parameters", {0.5, 1.5}}});
  EXPECT_EQ(config.model_dimension, 2);
}

TEST_F(DeploymentConfigTest, RejectsInconsistentSettings) {
  EXPECT_THROW(DeploymentConfig::fromJson({{"reconstruction_threshold", 4}}),
               std::invalid_argument);
  EXPECT_THROW(DeploymentConfig::fromJson({{"min_participants", 5}}),
               std::invalid_argument);
  EXPECT_THROW(DeploymentConfig::fromJson({{"max_byzantine", 2}}),
               std::invalid_argument);
  EXPECT_THROW(DeploymentConfig::fromJson({{"dp_delta", 1.5}}),
               std::invalid_argument);
  EXPECT_THROW(DeploymentConfig::fromJson(
                   {{"model_dimension", 3}, {"initial_parameters", {1.0}}}),
               std::invalid_argument);
  EXPECT_THROW(DeploymentConfig::fromJson({{"attribute_universe", {"clinic"}}}),
               std::invalid_argument);
  EXPECT_THROW(DeploymentConfig::fromJson({{"use_tls", true}}),
               std::invalid_argument);
}

TEST_F(DeploymentConfigTest, DisabledPrivacySkipsNoiseChecks) {
  EXPECT_NO_THROW(
      DeploymentConfig::fromJson({{"dp_enabled", false}, {"dp_epsilon", 0.0}}));
}

TEST_F(DeploymentConfigTest, FacilityCountStaysWithinExactFieldSums) {
  EXPECT_NO_THROW(
      DeploymentConfig::fromJson({{"registry", {{"facility_count", 1024}}}}));
  EXPECT_THROW(
      DeploymentConfig::fromJson({{"registry", {{"facility_count", 1025}}}}),
      std::invalid_argument);
}

TEST_F(DeploymentConfigTest, BroadcastAndChallengeTimeouts) {
  auto config = DeploymentConfig::fromJson(nlohmann::json::object());
  EXPECT_EQ(config.broadcast_timeout_ms, 5000);
  EXPECT_EQ(config.challenge_ttl_ms, 60000);
  EXPECT_THROW(DeploymentConfig::fromJson({{"broadcast_timeout_ms", 0}}),
               std::invalid_argument);
  EXPECT_THROW(DeploymentConfig::fromJson({{"challenge_ttl_ms", 0}}),
               std::invalid_argument);
}
