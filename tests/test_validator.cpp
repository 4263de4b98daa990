#include "crypto/signature.hpp"
#include "test_support.hpp"
#include "validator/validator.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>

using namespace hierfed;
using namespace hierfed::testing;

class ValidatorTest : public ::testing::Test {
protected:
  ValidationRequest honest(uint64_t round) const {
    ValidationRequest request;
    request.candidate.round = round;
    request.candidate.base_version = round;
    request.candidate.participants = {"facility-0", "facility-1", "facility-2"};
    request.candidate.parameters = {0.1, 0.2, -0.3, 0.4};
    request.candidate.hash = candidateHash(request.candidate);
    request.base_parameters = {0.0, 0.0, 0.0, 0.0};
    return request;
  }

  // Edits the candidate and keeps its hash consistent
  ValidationRequest rehashed(ValidationRequest request) const {
    request.candidate.hash = candidateHash(request.candidate);
    return request;
  }

  DeploymentConfig config_ = testConfig({{"max_abs_parameter", 10.0},
                                         {"max_update_norm", 5.0}});
  Validator validator_{config_, 0};
};

TEST_F(ValidatorTest, AcceptsHonestCandidateWithSignedVote) {
  auto vote = validator_.validate(honest(1));
  ASSERT_TRUE(vote.isSuccess());
  EXPECT_TRUE(vote.value().accept);
  EXPECT_EQ(vote.value().reason, "ok");
  EXPECT_EQ(vote.value().validator_id, "validator-0");
  EXPECT_EQ(vote.value().candidate_hash, honest(1).candidate.hash);
  EXPECT_TRUE(SignatureUtils::verifySignature(voteSigningMessage(vote.value()),
                                              vote.value().signature,
                                              validator_.publicKey()));
}

TEST_F(ValidatorTest, ChecksShape) {
  auto request = honest(1);
  request.candidate.parameters.pop_back();
  EXPECT_EQ(validator_.check(rehashed(request)).rfind("shape", 0), 0u);

  request = honest(1);
  request.base_parameters.push_back(0.0);
  EXPECT_EQ(validator_.check(request).rfind("shape", 0), 0u);
}

TEST_F(ValidatorTest, ChecksParticipants) {
  auto request = honest(1);
  request.candidate.participants = {"facility-0", "facility-0"};
  EXPECT_EQ(validator_.check(rehashed(request)).rfind("participants", 0), 0u);

  request.candidate.participants = {"facility-0"};
  EXPECT_EQ(validator_.check(rehashed(request)).rfind("participants", 0), 0u);
}

TEST_F(ValidatorTest, ChecksFinitenessMagnitudeAndDrift) {
  auto request = honest(1);
  request.candidate.parameters[2] = std::numeric_limits<double>::quiet_NaN();
  EXPECT_EQ(validator_.check(rehashed(request)).rfind("finiteness", 0), 0u);

  request = honest(1);
  request.candidate.parameters[0] = 11.0;
  request.base_parameters[0] = 11.0;
  EXPECT_EQ(validator_.check(rehashed(request)).rfind("magnitude", 0), 0u);

  request = honest(1);
  request.candidate.parameters = {4.0, 4.0, 0.0, 0.0};
  EXPECT_EQ(validator_.check(rehashed(request)).rfind("drift", 0), 0u);
}

TEST_F(ValidatorTest, ChecksHash) {
  auto request = honest(1);
  request.candidate.parameters[0] = 0.11;
  EXPECT_EQ(validator_.check(request).rfind("hash", 0), 0u);

  auto vote = validator_.validate(request);
  ASSERT_TRUE(vote.isSuccess());
  EXPECT_FALSE(vote.value().accept);
}

TEST_F(ValidatorTest, VotesOncePerRound) {
  auto first = validator_.validate(honest(1));
  ASSERT_TRUE(first.isSuccess());

  auto repeat = validator_.validate(honest(1));
  ASSERT_TRUE(repeat.isSuccess());
  EXPECT_EQ(repeat.value().signature, first.value().signature);

  auto request = honest(1);
  request.candidate.parameters[0] = 0.5;
  EXPECT_EQ(validator_.validate(rehashed(request)).error(),
            ErrorCode::ConsensusAlreadyVoted);
  EXPECT_EQ(validator_.votesCast(), 1u);
}

TEST_F(ValidatorTest, OlderRoundsAreStale) {
  ASSERT_TRUE(validator_.validate(honest(5)).isSuccess());
  EXPECT_EQ(validator_.validate(honest(4)).error(), ErrorCode::ProtocolStaleMessage);
  EXPECT_TRUE(validator_.validate(honest(6)).isSuccess());
}
