#pragma once
#include "protocol/messages.hpp"
#include <optional>
#include <string>

namespace hierfed {

std::optional<ChallengeResponse> parseChallengeResponse(const std::string &body);
std::optional<RegistrationRequest> parseRegistrationRequest(const std::string &body);
std::optional<Identity> parseIdentity(const std::string &body);
std::optional<RefreshKeysRequest> parseRefreshKeysRequest(const std::string &body);
std::optional<RevokeRequest> parseRevokeRequest(const std::string &body);
std::optional<PublicParams> parsePublicParams(const std::string &body);
std::optional<FacilityList> parseFacilityList(const std::string &body);
std::optional<RoundAnnouncement> parseRoundAnnouncement(const std::string &body);
std::optional<ShareMessage> parseShareMessage(const std::string &body);
std::optional<FogPartialSum> parseFogPartialSum(const std::string &body);
std::optional<ValidationRequest> parseValidationRequest(const std::string &body);
std::optional<Vote> parseVote(const std::string &body);
std::optional<EncryptedModel> parseEncryptedModel(const std::string &body);
std::optional<ReadyResponse> parseReadyResponse(const std::string &body);

// Little-endian IEEE-754 float64 array; nullopt if the size is not a multiple of 8
std::optional<std::vector<double>> parseFloat64Payload(const std::string &body);
std::string encodeFloat64Payload(const std::vector<double> &values);

} // namespace hierfed
