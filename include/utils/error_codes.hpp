#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace hierfed {

// Error categories with distinct ranges
enum class ErrorCategory : uint16_t {
    None = 0,
    Network = 1000,
    Crypto = 2000,
    Protocol = 3000,
    Aggregation = 4000,
    Registration = 5000,
    Round = 6000,
    Consensus = 7000
};

// Structured error codes
enum class ErrorCode : uint32_t {
    // Success
    Success = 0,

    // Network errors (1000-1999)
    NetworkConnectionFailed = 1001,
    NetworkTimeout = 1002,
    NetworkInvalidResponse = 1003,

    // Crypto errors (2000-2999)
    CryptoInvalidSignature = 2001,
    CryptoDecryptionFailed = 2005,
    CryptoPolicyNotSatisfied = 2006,
    CryptoInvalidPolicy = 2007,
    CryptoKeyEpochMismatch = 2008,

    // Protocol errors (3000-3999)
    ProtocolInvalidMessage = 3001,
    ProtocolStaleMessage = 3002,
    ProtocolDuplicateMessage = 3003,
    ProtocolUnknownSender = 3004,
    ProtocolNotReady = 3005,

    // Aggregation errors (4000-4999)
    AggregationInvalidData = 4001,
    AggregationDimensionMismatch = 4002,
    AggregationInsufficientShares = 4003,
    AggregationValueOutOfRange = 4004,
    AggregationPrivacyBudgetSpent = 4005,

    // Registration errors (5000-5999)
    RegistrationRejected = 5001,
    RegistrationInvalidProof = 5002,
    RegistrationProofReused = 5003,
    RegistrationDuplicateFacility = 5004,
    RegistrationUnknownChallenge = 5005,
    RegistrationInvalidAttributes = 5006,
    RegistrationRevoked = 5007,
    RegistrationNotFound = 5008,

    // Round errors (6000-6999)
    RoundAborted = 6001,
    RoundInProgress = 6002,
    RoundInsufficientParticipants = 6003,
    RoundInsufficientPartialSums = 6004,
    RoundNotActive = 6005,

    // Consensus errors (7000-7999)
    ValidationRejected = 7001,
    ConsensusInsufficientVotes = 7002,
    ConsensusAlreadyVoted = 7003
};

// Result type for operations that can fail
template<typename T>
class Result {
public:
    Result(T value) noexcept : value_(std::move(value)), code_(ErrorCode::Success) {}
    Result(ErrorCode code) noexcept : code_(code) {}
    Result(ErrorCode code, std::string_view message)
        : code_(code), message_(message) {}

    bool isSuccess() const noexcept { return code_ == ErrorCode::Success; }
    bool isError() const noexcept { return code_ != ErrorCode::Success; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    T&& moveValue() noexcept { return std::move(value_); }

    ErrorCode error() const noexcept { return code_; }
    std::string_view message() const noexcept { return message_; }

    operator bool() const noexcept { return isSuccess(); }

private:
    T value_{};
    ErrorCode code_;
    std::string message_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() noexcept : code_(ErrorCode::Success) {}
    Result(ErrorCode code) noexcept : code_(code) {}
    Result(ErrorCode code, std::string_view message)
        : code_(code), message_(message) {}

    bool isSuccess() const noexcept { return code_ == ErrorCode::Success; }
    bool isError() const noexcept { return code_ != ErrorCode::Success; }

    ErrorCode error() const noexcept { return code_; }
    std::string_view message() const noexcept { return message_; }

    operator bool() const noexcept { return isSuccess(); }

private:
    ErrorCode code_;
    std::string message_;
};

// Helper function to get error category
inline ErrorCategory getErrorCategory(ErrorCode code) noexcept {
    uint32_t value = static_cast<uint32_t>(code);
    if (value == 0) return ErrorCategory::None;
    if (value >= 1000 && value < 2000) return ErrorCategory::Network;
    if (value >= 2000 && value < 3000) return ErrorCategory::Crypto;
    if (value >= 3000 && value < 4000) return ErrorCategory::Protocol;
    if (value >= 4000 && value < 5000) return ErrorCategory::Aggregation;
    if (value >= 5000 && value < 6000) return ErrorCategory::Registration;
    if (value >= 6000 && value < 7000) return ErrorCategory::Round;
    if (value >= 7000 && value < 8000) return ErrorCategory::Consensus;
    return ErrorCategory::None;
}

// Convert error code to string
inline std::string_view errorToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";

        // Network errors
        case ErrorCode::NetworkConnectionFailed: return "Network connection failed";
        case ErrorCode::NetworkTimeout: return "Network timeout";
        case ErrorCode::NetworkInvalidResponse: return "Invalid network response";

        // Crypto errors
        case ErrorCode::CryptoInvalidSignature: return "Invalid signature";
        case ErrorCode::CryptoDecryptionFailed: return "Decryption failed";
        case ErrorCode::CryptoPolicyNotSatisfied: return "Attributes do not satisfy access policy";
        case ErrorCode::CryptoInvalidPolicy: return "Invalid access policy";
        case ErrorCode::CryptoKeyEpochMismatch: return "Attribute key epoch mismatch";

        // Protocol errors
        case ErrorCode::ProtocolInvalidMessage: return "Invalid protocol message";
        case ErrorCode::ProtocolStaleMessage: return "Stale message";
        case ErrorCode::ProtocolDuplicateMessage: return "Duplicate message";
        case ErrorCode::ProtocolUnknownSender: return "Unknown sender";
        case ErrorCode::ProtocolNotReady: return "Peer not ready";

        // Aggregation errors
        case ErrorCode::AggregationInvalidData: return "Invalid aggregation data";
        case ErrorCode::AggregationDimensionMismatch: return "Vector dimension mismatch";
        case ErrorCode::AggregationInsufficientShares: return "Insufficient shares";
        case ErrorCode::AggregationValueOutOfRange: return "Value outside fixed-point range";
        case ErrorCode::AggregationPrivacyBudgetSpent: return "Privacy budget already spent for round";

        // Registration errors
        case ErrorCode::RegistrationRejected: return "Registration rejected";
        case ErrorCode::RegistrationInvalidProof: return "Invalid proof of work";
        case ErrorCode::RegistrationProofReused: return "Proof of work reused";
        case ErrorCode::RegistrationDuplicateFacility: return "Facility already registered";
        case ErrorCode::RegistrationUnknownChallenge: return "Unknown challenge";
        case ErrorCode::RegistrationInvalidAttributes: return "Invalid facility attributes";
        case ErrorCode::RegistrationRevoked: return "Facility revoked";
        case ErrorCode::RegistrationNotFound: return "Facility not found";

        // Round errors
        case ErrorCode::RoundAborted: return "Round aborted";
        case ErrorCode::RoundInProgress: return "Round already in progress";
        case ErrorCode::RoundInsufficientParticipants: return "Insufficient participants";
        case ErrorCode::RoundInsufficientPartialSums: return "Insufficient fog partial sums";
        case ErrorCode::RoundNotActive: return "No active round";

        // Consensus errors
        case ErrorCode::ValidationRejected: return "Validation rejected by committee";
        case ErrorCode::ConsensusInsufficientVotes: return "Insufficient votes";
        case ErrorCode::ConsensusAlreadyVoted: return "Validator already voted";

        default: return "Unknown error";
    }
}

// HTTP status used by every service when a request fails with `code`
inline int httpStatusFor(ErrorCode code) noexcept {
    switch (getErrorCategory(code)) {
        case ErrorCategory::None: return 200;
        case ErrorCategory::Crypto:
            return code == ErrorCode::CryptoInvalidSignature ? 401 : 400;
        case ErrorCategory::Registration:
            return code == ErrorCode::RegistrationNotFound ? 404 : 403;
        case ErrorCategory::Protocol:
            if (code == ErrorCode::ProtocolStaleMessage ||
                code == ErrorCode::ProtocolDuplicateMessage) return 409;
            if (code == ErrorCode::ProtocolNotReady) return 503;
            if (code == ErrorCode::ProtocolUnknownSender) return 403;
            return 400;
        case ErrorCategory::Round:
            return code == ErrorCode::RoundInProgress ? 409 : 422;
        case ErrorCategory::Consensus:
            return code == ErrorCode::ConsensusAlreadyVoted ? 409 : 422;
        case ErrorCategory::Network: return 502;
        default: return 500;
    }
}

} // namespace hierfed
