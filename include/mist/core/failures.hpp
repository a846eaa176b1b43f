#pragma once
#include <string>
#include <string_view>
namespace mist::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class ProtocolFailureType {
    Generic,
    KeyGeneration,
    DeriveKey,
    InvalidInput,
    Handshake,
    Decode,
    Encode,
    InvalidState,
    ReplayAttack,
    SignatureInvalid,
    DecryptionFailed,
    AlreadyEstablished,
    NoSession,
    UnknownSender,
    RoleOrderingViolation,
    SignalingUnavailable,
    TransportUnavailable,
    Storage,
    Expired
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure Handshake(std::string msg) {
        return {ProtocolFailureType::Handshake, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure ReplayAttack(std::string msg) {
        return {ProtocolFailureType::ReplayAttack, std::move(msg)};
    }
    static ProtocolFailure SignatureInvalid(std::string msg) {
        return {ProtocolFailureType::SignatureInvalid, std::move(msg)};
    }
    static ProtocolFailure DecryptionFailed(std::string msg) {
        return {ProtocolFailureType::DecryptionFailed, std::move(msg)};
    }
    static ProtocolFailure AlreadyEstablished(std::string msg) {
        return {ProtocolFailureType::AlreadyEstablished, std::move(msg)};
    }
    static ProtocolFailure NoSession(std::string msg) {
        return {ProtocolFailureType::NoSession, std::move(msg)};
    }
    static ProtocolFailure UnknownSender(std::string msg) {
        return {ProtocolFailureType::UnknownSender, std::move(msg)};
    }
    static ProtocolFailure RoleOrderingViolation(std::string msg) {
        return {ProtocolFailureType::RoleOrderingViolation, std::move(msg)};
    }
    static ProtocolFailure SignalingUnavailable(std::string msg) {
        return {ProtocolFailureType::SignalingUnavailable, std::move(msg)};
    }
    static ProtocolFailure TransportUnavailable(std::string msg) {
        return {ProtocolFailureType::TransportUnavailable, std::move(msg)};
    }
    static ProtocolFailure Storage(std::string msg) {
        return {ProtocolFailureType::Storage, std::move(msg)};
    }
    static ProtocolFailure Expired(std::string msg) {
        return {ProtocolFailureType::Expired, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    /// True for failures the caller should retry later rather than treat as a rejection.
    [[nodiscard]] bool IsRetryable() const noexcept {
        return type == ProtocolFailureType::SignalingUnavailable ||
               type == ProtocolFailureType::TransportUnavailable;
    }
};

[[nodiscard]] constexpr std::string_view FailureTypeName(const ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::Generic: return "Generic";
        case ProtocolFailureType::KeyGeneration: return "KeyGeneration";
        case ProtocolFailureType::DeriveKey: return "DeriveKey";
        case ProtocolFailureType::InvalidInput: return "InvalidInput";
        case ProtocolFailureType::Handshake: return "Handshake";
        case ProtocolFailureType::Decode: return "Decode";
        case ProtocolFailureType::Encode: return "Encode";
        case ProtocolFailureType::InvalidState: return "InvalidState";
        case ProtocolFailureType::ReplayAttack: return "ReplayAttack";
        case ProtocolFailureType::SignatureInvalid: return "SignatureInvalid";
        case ProtocolFailureType::DecryptionFailed: return "DecryptionFailed";
        case ProtocolFailureType::AlreadyEstablished: return "AlreadyEstablished";
        case ProtocolFailureType::NoSession: return "NoSession";
        case ProtocolFailureType::UnknownSender: return "UnknownSender";
        case ProtocolFailureType::RoleOrderingViolation: return "RoleOrderingViolation";
        case ProtocolFailureType::SignalingUnavailable: return "SignalingUnavailable";
        case ProtocolFailureType::TransportUnavailable: return "TransportUnavailable";
        case ProtocolFailureType::Storage: return "Storage";
        case ProtocolFailureType::Expired: return "Expired";
    }
    return "Unknown";
}
}
