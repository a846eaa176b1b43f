#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace mist::protocol {

inline constexpr uint32_t kProtocolVersion = 1;
inline constexpr uint32_t kSessionRecordVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;
inline constexpr size_t kEd25519PublicKeyBytes = 32;
inline constexpr size_t kEd25519SecretKeyBytes = 64;
inline constexpr size_t kEd25519SignatureBytes = 64;

inline constexpr size_t kSharedSecretBytes = 32;
inline constexpr size_t kRootKeyBytes = 32;
inline constexpr size_t kChainKeyBytes = 32;
inline constexpr size_t kMessageKeyBytes = 32;
inline constexpr size_t kHmacBytes = 32;
inline constexpr size_t kKdfRootOutputBytes = kRootKeyBytes + kChainKeyBytes;

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

inline constexpr uint32_t kMaxSkippedMessageKeys = 1000;
inline constexpr uint32_t kFirstSignedPreKeyId = 1;
inline constexpr uint32_t kDefaultOneTimeKeyCount = 10;
inline constexpr uint32_t kMaxOneTimeKeyCount = 1000;
inline constexpr size_t kMaxPlaintextBytes = 1024 * 1024;

// Chain KDF input constants (HMAC-SHA256 over a single byte)
inline constexpr uint8_t kMessageKeySeed = 0x01;
inline constexpr uint8_t kChainKeySeed = 0x03;

// X3DH prepends 32 bytes of 0xFF to the concatenated DH outputs
inline constexpr uint8_t kX3dhPadByte = 0xFF;
inline constexpr size_t kX3dhPadBytes = 32;

inline constexpr std::string_view kX3dhInfo = "Mist-X3DH";
inline constexpr std::string_view kRatchetInfo = "Mist-Ratchet";
inline constexpr std::string_view kStateHmacInfo = "Mist-State-HMAC";
inline constexpr std::string_view kAssociatedDataLabel = "Mist-Ratchet-AD";

// Key Derivation Purpose Strings
inline constexpr std::string_view kPurposeSignedPreKey = "signed-pre-key";
inline constexpr std::string_view kPurposeOneTimePreKey = "one-time-pre-key";
inline constexpr std::string_view kPurposeEphemeralX25519 = "ephemeral-x25519";
inline constexpr std::string_view kPurposeRatchetX25519 = "ratchet-x25519";

}  // namespace mist::protocol
