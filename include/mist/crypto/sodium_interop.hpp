#pragma once

#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace mist::protocol::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium cryptographic operations
 *
 * Provides RAII wrappers and safe interfaces to libsodium functionality.
 * Every fallible call returns a Result; nothing here throws across the API.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Uses a volatile loop for small buffers and sodium_memzero for large ones.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /// Overload for temporaries held behind const spans.
    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Key Generation
    // ========================================================================

    /**
     * @brief Generate X25519 (Curve25519) key pair
     *
     * The secret key is returned inside a SecureMemoryHandle.
     *
     * @param key_purpose Description for error messages
     * @return Ok((secret_handle, public_key_bytes)) or Err
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Generate Ed25519 (EdDSA) key pair
     *
     * @return Ok((secret_key, public_key)) or Err
     */
    static Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure>
    GenerateEd25519KeyPair();

    /// Birational map of an Ed25519 public key onto Curve25519.
    static Result<std::vector<uint8_t>, ProtocolFailure> ConvertEd25519PublicToX25519(
        std::span<const uint8_t> ed25519_public);

    /// Birational map of an Ed25519 secret key onto a Curve25519 scalar.
    static Result<std::vector<uint8_t>, ProtocolFailure> ConvertEd25519SecretToX25519(
        std::span<const uint8_t> ed25519_secret);

    // ========================================================================
    // Signatures, DH and MAC
    // ========================================================================

    static Result<std::vector<uint8_t>, ProtocolFailure> SignDetached(
        std::span<const uint8_t> ed25519_secret,
        std::span<const uint8_t> message);

    [[nodiscard]] static bool VerifyDetached(
        std::span<const uint8_t> ed25519_public,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);

    /**
     * @brief X25519 scalar multiplication
     *
     * Fails with a Handshake failure when the peer key is a low-order point
     * (libsodium reports an all-zero shared secret).
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> ComputeX25519(
        std::span<const uint8_t> private_key,
        std::span<const uint8_t> public_key,
        std::string_view label);

    static std::vector<uint8_t> HmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /// Uniform value in [0, upper_bound).
    static uint32_t GenerateRandomUInt32(uint32_t upper_bound);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, locked memory using sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace mist::protocol::crypto
