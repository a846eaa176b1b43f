#include "mist/crypto/sodium_interop.hpp"
#include "mist/crypto/sodium_secure_memory_handle.hpp"
#include "mist/protocol/constants.hpp"

#include <string>

namespace mist::protocol::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });
    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("sodium_init() failed"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("libsodium is not initialized"));
    }
    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(MAX_BUFFER_SIZE)));
    }
    if (buffer.size() <= SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<const uint8_t> buffer) {
    return SecureWipe(std::span<uint8_t>(
        const_cast<uint8_t*>(buffer.data()),
        buffer.size()));
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    return Result<bool, SodiumFailure>::Ok(sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

// ============================================================================
// Key Generation
// ============================================================================

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;

    std::vector<uint8_t> sk_bytes = GetRandomBytes(kX25519PrivateKeyBytes);
    std::vector<uint8_t> pk_bytes(kX25519PublicKeyBytes);
    if (crypto_scalarmult_base(pk_bytes.data(), sk_bytes.data()) != 0) {
        auto _wipe = SecureWipe(std::span<uint8_t>(sk_bytes));
        (void) _wipe;
        return KeyPairResult::Err(ProtocolFailure::DeriveKey(
            "Failed to derive " + std::string(key_purpose) + " public key"));
    }

    auto handle_result = SecureMemoryHandle::FromBytes(sk_bytes);
    auto _wipe = SecureWipe(std::span<uint8_t>(sk_bytes));
    (void) _wipe;
    if (handle_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return KeyPairResult::Ok(std::make_pair(std::move(handle_result).Unwrap(), std::move(pk_bytes)));
}

Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateEd25519KeyPair() {
    using KeyPairResult = Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure>;

    std::vector<uint8_t> pk(kEd25519PublicKeyBytes);
    std::vector<uint8_t> sk(kEd25519SecretKeyBytes);
    if (crypto_sign_keypair(pk.data(), sk.data()) != 0) {
        auto _wipe = SecureWipe(std::span<uint8_t>(sk));
        (void) _wipe;
        return KeyPairResult::Err(
            ProtocolFailure::KeyGeneration("Failed to generate Ed25519 key pair"));
    }
    return KeyPairResult::Ok(std::make_pair(std::move(sk), std::move(pk)));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::ConvertEd25519PublicToX25519(
    std::span<const uint8_t> ed25519_public) {
    if (ed25519_public.size() != kEd25519PublicKeyBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "Ed25519 public key must be " + std::to_string(kEd25519PublicKeyBytes) + " bytes"));
    }
    std::vector<uint8_t> x25519_public(kX25519PublicKeyBytes);
    if (crypto_sign_ed25519_pk_to_curve25519(x25519_public.data(), ed25519_public.data()) != 0) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Ed25519 public key is not a valid curve point"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(x25519_public));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::ConvertEd25519SecretToX25519(
    std::span<const uint8_t> ed25519_secret) {
    if (ed25519_secret.size() != kEd25519SecretKeyBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Invalid Ed25519 secret key size"));
    }
    std::vector<uint8_t> x25519_secret(kX25519PrivateKeyBytes);
    if (crypto_sign_ed25519_sk_to_curve25519(x25519_secret.data(), ed25519_secret.data()) != 0) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("Failed to convert Ed25519 secret key"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(x25519_secret));
}

// ============================================================================
// Signatures, DH and MAC
// ============================================================================

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::SignDetached(
    std::span<const uint8_t> ed25519_secret,
    std::span<const uint8_t> message) {
    if (ed25519_secret.size() != kEd25519SecretKeyBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Invalid Ed25519 secret key size"));
    }
    std::vector<uint8_t> signature(kEd25519SignatureBytes);
    if (crypto_sign_detached(signature.data(), nullptr,
                             message.data(), message.size(),
                             ed25519_secret.data()) != 0) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic("Ed25519 signing failed"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(signature));
}

bool SodiumInterop::VerifyDetached(
    std::span<const uint8_t> ed25519_public,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {
    if (ed25519_public.size() != kEd25519PublicKeyBytes ||
        signature.size() != kEd25519SignatureBytes) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(),
                                       message.data(), message.size(),
                                       ed25519_public.data()) == 0;
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::ComputeX25519(
    std::span<const uint8_t> private_key,
    std::span<const uint8_t> public_key,
    std::string_view label) {
    if (private_key.size() != kX25519PrivateKeyBytes ||
        public_key.size() != kX25519PublicKeyBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Invalid X25519 key sizes"));
    }
    std::vector<uint8_t> shared(kX25519SharedSecretBytes);
    if (crypto_scalarmult(shared.data(), private_key.data(), public_key.data()) != 0) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Handshake("X25519 DH failed for " + std::string(label)));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(shared));
}

std::vector<uint8_t> SodiumInterop::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {
    std::vector<uint8_t> mac(crypto_auth_hmacsha256_BYTES);
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, key.data(), key.size());
    crypto_auth_hmacsha256_update(&state, data.data(), data.size());
    crypto_auth_hmacsha256_final(&state, mac.data());
    sodium_memzero(&state, sizeof(state));
    return mac;
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

uint32_t SodiumInterop::GenerateRandomUInt32(const uint32_t upper_bound) {
    return randombytes_uniform(upper_bound);
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace mist::protocol::crypto
