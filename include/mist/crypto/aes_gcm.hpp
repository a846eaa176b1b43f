#pragma once
#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace mist::protocol::crypto {

/**
 * AES-256-GCM authenticated encryption over OpenSSL EVP.
 *
 * The tag is appended to the ciphertext. Stateless: the ratchet derives a
 * fresh key for every message and pairs it with a random 96-bit nonce, so a
 * (key, nonce) pair is never reused.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    /// Fails with DecryptionFailed when the tag does not verify.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
