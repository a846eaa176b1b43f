#pragma once

#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace mist::protocol::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) over OpenSSL's EVP_KDF
 *
 * Used for the X3DH output, the ratchet root KDF and the state MAC key.
 */
class Hkdf {
public:
    /**
     * @brief Extract-and-expand into a caller-provided buffer
     *
     * @param ikm Input key material, must not be empty
     * @param output Buffer to fill with derived bytes
     * @param salt Optional salt (empty means a zero-filled salt)
     * @param info Optional context info
     */
    static Result<Unit, ProtocolFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /// Convenience overload taking the info label as text.
    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt,
        std::string_view info);

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace mist::protocol::crypto
