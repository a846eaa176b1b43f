#include "mist/crypto/hkdf.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

#include <memory>
#include <string>

namespace mist::protocol::crypto {

namespace {
    struct EvpKdfDeleter {
        void operator()(EVP_KDF* kdf) const { EVP_KDF_free(kdf); }
        void operator()(EVP_KDF_CTX* ctx) const { EVP_KDF_CTX_free(ctx); }
    };
    using EvpKdfPtr = std::unique_ptr<EVP_KDF, EvpKdfDeleter>;
    using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, EvpKdfDeleter>;
}

Result<Unit, ProtocolFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {
    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                "HKDF output size out of range: " + std::to_string(output.size())));
    }
    if (ikm.empty()) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    EvpKdfPtr kdf(EVP_KDF_fetch(nullptr, "HKDF", nullptr));
    if (!kdf) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("Failed to fetch HKDF algorithm"));
    }
    EvpKdfCtxPtr kctx(EVP_KDF_CTX_new(kdf.get()));
    if (!kctx) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    size_t param_idx = 0;
    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != 1) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("HKDF key derivation failed"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {
    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, ProtocolFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::string_view info) {
    const std::span<const uint8_t> info_bytes(
        reinterpret_cast<const uint8_t*>(info.data()), info.size());
    return DeriveKeyBytes(ikm, output_size, salt, info_bytes);
}

} // namespace mist::protocol::crypto
