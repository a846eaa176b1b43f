#include "mist/crypto/aes_gcm.hpp"
#include "mist/crypto/sodium_interop.hpp"
#include "mist/protocol/constants.hpp"
#include <fmt/core.h>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
#include <string>
namespace mist::protocol::crypto {
namespace {
    constexpr int kOpenSslSuccess = 1;
    constexpr size_t kOpenSslErrorBufferBytes = 256;

    struct EvpCipherCtxDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == 0) {
            return "Unknown OpenSSL error";
        }
        char buffer[kOpenSslErrorBufferBytes];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    void WipeOutput(std::vector<uint8_t>& output) {
        auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        (void) _wipe;
    }

    Result<Unit, ProtocolFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != kAesKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    fmt::format("AES-256-GCM key must be {} bytes, got {}", kAesKeyBytes, key.size())));
        }
        if (nonce.size() != kAesGcmNonceBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    fmt::format("AES-GCM nonce must be {} bytes, got {}", kAesGcmNonceBytes, nonce.size())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<EvpCipherCtxPtr, ProtocolFailure> CreateContext(
        const bool encrypt,
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> associated_data) {
        EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        if (!ctx) {
            return Result<EvpCipherCtxPtr, ProtocolFailure>::Err(
                ProtocolFailure::Generic(
                    fmt::format("Failed to create cipher context: {}", GetOpenSSLError())));
        }
        const int init_ok = encrypt
            ? EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr)
            : EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
        if (init_ok != kOpenSslSuccess) {
            return Result<EvpCipherCtxPtr, ProtocolFailure>::Err(
                ProtocolFailure::Generic(
                    fmt::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(nonce.size()), nullptr) != kOpenSslSuccess) {
            return Result<EvpCipherCtxPtr, ProtocolFailure>::Err(
                ProtocolFailure::Generic(
                    fmt::format("Failed to set nonce length: {}", GetOpenSSLError())));
        }
        const int key_ok = encrypt
            ? EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data())
            : EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data());
        if (key_ok != kOpenSslSuccess) {
            return Result<EvpCipherCtxPtr, ProtocolFailure>::Err(
                ProtocolFailure::Generic(
                    fmt::format("Failed to set key and nonce: {}", GetOpenSSLError())));
        }
        if (!associated_data.empty()) {
            int outlen = 0;
            const int ad_ok = encrypt
                ? EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                                    associated_data.data(), static_cast<int>(associated_data.size()))
                : EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                                    associated_data.data(), static_cast<int>(associated_data.size()));
            if (ad_ok != kOpenSslSuccess) {
                return Result<EvpCipherCtxPtr, ProtocolFailure>::Err(
                    ProtocolFailure::Generic(
                        fmt::format("Failed to add associated data: {}", GetOpenSSLError())));
            }
        }
        return Result<EvpCipherCtxPtr, ProtocolFailure>::Ok(std::move(ctx));
    }
}
Result<std::vector<uint8_t>, ProtocolFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(check.UnwrapErr());
    }
    auto ctx_result = CreateContext(true, key, nonce, associated_data);
    if (ctx_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(ctx_result.UnwrapErr());
    }
    auto ctx = std::move(ctx_result).Unwrap();

    std::vector<uint8_t> output(plaintext.size() + kAesGcmTagBytes);
    int ciphertext_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != kOpenSslSuccess) {
        WipeOutput(output);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(fmt::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != kOpenSslSuccess) {
        WipeOutput(output);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(fmt::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(kAesGcmTagBytes),
                            output.data() + ciphertext_len) != kOpenSslSuccess) {
        WipeOutput(output);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(fmt::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len) + kAesGcmTagBytes);
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, ProtocolFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(check.UnwrapErr());
    }
    if (ciphertext_with_tag.size() < kAesGcmTagBytes) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DecryptionFailed(
                fmt::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), kAesGcmTagBytes)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
    const auto ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    const auto tag = ciphertext_with_tag.subspan(ciphertext_len);

    auto ctx_result = CreateContext(false, key, nonce, associated_data);
    if (ctx_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(ctx_result.UnwrapErr());
    }
    auto ctx = std::move(ctx_result).Unwrap();

    // Over-allocated so data() is never null for an empty ciphertext body
    std::vector<uint8_t> output(ciphertext_len + kAesGcmTagBytes);
    int plaintext_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                          ciphertext.data(), static_cast<int>(ciphertext.size())) != kOpenSslSuccess) {
        WipeOutput(output);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DecryptionFailed(fmt::format("Decryption failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(kAesGcmTagBytes), tag_copy.data()) != kOpenSslSuccess) {
        WipeOutput(output);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Generic(fmt::format("Failed to set authentication tag: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != kOpenSslSuccess) {
        WipeOutput(output);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DecryptionFailed(
                "Authentication tag verification failed - data may have been tampered with"));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
}
}
