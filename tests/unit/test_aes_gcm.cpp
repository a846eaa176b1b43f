#include <catch2/catch_test_macros.hpp>
#include "mist/crypto/aes_gcm.hpp"
#include "mist/crypto/sodium_interop.hpp"
#include "mist/protocol/constants.hpp"
#include "mist/utilities/key_encoding.hpp"
using namespace mist::protocol;
using namespace mist::protocol::crypto;
TEST_CASE("AES-GCM - Seal and open", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SodiumInterop::GetRandomBytes(kAesKeyBytes);
    const auto nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
    const auto header = utilities::BytesOf("header|alice|bob");
    SECTION("Round trip with associated data") {
        const auto plaintext = utilities::BytesOf("hello");
        auto sealed = AesGcm::Encrypt(key, nonce, plaintext, header);
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap().size() == plaintext.size() + kAesGcmTagBytes);
        auto opened = AesGcm::Decrypt(key, nonce, sealed.Unwrap(), header);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext yields a bare tag") {
        auto sealed = AesGcm::Encrypt(key, nonce, {});
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap().size() == kAesGcmTagBytes);
        REQUIRE(AesGcm::Decrypt(key, nonce, sealed.Unwrap()).Unwrap().empty());
    }
}
TEST_CASE("AES-GCM - Tampering is detected", "[aes_gcm][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = SodiumInterop::GetRandomBytes(kAesKeyBytes);
    const auto nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
    const auto header = utilities::BytesOf("header");
    auto sealed = AesGcm::Encrypt(key, nonce, utilities::BytesOf("attack at dawn"), header).Unwrap();
    SECTION("Flipped ciphertext bit") {
        auto tampered = sealed;
        tampered[0] ^= 0x01;
        auto opened = AesGcm::Decrypt(key, nonce, tampered, header);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == ProtocolFailureType::DecryptionFailed);
    }
    SECTION("Flipped tag bit") {
        auto tampered = sealed;
        tampered.back() ^= 0x80;
        REQUIRE(AesGcm::Decrypt(key, nonce, tampered, header).IsErr());
    }
    SECTION("Different associated data") {
        REQUIRE(AesGcm::Decrypt(key, nonce, sealed, utilities::BytesOf("other")).IsErr());
    }
    SECTION("Truncated below the tag") {
        std::vector<uint8_t> truncated(sealed.begin(), sealed.begin() + kAesGcmTagBytes - 1);
        REQUIRE(AesGcm::Decrypt(key, nonce, truncated, header).IsErr());
    }
}
TEST_CASE("AES-GCM - Parameter validation", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> short_key(16, 0x01);
    const std::vector<uint8_t> key(kAesKeyBytes, 0x01);
    const std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x02);
    const std::vector<uint8_t> long_nonce(16, 0x02);
    const auto plaintext = utilities::BytesOf("x");
    REQUIRE(AesGcm::Encrypt(short_key, nonce, plaintext).UnwrapErr().type == ProtocolFailureType::InvalidInput);
    REQUIRE(AesGcm::Encrypt(key, long_nonce, plaintext).UnwrapErr().type == ProtocolFailureType::InvalidInput);
}
