#include <catch2/catch_test_macros.hpp>
#include "mist/crypto/sodium_interop.hpp"
#include "mist/protocol/constants.hpp"
#include "mist/utilities/key_encoding.hpp"
#include <algorithm>
#include <string>
using namespace mist::protocol;
using namespace mist::protocol::crypto;
namespace {
    std::vector<uint8_t> FromHex(const std::string& hex) {
        std::vector<uint8_t> bytes;
        for (size_t i = 0; i + 1 < hex.size(); i += 2) {
            bytes.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
        }
        return bytes;
    }
}
TEST_CASE("SodiumInterop - Initialization is idempotent", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SodiumInterop::IsInitialized());
}
TEST_CASE("SodiumInterop - Secure wipe and comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe zeroes small and large buffers") {
        for (const size_t size : {size_t{16}, size_t{4096}}) {
            std::vector<uint8_t> buffer(size, 0xAB);
            REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
            REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
        }
    }
    SECTION("Wipe of an empty buffer succeeds") {
        std::vector<uint8_t> buffer;
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
    }
    SECTION("Constant time equality") {
        const std::vector<uint8_t> a = {1, 2, 3, 4};
        const std::vector<uint8_t> b = {1, 2, 3, 4};
        const std::vector<uint8_t> c = {1, 2, 3, 5};
        const std::vector<uint8_t> shorter = {1, 2, 3};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, c).Unwrap());
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, shorter).Unwrap());
    }
}
TEST_CASE("SodiumInterop - Ed25519 signatures", "[sodium][crypto][keygen]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto generated = SodiumInterop::GenerateEd25519KeyPair();
    REQUIRE(generated.IsOk());
    auto [secret, public_key] = std::move(generated).Unwrap();
    REQUIRE(secret.size() == kEd25519SecretKeyBytes);
    REQUIRE(public_key.size() == kEd25519PublicKeyBytes);
    const auto message = utilities::BytesOf("pk:123456:1700000000000");
    auto signature = SodiumInterop::SignDetached(secret, message);
    REQUIRE(signature.IsOk());
    REQUIRE(signature.Unwrap().size() == kEd25519SignatureBytes);
    SECTION("Signature verifies under the signer's key") {
        REQUIRE(SodiumInterop::VerifyDetached(public_key, message, signature.Unwrap()));
    }
    SECTION("Altered message is rejected") {
        auto altered = message;
        altered.back() ^= 0x01;
        REQUIRE_FALSE(SodiumInterop::VerifyDetached(public_key, altered, signature.Unwrap()));
    }
    SECTION("Other key is rejected") {
        auto other = SodiumInterop::GenerateEd25519KeyPair();
        REQUIRE(other.IsOk());
        REQUIRE_FALSE(SodiumInterop::VerifyDetached(other.Unwrap().second, message, signature.Unwrap()));
    }
    REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(secret)).IsOk());
}
TEST_CASE("SodiumInterop - X25519 agreement through converted identity keys", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = SodiumInterop::GenerateEd25519KeyPair();
    auto bob = SodiumInterop::GenerateEd25519KeyPair();
    REQUIRE(alice.IsOk());
    REQUIRE(bob.IsOk());
    auto alice_x_secret = SodiumInterop::ConvertEd25519SecretToX25519(alice.Unwrap().first);
    auto alice_x_public = SodiumInterop::ConvertEd25519PublicToX25519(alice.Unwrap().second);
    auto bob_x_secret = SodiumInterop::ConvertEd25519SecretToX25519(bob.Unwrap().first);
    auto bob_x_public = SodiumInterop::ConvertEd25519PublicToX25519(bob.Unwrap().second);
    REQUIRE(alice_x_secret.IsOk());
    REQUIRE(alice_x_public.IsOk());
    REQUIRE(bob_x_secret.IsOk());
    REQUIRE(bob_x_public.IsOk());
    auto ab = SodiumInterop::ComputeX25519(alice_x_secret.Unwrap(), bob_x_public.Unwrap(), "test");
    auto ba = SodiumInterop::ComputeX25519(bob_x_secret.Unwrap(), alice_x_public.Unwrap(), "test");
    REQUIRE(ab.IsOk());
    REQUIRE(ba.IsOk());
    REQUIRE(ab.Unwrap() == ba.Unwrap());
    REQUIRE(ab.Unwrap().size() == kX25519SharedSecretBytes);
    SECTION("Low-order peer key is refused") {
        const std::vector<uint8_t> zero_point(kX25519PublicKeyBytes, 0);
        REQUIRE(SodiumInterop::ComputeX25519(alice_x_secret.Unwrap(), zero_point, "test").IsErr());
    }
}
TEST_CASE("SodiumInterop - HMAC-SHA256 matches RFC 4231", "[sodium][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = utilities::BytesOf("Jefe");
    const auto data = utilities::BytesOf("what do ya want for nothing?");
    REQUIRE(SodiumInterop::HmacSha256(key, data) ==
            FromHex("5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843"));
}
TEST_CASE("SodiumInterop - Random values", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    REQUIRE(SodiumInterop::GetRandomBytes(32).size() == 32);
    REQUIRE(SodiumInterop::GetRandomBytes(32) != SodiumInterop::GetRandomBytes(32));
    for (int i = 0; i < 100; ++i) {
        REQUIRE(SodiumInterop::GenerateRandomUInt32(10) < 10);
    }
}
