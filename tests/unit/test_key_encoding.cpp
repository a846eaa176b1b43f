#include <catch2/catch_test_macros.hpp>
#include "mist/utilities/key_encoding.hpp"
#include "mist/crypto/sodium_interop.hpp"
using namespace mist::protocol;
using namespace mist::protocol::utilities;
TEST_CASE("KeyEncoding - Standard base64", "[encoding]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SECTION("Known encodings") {
        REQUIRE(ToBase64(BytesOf("f")) == "Zg==");
        REQUIRE(ToBase64(BytesOf("foobar")) == "Zm9vYmFy");
        REQUIRE(ToBase64({}).empty());
    }
    SECTION("Decoding restores random keys") {
        const auto key = crypto::SodiumInterop::GetRandomBytes(32);
        auto decoded = FromBase64(ToBase64(key));
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == key);
    }
    SECTION("Invalid text fails with Decode") {
        auto decoded = FromBase64("not*base64");
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == ProtocolFailureType::Decode);
    }
}
TEST_CASE("KeyEncoding - URL-safe base64 has no padding or reserved characters", "[encoding]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> bytes = {0xfb, 0xff, 0xfe, 0x3e};
    const auto text = ToUrlSafeBase64(bytes);
    REQUIRE(text == "-__-Pg");
    REQUIRE(text.find_first_of("+/=") == std::string::npos);
    REQUIRE(FromUrlSafeBase64(text).Unwrap() == bytes);
    REQUIRE(FromUrlSafeBase64("+/+/").IsErr());
}
TEST_CASE("KeyEncoding - CompareKeys orders bytes unsigned", "[encoding]") {
    const std::vector<uint8_t> low = {0x01, 0x02};
    const std::vector<uint8_t> high = {0x01, 0xf0};
    const std::vector<uint8_t> prefix = {0x01};
    REQUIRE(CompareKeys(low, high) < 0);
    REQUIRE(CompareKeys(high, low) > 0);
    REQUIRE(CompareKeys(low, low) == 0);
    REQUIRE(CompareKeys(prefix, low) < 0);
    REQUIRE(CompareKeys(low, prefix) > 0);
}
