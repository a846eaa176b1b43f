#include <catch2/catch_test_macros.hpp>
#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"
#include <string>
using namespace mist::protocol;
TEST_CASE("Result - Ok and Err queries", "[result][core]") {
    SECTION("Ok holds the value") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err holds the error") {
        auto result = Result<int, std::string>::Err("broken");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr() == "broken");
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("broken");
        REQUIRE_THROWS(result.Unwrap());
    }
    SECTION("UnwrapErr on Ok throws") {
        auto result = Result<Unit, std::string>::Ok(unit);
        REQUIRE_THROWS(result.UnwrapErr());
    }
}
TEST_CASE("Result - Combinators", "[result][core]") {
    SECTION("Map transforms Ok and keeps Err") {
        auto doubled = Result<int, std::string>::Ok(21).Map([](int x) { return x * 2; });
        REQUIRE(doubled.Unwrap() == 42);
        auto untouched = Result<int, std::string>::Err("e").Map([](int x) { return x * 2; });
        REQUIRE(untouched.UnwrapErr() == "e");
    }
    SECTION("MapErr converts the error type") {
        auto mapped = Result<int, std::string>::Err("bad key").MapErr([](std::string message) {
            return ProtocolFailure::InvalidInput(std::move(message));
        });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr().type == ProtocolFailureType::InvalidInput);
        REQUIRE(mapped.UnwrapErr().message == "bad key");
    }
    SECTION("Bind short-circuits on Err") {
        auto half = [](int x) {
            if (x % 2 != 0) {
                return Result<int, std::string>::Err("odd");
            }
            return Result<int, std::string>::Ok(x / 2);
        };
        REQUIRE(Result<int, std::string>::Ok(10).Bind(half).Unwrap() == 5);
        REQUIRE(Result<int, std::string>::Ok(7).Bind(half).UnwrapErr() == "odd");
    }
    SECTION("UnwrapOr falls back on Err") {
        REQUIRE(Result<int, std::string>::Err("e").UnwrapOr(3) == 3);
        REQUIRE(Result<int, std::string>::Ok(9).UnwrapOr(3) == 9);
    }
    SECTION("FromOptional") {
        auto present = Result<int, std::string>::FromOptional(5, "missing");
        auto absent = Result<int, std::string>::FromOptional(std::nullopt, "missing");
        REQUIRE(present.Unwrap() == 5);
        REQUIRE(absent.UnwrapErr() == "missing");
    }
}
TEST_CASE("ProtocolFailure - Factories carry their type", "[result][core]") {
    REQUIRE(ProtocolFailure::NoSession("x").type == ProtocolFailureType::NoSession);
    REQUIRE(ProtocolFailure::UnknownSender("x").type == ProtocolFailureType::UnknownSender);
    REQUIRE(ProtocolFailure::RoleOrderingViolation("x").type == ProtocolFailureType::RoleOrderingViolation);
    REQUIRE(ProtocolFailure::SignalingUnavailable("x").type == ProtocolFailureType::SignalingUnavailable);
    REQUIRE(ProtocolFailure::Storage("disk full").message == "disk full");
    const auto converted = ProtocolFailure::FromSodiumFailure(SodiumFailure::InitializationFailed("no sodium"));
    REQUIRE(converted.message.find("no sodium") != std::string::npos);
}
