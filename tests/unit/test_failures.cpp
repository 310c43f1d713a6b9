#include <catch2/catch_test_macros.hpp>
#include "keyward/core/failures.hpp"
#include "keyward/core/result.hpp"
using namespace keyward::e2ee;
TEST_CASE("KeywardFailure - Taxonomy helpers", "[failures]") {
    SECTION("Storage and timeout are retryable") {
        REQUIRE(KeywardFailure::Storage("disk").IsRetryable());
        REQUIRE(KeywardFailure::Timeout("busy").IsRetryable());
        REQUIRE_FALSE(KeywardFailure::Storage("disk").IsFatal());
    }
    SECTION("Generation and authentication are fatal") {
        REQUIRE(KeywardFailure::KeyGeneration("entropy").IsFatal());
        REQUIRE(KeywardFailure::Authentication("tag").IsFatal());
        REQUIRE_FALSE(KeywardFailure::Authentication("tag").IsRetryable());
    }
    SECTION("Expected conditions are neither") {
        for (const auto& failure : {KeywardFailure::NotFound("x"),
                                    KeywardFailure::AlreadyUsed("x"),
                                    KeywardFailure::Unavailable("x"),
                                    KeywardFailure::NotInitialized("x")}) {
            REQUIRE_FALSE(failure.IsFatal());
            REQUIRE_FALSE(failure.IsRetryable());
        }
    }
    SECTION("Type names") {
        REQUIRE(FailureTypeName(KeywardFailureType::AlreadyUsed) == "already_used");
        REQUIRE(FailureTypeName(KeywardFailureType::Timeout) == "timeout");
    }
}
TEST_CASE("Result - Combinators", "[result]") {
    SECTION("Map transforms the value") {
        auto mapped = Result<int, KeywardFailure>::Ok(20).Map([](int v) { return v + 1; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 21);
    }
    SECTION("Map leaves errors alone") {
        auto mapped = Result<int, KeywardFailure>::Err(KeywardFailure::NotFound("missing"))
            .Map([](int v) { return v + 1; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr().Is(KeywardFailureType::NotFound));
    }
    SECTION("Bind chains fallible steps") {
        auto chained = Result<int, KeywardFailure>::Ok(4).Bind([](int v) {
            if (v % 2 == 0) {
                return Result<int, KeywardFailure>::Err(KeywardFailure::InvalidInput("even"));
            }
            return Result<int, KeywardFailure>::Ok(v);
        });
        REQUIRE(chained.IsErr());
        REQUIRE(chained.UnwrapErr().type == KeywardFailureType::InvalidInput);
    }
    SECTION("UnwrapOr falls back on error") {
        auto value = Result<int, KeywardFailure>::Err(KeywardFailure::Storage("x")).UnwrapOr(7);
        REQUIRE(value == 7);
    }
    SECTION("Unwrap on an error throws") {
        auto failed = Result<int, KeywardFailure>::Err(KeywardFailure::Storage("x"));
        REQUIRE_THROWS(failed.Unwrap());
    }
}
