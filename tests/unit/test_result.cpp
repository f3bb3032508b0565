#include <catch2/catch_test_macros.hpp>
#include "enclave/core/result.hpp"
#include "enclave/core/failures.hpp"
#include <string>
using namespace enclave;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, std::string>::Ok(unit);
        REQUIRE(result.IsOk());
    }
    SECTION("Same type for value and error is distinguished") {
        auto ok = Result<std::string, std::string>::Ok("value");
        auto err = Result<std::string, std::string>::Err("value");
        REQUIRE(ok.IsOk());
        REQUIRE(err.IsErr());
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::logic_error);
    }
    SECTION("UnwrapErr on Ok throws") {
        auto result = Result<int, std::string>::Ok(1);
        REQUIRE_THROWS_AS(result.UnwrapErr(), std::logic_error);
    }
}
TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto result = Result<int, std::string>::Ok(21);
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr transforms Err value") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).MapErr([](std::string s) {
            return s + "!";
        });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error!");
    }
    SECTION("Bind chains operations") {
        auto result = Result<int, std::string>::Ok(10);
        auto bound = std::move(result).Bind([](int x) {
            if (x > 5) {
                return Result<int, std::string>::Ok(x * 2);
            }
            return Result<int, std::string>::Err("too small");
        });
        REQUIRE(bound.IsOk());
        REQUIRE(bound.Unwrap() == 20);
    }
    SECTION("Ok() converts to optional") {
        REQUIRE(Result<int, std::string>::Ok(7).Ok() == std::optional<int>(7));
        REQUIRE_FALSE(Result<int, std::string>::Err("e").Ok().has_value());
    }
}
TEST_CASE("Result<T, E> - Optional and predicate helpers", "[result][core]") {
    SECTION("FromOptional with value") {
        auto result = Result<int, std::string>::FromOptional(5, "missing");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == 5);
    }
    SECTION("FromOptional without value") {
        auto result = Result<int, std::string>::FromOptional(std::nullopt, "missing");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr() == "missing");
    }
    SECTION("IsErrAnd matches native status") {
        auto result = Result<Unit, EnclaveFailure>::Err(
            EnclaveFailure::KeystoreError("gone", KeystoreStatus::ITEM_NOT_FOUND));
        REQUIRE(result.IsErrAnd([](const EnclaveFailure& f) {
            return f.HasStatus(KeystoreStatus::ITEM_NOT_FOUND);
        }));
        REQUIRE_FALSE(result.IsErrAnd([](const EnclaveFailure& f) {
            return f.HasStatus(KeystoreStatus::PARAM);
        }));
    }
    SECTION("InspectErr only runs on Err") {
        int calls = 0;
        auto ok = Result<int, std::string>::Ok(1);
        ok.InspectErr([&calls](const std::string&) { ++calls; });
        auto err = Result<int, std::string>::Err("e");
        err.InspectErr([&calls](const std::string&) { ++calls; });
        REQUIRE(calls == 1);
    }
}
TEST_CASE("EnclaveFailure - Status carriage", "[result][core][failures]") {
    SECTION("Keystore errors carry optional status") {
        auto with_status = EnclaveFailure::KeystoreError("x", KeystoreStatus::AUTH_FAILED);
        auto without_status = EnclaveFailure::KeystoreError("x");
        REQUIRE(with_status.HasStatus(KeystoreStatus::AUTH_FAILED));
        REQUIRE_FALSE(without_status.native_status.has_value());
    }
    SECTION("Verification failures always carry status") {
        auto failure = EnclaveFailure::VerificationFailed("bad", KeystoreStatus::VERIFY_FAILED);
        REQUIRE(failure.type == EnclaveFailureType::VerificationFailed);
        REQUIRE(failure.native_status == KeystoreStatus::VERIFY_FAILED);
    }
    SECTION("Sodium failures become keystore errors") {
        auto failure = EnclaveFailure::FromSodiumFailure(SodiumFailure::AllocationFailed("oom"));
        REQUIRE(failure.type == EnclaveFailureType::KeystoreError);
        REQUIRE(failure.message == "oom");
    }
    SECTION("Status descriptions") {
        REQUIRE(KeystoreStatus::Describe(KeystoreStatus::DUPLICATE_ITEM) == "item already exists");
        REQUIRE(KeystoreStatus::Describe(12345) == "unknown status");
    }
}
