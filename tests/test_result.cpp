// tests/test_result.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/serialization.h"
#include "core/types/result.h"
#include <stdexcept>
#include <string>

using namespace funcmodel;

TEST_CASE("Result carries a value or an error", "[result]") {
    auto ok = Result<int>::ok(42);
    REQUIRE(ok.is_success());
    REQUIRE_FALSE(ok.is_failure());
    REQUIRE(ok.value() == 42);
    REQUIRE_THROWS_AS(ok.error(), std::logic_error);

    Result<int> failed = not_found_error("missing");
    REQUIRE(failed.is_failure());
    REQUIRE(failed.error_kind() == ErrorKind::NOT_FOUND);
    REQUIRE(failed.message() == "missing");
    REQUIRE_THROWS_AS(failed.value(), std::logic_error);
    REQUIRE(failed.value_or(7) == 7);
}

TEST_CASE("Result combinators short-circuit on failure", "[result]") {
    auto doubled = Result<int>::ok(21).map([](int v) { return v * 2; });
    REQUIRE(doubled.value() == 42);

    int calls = 0;
    Result<int> failed = validation_error("bad input");
    auto mapped = failed.map([&](int v) { ++calls; return v; });
    auto chained = failed.flat_map([&](int v) { ++calls; return Result<std::string>::ok(std::to_string(v)); });
    REQUIRE(calls == 0);
    REQUIRE(mapped.error_kind() == ErrorKind::VALIDATION);
    REQUIRE(chained.message() == "bad input");

    auto chained_ok = Result<int>::ok(3).flat_map([](int v) {
        return v > 2 ? Result<int>::fail(ErrorKind::CONFLICT, "too big") : Result<int>::ok(v);
    });
    REQUIRE(chained_ok.error_kind() == ErrorKind::CONFLICT);
}

TEST_CASE("Mapping to void keeps only success or failure", "[result]") {
    int seen = 0;
    VoidResult done = Result<int>::ok(5).map([&](int v) { seen = v; });
    REQUIRE(done.is_success());
    REQUIRE(seen == 5);

    Result<int> failed = not_found_error("gone");
    VoidResult skipped = failed.map([&](int v) { seen = v * 10; });
    REQUIRE(skipped.error_kind() == ErrorKind::NOT_FOUND);
    REQUIRE(seen == 5);
}

TEST_CASE("Result fold and recover", "[result]") {
    Result<int> failed = conflict_error("taken");
    std::string folded = failed.fold([](int) { return std::string("ok"); },
                                     [](const Error& e) { return "error: " + e.message; });
    REQUIRE(folded == "error: taken");

    auto recovered = failed.recover([](const Error&) { return 0; });
    REQUIRE(recovered.is_success());
    REQUIRE(recovered.value() == 0);

    VoidResult done = VoidResult::ok();
    REQUIRE(done.is_success());
    REQUIRE_THROWS_AS(done.error(), std::logic_error);
    VoidResult denied = access_denied_error("locked");
    REQUIRE(denied.error_kind() == ErrorKind::ACCESS_DENIED);
    REQUIRE_THROWS_AS(denied.value(), std::logic_error);
}

TEST_CASE("Result serializes with isSuccess", "[result][serialization]") {
    nlohmann::json ok = Result<int>::ok(5);
    REQUIRE(ok["isSuccess"] == true);
    REQUIRE(ok["value"] == 5);
    REQUIRE_FALSE(ok.contains("error"));

    nlohmann::json failed = Result<int>(invalid_state_error("archived"));
    REQUIRE(failed["isSuccess"] == false);
    REQUIRE(failed["error"] == "archived");
    REQUIRE(failed["errorKind"] == "invalid_state");
    REQUIRE_FALSE(failed.contains("value"));
}
