#include <catch2/catch.hpp>
#include <pmat/result.hpp>
#include <memory>
#include <string>

using namespace pmat;

static Result<int> try_double(Result<int> input) {
    PMAT_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Result<int> try_chain(bool fail_first) {
    auto first = fail_first
        ? Result<int>::err(PmatError{PmatError::BadRequest, "first failed"})
        : Result<int>::ok(10);
    PMAT_TRY(first);
    auto second = Result<int>::ok(first.value() + 5);
    PMAT_TRY(second);
    return Result<int>::ok(second.value());
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(PmatError{PmatError::NotFound, "missing item"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PmatError::NotFound);
    REQUIRE(r.error().message == "missing item");
}

TEST_CASE("Implicit conversion from PmatError", "[result]") {
    Result<std::string> r = PmatError(PmatError::Conflict, "busy");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PmatError::Conflict);
}

TEST_CASE("Bool conversion", "[result]") {
    auto ok = Result<int>::ok(1);
    auto err = Result<int>::err(PmatError{PmatError::IO, "fail"});
    REQUIRE(static_cast<bool>(ok));
    REQUIRE_FALSE(static_cast<bool>(err));
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(PmatError{PmatError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("value_or falls back on Err", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(9) == 3);
    REQUIRE(Result<int>::err(PmatError{PmatError::IO, "x"}).value_or(9) == 9);
}

TEST_CASE("map() transforms Ok value and passes through Err", "[result]") {
    auto mapped = Result<int>::ok(5).map([](int x) { return x * 2; });
    REQUIRE(mapped.value() == 10);

    bool called = false;
    auto r = Result<int>::err(PmatError{PmatError::BadRequest, "bad input"});
    auto skipped = r.map([&](int x) { called = true; return x; });
    REQUIRE(skipped.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(skipped.error().message == "bad input");
}

TEST_CASE("and_then() chains and short-circuits", "[result]") {
    auto chained = Result<int>::ok(5).and_then([](int x) { return Result<int>::ok(x + 10); });
    REQUIRE(chained.value() == 15);

    bool called = false;
    auto r = Result<int>::err(PmatError{PmatError::Conflict, "loop"});
    auto stopped = r.and_then([&](int x) {
        called = true;
        return Result<int>::ok(x);
    });
    REQUIRE(stopped.is_err());
    REQUIRE_FALSE(called);
}

TEST_CASE("map_err() rewrites the error only", "[result]") {
    auto r = Result<int>::err(PmatError{PmatError::IO, "disk"});
    auto wrapped = r.map_err([](PmatError& e) {
        PmatError outer(PmatError::Internal, "wrapped");
        outer.with_cause(e);
        return outer;
    });
    REQUIRE(wrapped.error().code == PmatError::Internal);
    REQUIRE(wrapped.error().cause->message == "disk");

    auto ok = Result<int>::ok(1).map_err([](PmatError& e) { return e; });
    REQUIRE(ok.value() == 1);
}

TEST_CASE("PMAT_TRY propagates errors and passes Ok", "[result]") {
    auto failed = try_double(Result<int>::err(PmatError{PmatError::BadRequest, "syntax"}));
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().message == "syntax");
    REQUIRE(try_double(Result<int>::ok(7)).value() == 14);
}

TEST_CASE("PMAT_TRY chained", "[result]") {
    REQUIRE(try_chain(false).value() == 15);
    REQUIRE(try_chain(true).error().message == "first failed");
}

TEST_CASE("Status Ok and Err", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(PmatError{PmatError::ValidationFailed, "bad config"});
    REQUIRE(s.error().code == PmatError::ValidationFailed);
}

TEST_CASE("Result with move-only type", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
    auto taken = std::move(r).value();
    REQUIRE(*taken == 99);
}
