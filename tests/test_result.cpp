#include <catch2/catch.hpp>
#include <aarc/result.hpp>
#include <memory>
#include <string>

using namespace aarc;

// Helper function that uses AARC_TRY
static Result<int> try_double(Result<int> input) {
    AARC_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Status try_steps(bool fail_second, int& steps) {
    AARC_TRY(ok_status());
    steps++;
    auto second = fail_second
        ? Status::err(AarcError{AarcError::Archive, "second failed"})
        : ok_status();
    AARC_TRY(second);
    steps++;
    return ok_status();
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(AarcError{AarcError::NotFound, "missing entry"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == AarcError::NotFound);
    REQUIRE(r.error().message == "missing entry");
}

TEST_CASE("Error converts implicitly into any Result", "[result]") {
    Result<std::string> r = AarcError{AarcError::IO, "disk gone"};
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
}

TEST_CASE("AARC_TRY propagates errors and passes Ok", "[result]") {
    auto failed = try_double(Result<int>::err(AarcError{AarcError::Parse, "syntax"}));
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().message == "syntax");

    auto passed = try_double(Result<int>::ok(7));
    REQUIRE(passed.value() == 14);
}

TEST_CASE("AARC_TRY stops at the first failing step", "[result]") {
    int steps = 0;
    auto s = try_steps(true, steps);
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == AarcError::Archive);
    REQUIRE(steps == 1);

    steps = 0;
    REQUIRE(try_steps(false, steps).is_ok());
    REQUIRE(steps == 2);
}

TEST_CASE("is_cancelled only matches Cancelled errors", "[result]") {
    REQUIRE(is_cancelled(Status::err(AarcError{AarcError::Cancelled, "stop"})));
    REQUIRE_FALSE(is_cancelled(Status::err(AarcError{AarcError::IO, "fail"})));
    REQUIRE_FALSE(is_cancelled(ok_status()));
}

TEST_CASE("AarcError format() output", "[error]") {
    AarcError e{AarcError::IO, "cannot delete", "check permissions", "aarc.toml", 7};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[IO]") != std::string::npos);
    REQUIRE(formatted.find("cannot delete") != std::string::npos);
    REQUIRE(formatted.find("hint: check permissions") != std::string::npos);
    REQUIRE(formatted.find("--> aarc.toml:7") != std::string::npos);
}

TEST_CASE("AarcError format() without hint or file", "[error]") {
    AarcError e{AarcError::Archive, "truncated zip"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Archive]") != std::string::npos);
    REQUIRE(formatted.find("hint:") == std::string::npos);
    REQUIRE(formatted.find("-->") == std::string::npos);
}

TEST_CASE("AarcError code_name() for all codes", "[error]") {
    REQUIRE(std::string(AarcError::code_name(AarcError::IO)) == "IO");
    REQUIRE(std::string(AarcError::code_name(AarcError::Parse)) == "Parse");
    REQUIRE(std::string(AarcError::code_name(AarcError::Config)) == "Config");
    REQUIRE(std::string(AarcError::code_name(AarcError::Archive)) == "Archive");
    REQUIRE(std::string(AarcError::code_name(AarcError::NotFound)) == "NotFound");
    REQUIRE(std::string(AarcError::code_name(AarcError::Cancelled)) == "Cancelled");
    REQUIRE(std::string(AarcError::code_name(AarcError::Execution)) == "Execution");
    REQUIRE(std::string(AarcError::code_name(AarcError::Network)) == "Network");
    REQUIRE(std::string(AarcError::code_name(AarcError::InvalidArg)) == "InvalidArg");
}

TEST_CASE("Result with move-only type (unique_ptr)", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(r.is_ok());
    REQUIRE(*r.value() == 99);
}
