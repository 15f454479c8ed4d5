#include <catch2/catch.hpp>
#include <pmat/error.hpp>
#include <string>

using namespace pmat;

TEST_CASE("format() includes hint, file and causes", "[error]") {
    PmatError e{PmatError::IO, "file not found", "check the path"};
    e.with_file("main.toml", 42);
    e.with_cause(PmatError(PmatError::NotFound, "no such file"));
    auto formatted = e.format();
    REQUIRE(formatted.find("error[IO]: file not found") != std::string::npos);
    REQUIRE(formatted.find("hint: check the path") != std::string::npos);
    REQUIRE(formatted.find("--> main.toml:42") != std::string::npos);
    REQUIRE(formatted.find("caused by: NotFound: no such file") != std::string::npos);
}

TEST_CASE("format() without hint or file", "[error]") {
    PmatError e{PmatError::BadRequest, "unexpected token"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[BadRequest]: unexpected token");
}

TEST_CASE("validation error carries field and reason", "[error]") {
    auto e = PmatError::validation("batch_size", "must be positive");
    REQUIRE(e.code == PmatError::ValidationFailed);
    REQUIRE(e.field == "batch_size");
    REQUIRE(e.reason == "must be positive");
    REQUIRE(e.message.find("batch_size") != std::string::npos);
}

TEST_CASE("HTTP status per code", "[error]") {
    REQUIRE(PmatError(PmatError::NotFound, "").http_status() == 404);
    REQUIRE(PmatError(PmatError::MethodNotFound, "").http_status() == 404);
    REQUIRE(PmatError(PmatError::BadRequest, "").http_status() == 400);
    REQUIRE(PmatError(PmatError::ValidationFailed, "").http_status() == 400);
    REQUIRE(PmatError(PmatError::Unauthorized, "").http_status() == 401);
    REQUIRE(PmatError(PmatError::Timeout, "").http_status() == 408);
    REQUIRE(PmatError(PmatError::Conflict, "").http_status() == 409);
    REQUIRE(PmatError(PmatError::ResourceExhausted, "").http_status() == 429);
    REQUIRE(PmatError(PmatError::Internal, "").http_status() == 500);
    REQUIRE(PmatError(PmatError::IO, "").http_status() == 500);
}

TEST_CASE("JSON-RPC code per code, with override", "[error]") {
    REQUIRE(PmatError(PmatError::MethodNotFound, "").rpc_code() == -32601);
    REQUIRE(PmatError(PmatError::NotFound, "").rpc_code() == -32001);
    REQUIRE(PmatError(PmatError::BadRequest, "").rpc_code() == -32602);
    REQUIRE(PmatError(PmatError::ValidationFailed, "").rpc_code() == -32602);
    REQUIRE(PmatError(PmatError::Internal, "").rpc_code() == -32000);

    PmatError e(PmatError::BadRequest, "bad render");
    e.with_rpc_code(rpc_codes::RenderError);
    REQUIRE(e.rpc_code() == -32004);
}

TEST_CASE("exit codes", "[error]") {
    REQUIRE(PmatError(PmatError::MethodNotFound, "").exit_code() == 2);
    REQUIRE(PmatError(PmatError::NotFound, "").exit_code() == 1);
    REQUIRE(PmatError(PmatError::Internal, "").exit_code() == 1);
}

TEST_CASE("retryable only for timeouts and flagged IO", "[error]") {
    REQUIRE(PmatError(PmatError::Timeout, "").is_retryable());
    REQUIRE(PmatError::io("disk busy", true).is_retryable());
    REQUIRE_FALSE(PmatError::io("disk gone").is_retryable());
    REQUIRE_FALSE(PmatError(PmatError::Internal, "").is_retryable());
}

TEST_CASE("code_name() for all codes", "[error]") {
    REQUIRE(std::string(PmatError::code_name(PmatError::NotFound)) == "NotFound");
    REQUIRE(std::string(PmatError::code_name(PmatError::MethodNotFound)) == "MethodNotFound");
    REQUIRE(std::string(PmatError::code_name(PmatError::ValidationFailed)) == "ValidationFailed");
    REQUIRE(std::string(PmatError::code_name(PmatError::ResourceExhausted)) == "ResourceExhausted");
    REQUIRE(std::string(PmatError::code_name(PmatError::Serialization)) == "Serialization");
}
