#include <catch2/catch.hpp>
#include <pmat/protocol/service.hpp>
#include <stdexcept>

using namespace pmat;
using namespace pmat::protocol;

namespace {

ProtocolService echo_service() {
    ProtocolService service;
    service.add("echo", [](const Json::Value& p, const CancelToken&) {
        return Result<Json::Value>::ok(p);
    });
    service.add("fail", [](const Json::Value&, const CancelToken&) {
        return Result<Json::Value>(PmatError::validation("name", "must not be empty"));
    });
    service.add("throw", [](const Json::Value&, const CancelToken&) -> Result<Json::Value> {
        throw std::runtime_error("boom");
    });
    service.add("deadline", [](const Json::Value&, const CancelToken& cancel) {
        return Result<Json::Value>::ok(Json::Value(cancel.deadline().has_value()));
    });
    return service;
}

} // namespace

TEST_CASE("service dispatches by method name", "[service]") {
    auto service = echo_service();
    Json::Value params(Json::objectValue);
    params["x"] = 1;
    auto resp = service.handle(UnifiedRequest::make("echo", params, Source::Cli));
    REQUIRE(resp.ok);
    REQUIRE(resp.body == params);
    REQUIRE_FALSE(resp.error.has_value());
    REQUIRE(resp.trace_id.size() == 36);

    REQUIRE(service.has("echo"));
    REQUIRE_FALSE(service.has("nope"));
    REQUIRE(service.methods() == std::vector<std::string>{"deadline", "echo", "fail", "throw"});
}

TEST_CASE("service keeps a caller trace id", "[service]") {
    auto service = echo_service();
    auto req = UnifiedRequest::make("echo", Json::Value(), Source::Http);
    req.trace_id = "trace-1";
    auto resp = service.handle(req);
    REQUIRE(resp.ok);
    REQUIRE(resp.trace_id == "trace-1");
    REQUIRE(resp.body == Json::Value(Json::objectValue));
}

TEST_CASE("unknown methods are reported by name", "[service]") {
    auto service = echo_service();
    auto resp = service.handle(UnifiedRequest::make("nonexistent", Json::Value(), Source::Rpc));
    REQUIRE_FALSE(resp.ok);
    REQUIRE(resp.error->code == PmatError::MethodNotFound);
    REQUIRE(resp.error->message == "method not found: nonexistent");
    REQUIRE(resp.error->rpc_code() == -32601);
    REQUIRE(resp.error->http_status() == 404);
    REQUIRE(resp.error->exit_code() == 2);
}

TEST_CASE("params must be an object", "[service]") {
    auto service = echo_service();
    auto req = UnifiedRequest::make("echo", Json::Value(), Source::Rpc);
    req.params = Json::Value(Json::arrayValue);
    auto resp = service.handle(req);
    REQUIRE_FALSE(resp.ok);
    REQUIRE(resp.error->code == PmatError::BadRequest);
    REQUIRE(resp.error->rpc_code() == -32602);
}

TEST_CASE("handler errors and exceptions", "[service]") {
    auto service = echo_service();
    auto failed = service.handle(UnifiedRequest::make("fail", Json::Value(), Source::Cli));
    REQUIRE_FALSE(failed.ok);
    REQUIRE(failed.error->code == PmatError::ValidationFailed);
    REQUIRE(failed.error->field == "name");

    auto thrown = service.handle(UnifiedRequest::make("throw", Json::Value(), Source::Cli));
    REQUIRE_FALSE(thrown.ok);
    REQUIRE(thrown.error->code == PmatError::Internal);
    REQUIRE(thrown.error->message == "handler for 'throw' failed: boom");
}

TEST_CASE("deadlines reach the handler or stop it early", "[service]") {
    auto service = echo_service();
    auto req = UnifiedRequest::make("deadline", Json::Value(), Source::Http);
    req.deadline = Clock::now() + std::chrono::seconds(30);
    auto resp = service.handle(req);
    REQUIRE(resp.ok);
    REQUIRE(resp.body.asBool());

    req.deadline = Clock::now() - std::chrono::milliseconds(1);
    auto late = service.handle(req);
    REQUIRE_FALSE(late.ok);
    REQUIRE(late.error->code == PmatError::Timeout);
    REQUIRE(late.error->is_retryable());

    // Unknown methods past their deadline still time out first
    req.method = "nonexistent";
    REQUIRE(service.handle(req).error->code == PmatError::Timeout);
}

TEST_CASE("error objects carry kind and detail", "[service]") {
    PmatError e = PmatError::validation("limit", "must not be negative");
    e.hint = "pass a positive number";
    e.with_cause(PmatError::io("disk full", true));
    Json::Value obj = error_object(e);
    REQUIRE(obj["code"].asInt() == -32602);
    REQUIRE(obj["message"].asString() == "validation failed for 'limit': must not be negative");
    REQUIRE(obj["data"]["kind"].asString() == "ValidationFailed");
    REQUIRE(obj["data"]["field"].asString() == "limit");
    REQUIRE(obj["data"]["reason"].asString() == "must not be negative");
    REQUIRE(obj["data"]["hint"].asString() == "pass a positive number");
    REQUIRE_FALSE(obj["data"]["retryable"].asBool());
    REQUIRE(obj["data"]["causes"].size() == 1);
    REQUIRE(obj["data"]["causes"][0].asString() == "IO: disk full");

    Json::Value plain = error_object(PmatError(PmatError::Timeout, "slow"));
    REQUIRE(plain["code"].asInt() == -32000);
    REQUIRE(plain["data"]["retryable"].asBool());
    REQUIRE_FALSE(plain["data"].isMember("hint"));
    REQUIRE_FALSE(plain["data"].isMember("causes"));

    PmatError missing(PmatError::NotFound, "template not found: x");
    REQUIRE(error_object(missing)["code"].asInt() == -32001);
    missing.with_rpc_code(rpc_codes::InvalidUri);
    REQUIRE(error_object(missing)["code"].asInt() == -32002);
}
