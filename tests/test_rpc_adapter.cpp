#include <catch2/catch.hpp>
#include <pmat/json.hpp>
#include <pmat/protocol/rpc_adapter.hpp>
#include <atomic>
#include <sstream>

using namespace pmat;
using namespace pmat::protocol;

namespace {

struct RpcFixture {
    ProtocolService service;
    std::atomic<int> notified{0};

    RpcFixture() {
        service.add("echo", [](const Json::Value& p, const CancelToken&) {
            return Result<Json::Value>::ok(p);
        });
        service.add("notifications/initialized", [this](const Json::Value&, const CancelToken&) {
            notified++;
            return Result<Json::Value>::ok(Json::Value());
        });
    }

    Json::Value reply(const std::string& line) {
        RpcAdapter rpc(service);
        auto out = rpc.handle_line(line);
        if (!out) return Json::Value();
        return json::parse(*out).value();
    }
};

} // namespace

TEST_CASE("rpc returns results under the request id", "[rpc]") {
    RpcFixture f;
    auto r = f.reply(R"({"jsonrpc":"2.0","id":7,"method":"echo","params":{"a":"b"}})");
    REQUIRE(r["jsonrpc"].asString() == "2.0");
    REQUIRE(r["id"].asInt() == 7);
    REQUIRE(r["result"]["a"].asString() == "b");
    REQUIRE_FALSE(r.isMember("error"));

    auto s = f.reply(R"({"id":"abc","method":"echo"})");
    REQUIRE(s["id"].asString() == "abc");
    REQUIRE(s["result"] == Json::Value(Json::objectValue));
}

TEST_CASE("rpc responses are single lines", "[rpc]") {
    RpcFixture f;
    RpcAdapter rpc(f.service);
    auto out = rpc.handle_line(R"({"id":1,"method":"echo","params":{"x":[1,2]}})");
    REQUIRE(out.has_value());
    REQUIRE(out->find('\n') == std::string::npos);
}

TEST_CASE("rpc error codes", "[rpc]") {
    RpcFixture f;

    auto parse = f.reply("{not json");
    REQUIRE(parse["error"]["code"].asInt() == -32700);
    REQUIRE(parse["id"].isNull());

    auto array = f.reply("[1,2]");
    REQUIRE(array["error"]["code"].asInt() == -32600);

    auto bad_id = f.reply(R"({"id":{"x":1},"method":"echo"})");
    REQUIRE(bad_id["error"]["code"].asInt() == -32600);
    REQUIRE(bad_id["id"].isNull());

    auto version = f.reply(R"({"jsonrpc":"1.0","id":3,"method":"echo"})");
    REQUIRE(version["error"]["code"].asInt() == -32600);
    REQUIRE(version["id"].asInt() == 3);

    auto no_method = f.reply(R"({"id":4,"method":12})");
    REQUIRE(no_method["error"]["code"].asInt() == -32600);

    auto unknown = f.reply(R"({"id":5,"method":"nonexistent"})");
    REQUIRE(unknown["error"]["code"].asInt() == -32601);
    REQUIRE(unknown["error"]["message"].asString() == "method not found: nonexistent");
    REQUIRE(unknown["error"]["data"]["kind"].asString() == "MethodNotFound");

    auto params = f.reply(R"({"id":6,"method":"echo","params":[1]})");
    REQUIRE(params["error"]["code"].asInt() == -32602);
}

TEST_CASE("requests without an id still get a response", "[rpc]") {
    RpcFixture f;
    auto r = f.reply(R"({"method":"echo"})");
    REQUIRE(r.isMember("id"));
    REQUIRE(r["id"].isNull());
    REQUIRE(r.isMember("result"));
}

TEST_CASE("notifications get no response", "[rpc]") {
    RpcFixture f;
    RpcAdapter rpc(f.service);
    REQUIRE_FALSE(rpc.handle_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
    REQUIRE(f.notified.load() == 1);
    // Unregistered notifications are dropped as well
    REQUIRE_FALSE(rpc.handle_line(R"({"method":"notifications/cancelled"})"));
}

TEST_CASE("serve answers each line in order", "[rpc]") {
    RpcFixture f;
    RpcAdapter rpc(f.service);
    std::istringstream in(
        "{\"id\":1,\"method\":\"echo\",\"params\":{\"n\":1}}\n"
        "\n"
        "{\"method\":\"notifications/initialized\"}\r\n"
        "   \n"
        "{\"id\":2,\"method\":\"echo\",\"params\":{\"n\":2}}\n");
    std::ostringstream out;
    REQUIRE(rpc.serve(in, out) == 3);

    std::istringstream lines(out.str());
    std::string line;
    std::vector<Json::Value> replies;
    while (std::getline(lines, line)) replies.push_back(json::parse(line).value());
    REQUIRE(replies.size() == 2);
    REQUIRE(replies[0]["id"].asInt() == 1);
    REQUIRE(replies[0]["result"]["n"].asInt() == 1);
    REQUIRE(replies[1]["id"].asInt() == 2);
    REQUIRE(replies[1]["result"]["n"].asInt() == 2);
    REQUIRE(f.notified.load() == 1);
}

TEST_CASE("rpc reads trace id and timeout from params._meta", "[rpc]") {
    RpcFixture f;

    auto traced = f.reply(
        R"({"id":1,"method":"echo","params":{"a":1,"_meta":{"trace_id":"t-42","timeout_ms":60000}}})");
    REQUIRE(traced["result"]["a"].asInt() == 1);
    REQUIRE_FALSE(traced["result"].isMember("_meta"));
    REQUIRE(traced["_meta"]["trace_id"].asString() == "t-42");

    auto late = f.reply(
        R"({"id":2,"method":"echo","params":{"_meta":{"trace_id":"t-43","timeout_ms":-5}}})");
    REQUIRE(late["error"]["code"].asInt() == rpc_codes::ServerError);
    REQUIRE(late["error"]["data"]["kind"].asString() == "Timeout");
    REQUIRE(late["_meta"]["trace_id"].asString() == "t-43");

    auto bad = f.reply(R"({"id":3,"method":"echo","params":{"_meta":{"timeout_ms":"soon"}}})");
    REQUIRE(bad["error"]["code"].asInt() == rpc_codes::InvalidParams);
    REQUIRE(bad["error"]["data"]["field"].asString() == "_meta.timeout_ms");

    // Without _meta nothing is echoed
    auto plain = f.reply(R"({"id":4,"method":"echo","params":{}})");
    REQUIRE_FALSE(plain.isMember("_meta"));
}
