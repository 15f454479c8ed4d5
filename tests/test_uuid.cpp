#include <catch2/catch.hpp>
#include <pmat/protocol/service.hpp>
#include <pmat/refactor/state_machine.hpp>
#include <pmat/uuid.hpp>
#include <set>

using namespace pmat;

TEST_CASE("UUID v4 version and variant bits", "[uuid]") {
    auto u = Uuid::v4();
    REQUIRE((u.bytes[6] & 0xF0) == 0x40);
    REQUIRE((u.bytes[8] & 0xC0) == 0x80);
}

TEST_CASE("UUID v4 generates unique values", "[uuid]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        REQUIRE(seen.insert(Uuid::v4().to_string()).second);
    }
}

TEST_CASE("UUID to_string format", "[uuid]") {
    auto s = Uuid::v4().to_string();
    REQUIRE(s.size() == 36);
    REQUIRE(s[8] == '-');
    REQUIRE(s[13] == '-');
    REQUIRE(s[14] == '4');
    REQUIRE(s[18] == '-');
    REQUIRE(s[23] == '-');
}

TEST_CASE("session and trace ids carry a v4 uuid", "[uuid]") {
    auto cfg = refactor::RefactorConfig::create(RefactorSettings{}, 4).value();
    refactor::RefactorStateMachine sm(refactor::RefactorStateMachine::new_session_id(), {}, cfg);
    const std::string prefix = "refactor-session-";
    REQUIRE(sm.session_id().rfind(prefix, 0) == 0);
    std::string uuid = sm.session_id().substr(prefix.size());
    REQUIRE(uuid.size() == 36);
    REQUIRE(uuid[14] == '4');
    REQUIRE(refactor::RefactorStateMachine::new_session_id() != sm.session_id());

    protocol::ProtocolService service;
    auto resp = service.handle(protocol::UnifiedRequest::make("x", Json::Value(),
                                                              protocol::Source::Cli));
    REQUIRE(resp.trace_id.size() == 36);
    REQUIRE(resp.trace_id[14] == '4');
}

TEST_CASE("UUID equality operators", "[uuid]") {
    auto a = Uuid::v4();
    auto b = a;
    REQUIRE(a == b);
    REQUIRE(a != Uuid::v4());
}
