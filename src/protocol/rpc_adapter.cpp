#include <pmat/protocol/rpc_adapter.hpp>
#include <pmat/json.hpp>
#include <pmat/log.hpp>

#include <chrono>
#include <istream>
#include <ostream>

namespace pmat::protocol {

static bool is_notification(const std::string& method) {
    return method.rfind("notifications/", 0) == 0;
}

// params._meta carries the caller's trace id and timeout; it is not passed on
static Status take_meta(UnifiedRequest& req) {
    if (!req.params.isObject() || !req.params.isMember("_meta")) return ok_status();
    Json::Value meta = req.params["_meta"];
    req.params.removeMember("_meta");
    if (!meta.isObject()) return PmatError::validation("_meta", "must be an object");

    const Json::Value& trace = meta["trace_id"];
    if (!trace.isNull()) {
        if (!trace.isString()) return PmatError::validation("_meta.trace_id", "must be a string");
        req.trace_id = trace.asString();
    }
    const Json::Value& timeout = meta["timeout_ms"];
    if (!timeout.isNull()) {
        if (!timeout.isIntegral()) {
            return PmatError::validation("_meta.timeout_ms", "expected milliseconds");
        }
        req.deadline = Clock::now() + std::chrono::milliseconds(timeout.asInt64());
    }
    return ok_status();
}

Json::Value RpcAdapter::error_response(const Json::Value& id, const PmatError& e) {
    Json::Value resp(Json::objectValue);
    resp["jsonrpc"] = "2.0";
    resp["id"] = id;
    resp["error"] = error_object(e);
    return resp;
}

std::optional<std::string> RpcAdapter::handle_line(const std::string& line) const {
    auto parsed = json::parse(line);
    if (parsed.is_err()) {
        PmatError e = parsed.error();
        e.with_rpc_code(rpc_codes::ParseError);
        return json::compact(error_response(Json::Value(Json::nullValue), e));
    }
    const Json::Value& msg = parsed.value();
    if (!msg.isObject()) {
        PmatError e(PmatError::BadRequest, "request must be a JSON object");
        e.with_rpc_code(rpc_codes::InvalidRequest);
        return json::compact(error_response(Json::Value(Json::nullValue), e));
    }

    Json::Value id = msg.get("id", Json::Value(Json::nullValue));
    if (!id.isNull() && !id.isString() && !id.isIntegral()) {
        PmatError e(PmatError::BadRequest, "id must be a string or an integer");
        e.with_rpc_code(rpc_codes::InvalidRequest);
        return json::compact(error_response(Json::Value(Json::nullValue), e));
    }
    if (msg.isMember("jsonrpc") &&
        (!msg["jsonrpc"].isString() || msg["jsonrpc"].asString() != "2.0")) {
        PmatError e(PmatError::BadRequest, "unsupported jsonrpc version");
        e.with_rpc_code(rpc_codes::InvalidRequest);
        return json::compact(error_response(id, e));
    }
    if (!msg["method"].isString()) {
        PmatError e(PmatError::BadRequest, "method must be a string");
        e.with_rpc_code(rpc_codes::InvalidRequest);
        return json::compact(error_response(id, e));
    }

    std::string method = msg["method"].asString();
    UnifiedRequest req = UnifiedRequest::make(method, msg.get("params", Json::Value()), Source::Rpc);
    bool echo_trace = req.params.isObject() && req.params.isMember("_meta");
    Status meta = take_meta(req);
    UnifiedResponse resp = meta.is_ok() ? service_.handle(std::move(req))
                                        : UnifiedResponse::failure(meta.error(), req.trace_id);

    if (is_notification(method)) {
        if (!resp.ok) {
            log::warn("notification %s failed: %s", method.c_str(), resp.error->message.c_str());
        }
        return std::nullopt;
    }
    Json::Value out(Json::objectValue);
    if (resp.ok) {
        out["jsonrpc"] = "2.0";
        out["id"] = id;
        out["result"] = resp.body;
    } else {
        out = error_response(id, *resp.error);
    }
    if (echo_trace) out["_meta"]["trace_id"] = resp.trace_id;
    return json::compact(out);
}

size_t RpcAdapter::serve(std::istream& in, std::ostream& out) const {
    size_t handled = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        auto reply = handle_line(line);
        ++handled;
        if (reply) {
            out << *reply << '\n';
            out.flush();
        }
    }
    log::debug("rpc input closed after %zu messages", handled);
    return handled;
}

} // namespace pmat::protocol
