#include <pmat/protocol/request.hpp>

namespace pmat::protocol {

const char* source_name(Source s) {
    switch (s) {
        case Source::Cli: return "cli";
        case Source::Http: return "http";
        case Source::Rpc: return "rpc";
    }
    return "cli";
}

UnifiedRequest UnifiedRequest::make(std::string method, Json::Value params, Source source) {
    UnifiedRequest r;
    r.method = std::move(method);
    r.params = params.isNull() ? Json::Value(Json::objectValue) : std::move(params);
    r.source = source;
    return r;
}

UnifiedResponse UnifiedResponse::success(Json::Value body, std::string trace_id) {
    UnifiedResponse r;
    r.ok = true;
    r.body = std::move(body);
    r.trace_id = std::move(trace_id);
    return r;
}

UnifiedResponse UnifiedResponse::failure(PmatError error, std::string trace_id) {
    UnifiedResponse r;
    r.ok = false;
    r.error = std::move(error);
    r.trace_id = std::move(trace_id);
    return r;
}

Json::Value error_object(const PmatError& e) {
    Json::Value err(Json::objectValue);
    err["code"] = e.rpc_code();
    err["message"] = e.message;

    Json::Value data(Json::objectValue);
    data["kind"] = PmatError::code_name(e.code);
    data["retryable"] = e.is_retryable();
    if (!e.hint.empty()) data["hint"] = e.hint;
    if (!e.field.empty()) data["field"] = e.field;
    if (!e.reason.empty()) data["reason"] = e.reason;
    if (!e.file.empty()) data["file"] = e.file;

    Json::Value causes(Json::arrayValue);
    for (auto c = e.cause; c; c = c->cause) {
        causes.append(std::string(PmatError::code_name(c->code)) + ": " + c->message);
    }
    if (!causes.empty()) data["causes"] = causes;
    err["data"] = data;
    return err;
}

} // namespace pmat::protocol
