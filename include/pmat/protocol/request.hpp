#pragma once

#include <pmat/cancel.hpp>
#include <pmat/error.hpp>
#include <json/json.h>
#include <chrono>
#include <optional>
#include <string>

namespace pmat::protocol {

enum class Source { Cli, Http, Rpc };

const char* source_name(Source s);

// One request shape for every front end. Handlers never look at source.
struct UnifiedRequest {
    std::string method;
    Json::Value params{Json::objectValue};
    std::string trace_id;   // generated when empty
    Source source = Source::Cli;
    std::optional<Clock::time_point> deadline;

    static UnifiedRequest make(std::string method, Json::Value params, Source source);
};

struct UnifiedResponse {
    bool ok = false;
    Json::Value body;                  // result when ok
    std::optional<PmatError> error;    // set when !ok
    std::string trace_id;
    std::chrono::milliseconds duration{0};

    static UnifiedResponse success(Json::Value body, std::string trace_id);
    static UnifiedResponse failure(PmatError error, std::string trace_id);
};

// {code, message, data: {kind, hint?, field?, reason?, retryable, cause?}}
Json::Value error_object(const PmatError& e);

} // namespace pmat::protocol
