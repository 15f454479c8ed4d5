#pragma once

#include <memory>
#include <string>

namespace pmat {

// JSON-RPC error codes used on the wire
namespace rpc_codes {
constexpr int ParseError = -32700;
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams = -32602;
constexpr int ServerError = -32000;
constexpr int TemplateNotFound = -32001;
constexpr int InvalidUri = -32002;
constexpr int TemplateValidation = -32003;
constexpr int RenderError = -32004;
} // namespace rpc_codes

struct PmatError {
    enum Code {
        NotFound,
        MethodNotFound,
        BadRequest,
        ValidationFailed,
        Unauthorized,
        Timeout,
        Conflict,
        ResourceExhausted,
        Internal,
        IO,
        Serialization
    };

    Code code = Internal;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    // ValidationFailed detail
    std::string field;
    std::string reason;

    // Only meaningful for IO
    bool retryable = false;

    // Non-zero replaces the code's default JSON-RPC mapping
    int rpc_override = 0;

    std::shared_ptr<const PmatError> cause;

    PmatError() = default;
    PmatError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PmatError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    static PmatError validation(std::string field, std::string reason);
    static PmatError io(std::string msg, bool retryable = false);

    PmatError& with_cause(const PmatError& c);
    PmatError& with_file(std::string f, int l = 0);
    PmatError& with_rpc_code(int rpc);

    std::string format() const;
    static const char* code_name(Code c);

    int http_status() const;
    int rpc_code() const;
    int exit_code() const;
    bool is_retryable() const;
};

} // namespace pmat
