#include <pmat/error.hpp>

namespace pmat {

PmatError PmatError::validation(std::string field, std::string reason) {
    PmatError e(ValidationFailed, "validation failed for '" + field + "': " + reason);
    e.field = std::move(field);
    e.reason = std::move(reason);
    return e;
}

PmatError PmatError::io(std::string msg, bool retryable) {
    PmatError e(IO, std::move(msg));
    e.retryable = retryable;
    return e;
}

PmatError& PmatError::with_cause(const PmatError& c) {
    cause = std::make_shared<const PmatError>(c);
    return *this;
}

PmatError& PmatError::with_file(std::string f, int l) {
    file = std::move(f);
    line = l;
    return *this;
}

PmatError& PmatError::with_rpc_code(int rpc) {
    rpc_override = rpc;
    return *this;
}

const char* PmatError::code_name(Code c) {
    switch (c) {
        case NotFound:          return "NotFound";
        case MethodNotFound:    return "MethodNotFound";
        case BadRequest:        return "BadRequest";
        case ValidationFailed:  return "ValidationFailed";
        case Unauthorized:      return "Unauthorized";
        case Timeout:           return "Timeout";
        case Conflict:          return "Conflict";
        case ResourceExhausted: return "ResourceExhausted";
        case Internal:          return "Internal";
        case IO:                return "IO";
        case Serialization:     return "Serialization";
    }
    return "Unknown";
}

std::string PmatError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    // Walk the cause chain, one line per level
    for (auto c = cause; c; c = c->cause) {
        result += "\n  caused by: ";
        result += code_name(c->code);
        result += ": ";
        result += c->message;
    }

    return result;
}

int PmatError::http_status() const {
    switch (code) {
        case NotFound:
        case MethodNotFound:    return 404;
        case BadRequest:
        case ValidationFailed:  return 400;
        case Unauthorized:      return 401;
        case Timeout:           return 408;
        case Conflict:          return 409;
        case ResourceExhausted: return 429;
        case Internal:
        case IO:
        case Serialization:     return 500;
    }
    return 500;
}

int PmatError::rpc_code() const {
    if (rpc_override != 0) return rpc_override;
    switch (code) {
        case NotFound:         return rpc_codes::TemplateNotFound;
        case MethodNotFound:   return rpc_codes::MethodNotFound;
        case BadRequest:
        case ValidationFailed: return rpc_codes::InvalidParams;
        default:               return rpc_codes::ServerError;
    }
}

int PmatError::exit_code() const {
    return code == MethodNotFound ? 2 : 1;
}

bool PmatError::is_retryable() const {
    return code == Timeout || (code == IO && retryable);
}

} // namespace pmat
