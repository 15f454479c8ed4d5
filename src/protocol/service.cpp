#include <pmat/protocol/service.hpp>
#include <pmat/log.hpp>
#include <pmat/uuid.hpp>

#include <exception>

namespace pmat::protocol {

void ProtocolService::add(std::string method, Handler handler) {
    handlers_[std::move(method)] = std::move(handler);
}

std::vector<std::string> ProtocolService::methods() const {
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (const auto& [name, h] : handlers_) out.push_back(name);
    return out;
}

UnifiedResponse ProtocolService::handle(UnifiedRequest request) const {
    auto started = Clock::now();
    if (request.trace_id.empty()) request.trace_id = Uuid::v4().to_string();

    auto finish = [&](UnifiedResponse r) {
        r.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        if (r.ok) {
            log::debug("[%s] %s via %s ok in %lldms", r.trace_id.c_str(), request.method.c_str(),
                       source_name(request.source), static_cast<long long>(r.duration.count()));
        } else {
            log::debug("[%s] %s via %s failed: %s", r.trace_id.c_str(), request.method.c_str(),
                       source_name(request.source), r.error->message.c_str());
        }
        return r;
    };

    if (request.deadline && Clock::now() >= *request.deadline) {
        return finish(UnifiedResponse::failure(
            PmatError(PmatError::Timeout, "deadline passed before '" + request.method + "' ran"),
            request.trace_id));
    }

    auto it = handlers_.find(request.method);
    if (it == handlers_.end()) {
        return finish(UnifiedResponse::failure(
            PmatError(PmatError::MethodNotFound, "method not found: " + request.method),
            request.trace_id));
    }

    if (request.params.isNull()) request.params = Json::Value(Json::objectValue);
    if (!request.params.isObject()) {
        return finish(UnifiedResponse::failure(
            PmatError(PmatError::BadRequest, "params must be an object"), request.trace_id));
    }

    CancelToken cancel = request.deadline ? CancelToken::until(*request.deadline) : CancelToken();
    Result<Json::Value> result = PmatError(PmatError::Internal, "handler did not run");
    try {
        result = it->second(request.params, cancel);
    } catch (const std::exception& e) {
        log::error("[%s] %s threw: %s", request.trace_id.c_str(), request.method.c_str(), e.what());
        result = PmatError(PmatError::Internal,
                           "handler for '" + request.method + "' failed: " + e.what());
    } catch (...) {
        log::error("[%s] %s threw a non-standard exception", request.trace_id.c_str(),
                   request.method.c_str());
        result = PmatError(PmatError::Internal, "handler for '" + request.method + "' failed");
    }

    if (result.is_err()) {
        return finish(UnifiedResponse::failure(std::move(result).error(), request.trace_id));
    }
    return finish(UnifiedResponse::success(std::move(result).value(), request.trace_id));
}

} // namespace pmat::protocol
