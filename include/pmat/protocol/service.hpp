#pragma once

#include <pmat/cancel.hpp>
#include <pmat/protocol/request.hpp>
#include <pmat/result.hpp>
#include <json/json.h>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace pmat::protocol {

using Handler = std::function<Result<Json::Value>(const Json::Value& params,
                                                  const CancelToken& cancel)>;

// Routes a UnifiedRequest to its handler by method name. Thread safe once
// every method is registered.
class ProtocolService {
public:
    // Replaces an existing registration of the same name
    void add(std::string method, Handler handler);

    bool has(const std::string& method) const { return handlers_.count(method) != 0; }
    std::vector<std::string> methods() const;

    // Never throws. Past deadlines fail with Timeout before the handler runs,
    // unknown methods with MethodNotFound, escaping exceptions become Internal.
    UnifiedResponse handle(UnifiedRequest request) const;

private:
    std::map<std::string, Handler> handlers_;
};

} // namespace pmat::protocol
