#pragma once

#include <pmat/protocol/service.hpp>
#include <iosfwd>
#include <optional>
#include <string>

namespace pmat::protocol {

// Line-delimited JSON-RPC 2.0: one request object per line in, one
// response object per line out, in order.
class RpcAdapter {
public:
    explicit RpcAdapter(const ProtocolService& service) : service_(service) {}

    // Response line without the trailing newline. Methods under
    // "notifications/" get no response; any other message does, with
    // id null when the request had none.
    std::optional<std::string> handle_line(const std::string& line) const;

    // Serve until EOF on in. Returns the number of messages handled.
    size_t serve(std::istream& in, std::ostream& out) const;

    static Json::Value error_response(const Json::Value& id, const PmatError& e);

private:
    const ProtocolService& service_;
};

} // namespace pmat::protocol
