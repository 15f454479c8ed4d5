#pragma once

#include <pmat/config.hpp>
#include <pmat/protocol/service.hpp>
#include <boost/asio.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace pmat::protocol {

struct HttpRequest {
    std::string method;
    std::string target;
    std::map<std::string, std::string> headers;   // lowercase names
    std::string body;

    std::string header(const std::string& name) const;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::map<std::string, std::string> headers;
    std::string body;

    std::string serialize() const;
};

// Request line and headers up to the blank line; body is left empty.
// BadRequest on malformed input.
Result<HttpRequest> parse_http_head(const std::string& head);

// POST / and /rpc take {method, params, id?}; POST /api/v1/<method> takes
// the params as the body. The reply mirrors the JSON-RPC shape with the
// HTTP status of the error. GET /health reports liveness.
HttpResponse route_http(const ProtocolService& service, const HttpRequest& req);

const char* http_reason(int status);

// One thread per connection, one request per connection.
class HttpServer {
public:
    HttpServer(const ProtocolService& service, ServerSettings settings);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and listen. Port 0 picks a free port.
    Status start();
    uint16_t port() const { return port_; }

    // Accept until stop(); blocks the calling thread
    void run();

    // Stop accepting and wait for open connections to finish
    void stop();

private:
    void accept_next();
    void serve_connection(boost::asio::ip::tcp::socket socket);

    const ProtocolService& service_;
    ServerSettings settings_;
    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};

    std::mutex conn_mutex_;
    std::condition_variable conn_cv_;
    size_t open_connections_ = 0;
};

} // namespace pmat::protocol
