#include <pmat/protocol/http_adapter.hpp>
#include <pmat/app_context.hpp>
#include <pmat/json.hpp>
#include <pmat/log.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <thread>

namespace asio = boost::asio;
using asio::ip::tcp;

namespace pmat::protocol {

static constexpr size_t MAX_HEAD_BYTES = 64 * 1024;
static constexpr size_t MAX_BODY_BYTES = 16 * 1024 * 1024;
static const char* API_PREFIX = "/api/v1/";

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(lower(name));
    return it == headers.end() ? "" : it->second;
}

const char* http_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        default: return "Internal Server Error";
    }
}

std::string HttpResponse::serialize() const {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << " " << http_reason(status) << "\r\n";
    out << "Content-Type: " << content_type << "\r\n";
    out << "Content-Length: " << body.size() << "\r\n";
    for (const auto& [name, value] : headers) out << name << ": " << value << "\r\n";
    out << "Connection: close\r\n\r\n";
    out << body;
    return out.str();
}

Result<HttpRequest> parse_http_head(const std::string& head) {
    std::istringstream in(head);
    std::string line;
    if (!std::getline(in, line)) return PmatError(PmatError::BadRequest, "empty request");
    if (!line.empty() && line.back() == '\r') line.pop_back();

    HttpRequest req;
    std::istringstream request_line(line);
    std::string version;
    if (!(request_line >> req.method >> req.target >> version) ||
        version.rfind("HTTP/1.", 0) != 0) {
        return PmatError(PmatError::BadRequest, "malformed request line: " + line);
    }

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return PmatError(PmatError::BadRequest, "malformed header: " + line);
        }
        req.headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return Result<HttpRequest>::ok(std::move(req));
}

static HttpResponse json_reply(int status, const Json::Value& body) {
    HttpResponse resp;
    resp.status = status;
    resp.body = json::compact(body);
    return resp;
}

static HttpResponse rpc_reply(const UnifiedResponse& r, const Json::Value& id) {
    Json::Value body(Json::objectValue);
    body["jsonrpc"] = "2.0";
    body["id"] = id;
    int status = 200;
    if (r.ok) {
        body["result"] = r.body;
    } else {
        body["error"] = error_object(*r.error);
        status = r.error->http_status();
    }
    HttpResponse resp = json_reply(status, body);
    resp.headers["X-Trace-Id"] = r.trace_id;
    resp.headers["X-Duration-Ms"] = std::to_string(r.duration.count());
    return resp;
}

static HttpResponse error_reply(const PmatError& e, const Json::Value& id = Json::Value()) {
    Json::Value body(Json::objectValue);
    body["jsonrpc"] = "2.0";
    body["id"] = id;
    body["error"] = error_object(e);
    return json_reply(e.http_status(), body);
}

HttpResponse route_http(const ProtocolService& service, const HttpRequest& req) {
    std::string path = req.target.substr(0, req.target.find('?'));

    if (path == "/health") {
        if (req.method != "GET" && req.method != "HEAD") {
            HttpResponse r = json_reply(405, Json::Value(Json::objectValue));
            r.headers["Allow"] = "GET";
            return r;
        }
        Json::Value body(Json::objectValue);
        body["status"] = "ok";
        body["version"] = version_string();
        body["methods"] = static_cast<Json::UInt64>(service.methods().size());
        return json_reply(200, body);
    }

    bool api = path.rfind(API_PREFIX, 0) == 0;
    if (!api && path != "/" && path != "/rpc") {
        return error_reply(PmatError(PmatError::NotFound, "no route for " + path));
    }
    if (req.method != "POST") {
        HttpResponse r = json_reply(405, Json::Value(Json::objectValue));
        r.headers["Allow"] = "POST";
        return r;
    }

    Json::Value payload(Json::objectValue);
    if (trim(req.body).size() > 0) {
        auto parsed = json::parse(req.body);
        if (parsed.is_err()) {
            PmatError e = parsed.error();
            e.with_rpc_code(rpc_codes::ParseError);
            return error_reply(e);
        }
        payload = parsed.value();
    }
    if (!payload.isObject()) {
        return error_reply(PmatError(PmatError::BadRequest, "request body must be a JSON object"));
    }

    UnifiedRequest ureq;
    Json::Value id(Json::nullValue);
    if (api) {
        ureq = UnifiedRequest::make(path.substr(std::string(API_PREFIX).size()), payload,
                                    Source::Http);
    } else {
        id = payload.get("id", Json::Value(Json::nullValue));
        if (!payload["method"].isString()) {
            PmatError e(PmatError::BadRequest, "method must be a string");
            e.with_rpc_code(rpc_codes::InvalidRequest);
            return error_reply(e, id);
        }
        ureq = UnifiedRequest::make(payload["method"].asString(),
                                    payload.get("params", Json::Value()), Source::Http);
    }

    ureq.trace_id = req.header("x-trace-id");
    std::string timeout = req.header("x-timeout-ms");
    if (!timeout.empty()) {
        char* end = nullptr;
        long long ms = std::strtoll(timeout.c_str(), &end, 10);
        if (end == timeout.c_str() || *end != '\0') {
            return error_reply(PmatError::validation("X-Timeout-Ms", "expected milliseconds"), id);
        }
        ureq.deadline = Clock::now() + std::chrono::milliseconds(ms);
    }
    return rpc_reply(service.handle(std::move(ureq)), id);
}

// ---------------------------------------------------------------------------
// Server
// ---------------------------------------------------------------------------

HttpServer::HttpServer(const ProtocolService& service, ServerSettings settings)
    : service_(service), settings_(std::move(settings)), acceptor_(io_) {}

HttpServer::~HttpServer() {
    stop();
}

Status HttpServer::start() {
    boost::system::error_code ec;
    auto address = asio::ip::make_address(settings_.host, ec);
    if (ec) {
        return PmatError::validation("server.host", "invalid address '" + settings_.host + "'");
    }
    if (settings_.port < 0 || settings_.port > 65535) {
        return PmatError::validation("server.port", "must be between 0 and 65535");
    }
    tcp::endpoint endpoint(address, static_cast<uint16_t>(settings_.port));

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        return PmatError::io("cannot listen on " + settings_.host + ":" +
                             std::to_string(settings_.port) + ": " + ec.message());
    }
    port_ = acceptor_.local_endpoint().port();
    log::info("http listening on %s:%u", settings_.host.c_str(), static_cast<unsigned>(port_));
    accept_next();
    return ok_status();
}

void HttpServer::accept_next() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec) {
            if (ec != asio::error::operation_aborted) {
                log::warn("http accept failed: %s", ec.message().c_str());
            }
            if (!stopping_ && acceptor_.is_open()) accept_next();
            return;
        }
        {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            ++open_connections_;
        }
        std::thread([this, s = std::move(socket)]() mutable {
            serve_connection(std::move(s));
            std::lock_guard<std::mutex> lock(conn_mutex_);
            --open_connections_;
            conn_cv_.notify_all();
        }).detach();
        if (!stopping_) accept_next();
    });
}

void HttpServer::run() {
    io_.run();
}

void HttpServer::stop() {
    if (stopping_.exchange(true)) return;
    asio::post(io_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
    io_.stop();
    std::unique_lock<std::mutex> lock(conn_mutex_);
    conn_cv_.wait(lock, [this] { return open_connections_ == 0; });
}

void HttpServer::serve_connection(tcp::socket socket) {
    boost::system::error_code ec;
    asio::streambuf buf(MAX_HEAD_BYTES);
    size_t head_len = asio::read_until(socket, buf, "\r\n\r\n", ec);

    HttpResponse resp;
    if (ec) {
        if (ec == asio::error::not_found) {
            resp = error_reply(PmatError(PmatError::BadRequest, "request head too large"));
        } else {
            log::debug("http read failed: %s", ec.message().c_str());
            return;
        }
    } else {
        std::string data(asio::buffers_begin(buf.data()), asio::buffers_end(buf.data()));
        std::string head = data.substr(0, head_len);
        std::string body = data.substr(head_len);

        auto req = parse_http_head(head);
        if (req.is_err()) {
            resp = error_reply(req.error());
        } else {
            size_t length = 0;
            std::string cl = req.value().header("content-length");
            bool bad_length = false;
            if (!cl.empty()) {
                char* end = nullptr;
                unsigned long long n = std::strtoull(cl.c_str(), &end, 10);
                bad_length = end == cl.c_str() || *end != '\0';
                length = static_cast<size_t>(n);
            }
            if (bad_length) {
                resp = error_reply(PmatError(PmatError::BadRequest, "invalid Content-Length"));
            } else if (length > MAX_BODY_BYTES) {
                resp = error_reply(PmatError(PmatError::ResourceExhausted, "request body too large"));
            } else {
                if (body.size() < length) {
                    std::string rest(length - body.size(), '\0');
                    asio::read(socket, asio::buffer(&rest[0], rest.size()), ec);
                    if (ec) {
                        log::debug("http body read failed: %s", ec.message().c_str());
                        return;
                    }
                    body += rest;
                }
                req.value().body = body.substr(0, length);
                resp = route_http(service_, req.value());
                log::debug("%s %s -> %d", req.value().method.c_str(), req.value().target.c_str(),
                           resp.status);
            }
        }
    }

    std::string out = resp.serialize();
    asio::write(socket, asio::buffer(out), ec);
    if (ec) log::debug("http write failed: %s", ec.message().c_str());
    socket.shutdown(tcp::socket::shutdown_both, ec);
}

} // namespace pmat::protocol
