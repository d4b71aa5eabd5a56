#include "trace_server.hpp"
#include "diag_logger.hpp"
#include "echo_message.hpp"
#include "json_log.hpp"
#include "request_target.hpp"
#include "result_aggregator.hpp"
#include "trace_errors.hpp"
#include "trace_session.hpp"
#include "uuid.hpp"
#include "zero_trace.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <cerrno>
#include <chrono>
#include <iostream>
#include <poll.h>
#include <sys/socket.h>
#include <thread>

namespace zt {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

namespace {

constexpr int kHeadTimeoutMs = 10000;
constexpr auto kAcceptPoll = std::chrono::milliseconds(50);
constexpr std::size_t kMaxEchoMessage = 1 << 20;

const char* kIndexPage =
    "This server measures network latency and traces the route back to\n"
    "visitors who take part in a VPN detection study. Probes only follow\n"
    "the connection you opened. Contact the operator to opt out.\n";

bool wait_readable(int fd, int timeout_ms) {
    pollfd p{};
    p.fd = fd;
    p.events = POLLIN;
    return ::poll(&p, 1, timeout_ms) > 0;
}

} // namespace

TraceServer::TraceServer(const ServerConfig& cfg, ZeroTrace& engine, JsonLineLogger& records,
                         DiagLogger* diag)
    : cfg_(cfg), engine_(engine), records_(records), diag_(diag) {}

TraceServer::~TraceServer() {
    stop();
}

void TraceServer::error(const std::string& what) {
    if (diag_)
        diag_->error(what);
    else
        std::cerr << what << '\n';
}

void TraceServer::reply(tcp::socket& sock, unsigned version, http::status status,
                        const std::string& body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::server, "zerotrace");
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.keep_alive(false);
    res.body() = body;
    res.prepare_payload();

    beast::error_code ec;
    http::write(sock, res, ec);
    if (ec)
        error("write: " + ec.message());
}

void TraceServer::send_close(WsStream& ws, websocket::close_code code) {
    beast::error_code ec;
    ws.close(code, ec);
    if (ec && ec != websocket::error::closed && ec != asio::error::eof)
        error("close: " + ec.message());
}

void TraceServer::listen() {
    tcp::endpoint ep{tcp::v4(), static_cast<uint16_t>(cfg_.port)};
    beast::error_code ec;
    acceptor_.open(ep.protocol(), ec);
    if (!ec)
        acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec)
        acceptor_.bind(ep, ec);
    if (!ec)
        acceptor_.listen(64, ec);
    if (!ec)
        acceptor_.non_blocking(true, ec);
    if (ec)
        throw ConfigurationError("listen on port " + std::to_string(cfg_.port) + " failed: " + ec.message());
    running_ = true;
}

uint16_t TraceServer::local_port() const {
    beast::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void TraceServer::track(int fd) {
    std::lock_guard<std::mutex> lk(clients_mu_);
    clients_.insert(fd);
}

void TraceServer::untrack(int fd) {
    std::lock_guard<std::mutex> lk(clients_mu_);
    auto it = clients_.find(fd);
    if (it != clients_.end())
        clients_.erase(it);
    clients_cv_.notify_all();
}

void TraceServer::shutdown_clients() {
    std::lock_guard<std::mutex> lk(clients_mu_);
    for (int fd : clients_) {
        // blocked reads return, and a running trace sees its connection close
        if (::shutdown(fd, SHUT_RDWR) < 0 && errno != ENOTCONN)
            error("shutdown client fd " + std::to_string(fd) + " failed");
    }
}

void TraceServer::serve() {
    while (running_) {
        tcp::socket socket(ioc_);
        beast::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec == asio::error::would_block) {
            std::this_thread::sleep_for(kAcceptPoll);
            continue;
        }
        if (ec) {
            error("accept: " + ec.message());
            continue;
        }

        const int fd = socket.native_handle();
        track(fd);
        std::thread([this, fd, s = std::move(socket)]() mutable {
            try {
                handle_client(s);
            } catch (const std::exception& e) {
                error(std::string("client handler: ") + e.what());
            }
            untrack(fd);
        }).detach();
    }

    shutdown_clients();
    std::unique_lock<std::mutex> lk(clients_mu_);
    clients_cv_.wait(lk, [this] { return clients_.empty(); });
}

void TraceServer::handle_client(tcp::socket& sock) {
    if (!wait_readable(sock.native_handle(), kHeadTimeoutMs))
        return;

    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    beast::error_code ec;
    http::read(sock, buffer, req, ec);
    if (ec == http::error::end_of_stream)
        return;
    if (ec) {
        reply(sock, 11, http::status::bad_request, ec.message() + "\n");
        return;
    }

    if (req.method() != http::verb::get) {
        reply(sock, req.version(), http::status::not_implemented, "Not Implemented\n");
        return;
    }

    RequestTarget target(std::string(req.target().data(), req.target().size()));
    if (target.path == "/") {
        reply(sock, req.version(), http::status::ok, kIndexPage);
    } else if (target.path == "/trace") {
        auto uuid = target.single("uuid");
        if (target.query.size() != 1 || !uuid || !is_valid_uuid(*uuid)) {
            reply(sock, req.version(), http::status::bad_request, "Invalid UUID\n");
            return;
        }
        WsStream ws(std::move(sock));
        ws.accept(req, ec);
        if (ec) {
            error("upgrade: " + ec.message());
            return;
        }
        handle_trace(ws, *uuid);
    } else if (target.path == "/echo") {
        WsStream ws(std::move(sock));
        ws.accept(req, ec);
        if (ec) {
            error("upgrade: " + ec.message());
            return;
        }
        handle_echo(ws);
    } else {
        reply(sock, req.version(), http::status::not_found, "404 page not found\n");
    }
}

void TraceServer::handle_trace(WsStream& ws, const std::string& uuid) {
    auto code = websocket::close_code::normal;
    try {
        WsConnection conn(ws);
        TraceResult result = engine_.run_trace(cfg_.trace.interface_name, conn, uuid);
        if (cfg_.report) {
            beast::error_code ec;
            ws.text(true);
            ws.write(asio::buffer(compact(to_json(result))), ec);
            if (ec)
                error("write: " + ec.message());
        }
    } catch (const ConnectionClosedError& e) {
        error(std::string("ZeroTrace Run Error: ") + e.what());
        // a cancelled trace still has a client to close with
        if (!e.has_partial() || e.partial().error != kCancelledReason)
            return;
    } catch (const ConfigurationError& e) {
        error(std::string("ZeroTrace Run Error: ") + e.what());
        code = websocket::close_code::internal_error;
    } catch (const std::invalid_argument& e) {
        error(std::string("ZeroTrace Run Error: ") + e.what());
        code = websocket::close_code::policy_error;
    }
    send_close(ws, code);
}

void TraceServer::handle_echo(WsStream& ws) {
    beast::error_code ec;
    const std::string peer = ws.next_layer().remote_endpoint(ec).address().to_string();
    ws.read_message_max(kMaxEchoMessage);

    beast::flat_buffer buffer;
    while (true) {
        ws.read(buffer, ec);
        if (ec == websocket::error::closed)
            return;
        if (ec) {
            error("read: " + ec.message());
            return;
        }
        if (!ws.got_text()) {
            error("read: only text messages are supported");
            send_close(ws, websocket::close_code::unknown_data);
            return;
        }

        std::string text = beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());
        try {
            EchoMessage msg = parse_echo_message(text);
            if (auto* fin = std::get_if<FinalMessage>(&msg)) {
                Json::Value rec(Json::objectValue);
                rec["Type"] = "ws-echo";
                rec["UUID"] = fin->uuid;
                rec["IPaddr"] = peer;
                rec["Timestamp"] = utc_timestamp(std::chrono::system_clock::now());
                rec["Message"] = fin->body;
                records_.write(rec);
            }
        } catch (const MessageFormatError& e) {
            error(std::string("unmarshal: ") + e.what());
            send_close(ws, websocket::close_code::unknown_data);
            return;
        }

        ws.text(true);
        ws.write(asio::buffer(text), ec);
        if (ec) {
            error("write: " + ec.message());
            return;
        }
    }
}

} // namespace zt
