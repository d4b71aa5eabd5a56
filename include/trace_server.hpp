#pragma once
#include "trace_config.hpp"
#include "ws_connection.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/status.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>

namespace zt {

class DiagLogger;
class JsonLineLogger;
class ZeroTrace;

// HTTP/WebSocket front-end: /trace hands the upgraded connection to the
// engine, /echo runs the latency echo channel.
class TraceServer {
public:
    using tcp = boost::asio::ip::tcp;

    TraceServer(const ServerConfig& cfg, ZeroTrace& engine, JsonLineLogger& records,
                DiagLogger* diag = nullptr);
    ~TraceServer();

    TraceServer(const TraceServer&) = delete;
    TraceServer& operator=(const TraceServer&) = delete;

    // Binds the listening socket. Throws ConfigurationError.
    void listen();
    // Accepts until stop(); one thread per client. Once stopped, shuts down
    // every client socket and waits for the handlers to finish.
    void serve();
    // Safe to call from a signal handler.
    void stop() { running_ = false; }

    // Bound port; differs from the configured one when that was 0.
    uint16_t local_port() const;

private:
    void handle_client(tcp::socket& sock);
    void handle_trace(WsStream& ws, const std::string& uuid);
    void handle_echo(WsStream& ws);
    void reply(tcp::socket& sock, unsigned version, boost::beast::http::status status,
               const std::string& body);
    void send_close(WsStream& ws, boost::beast::websocket::close_code code);
    void error(const std::string& what);

    void track(int fd);
    void untrack(int fd);
    void shutdown_clients();

    ServerConfig cfg_;
    ZeroTrace& engine_;
    JsonLineLogger& records_;
    DiagLogger* diag_;

    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_{ioc_};
    std::atomic<bool> running_{false};

    std::mutex clients_mu_;
    std::condition_variable clients_cv_;
    std::multiset<int> clients_; // fds of live handlers
};

} // namespace zt
