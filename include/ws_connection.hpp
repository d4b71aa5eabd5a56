#pragma once
#include "connection.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/websocket/stream.hpp>

namespace zt
{
    using WsStream = boost::beast::websocket::stream<boost::asio::ip::tcp::socket>;

    // Connection over an accepted IPv4 WebSocket. Probes are Ping frames
    // written through the stream; TTL and TCP_INFO go to its native socket.
    class WsConnection : public Connection
    {
    public:
        // Throws std::invalid_argument for a non-IPv4 or unconnected socket.
        explicit WsConnection(WsStream &ws);

        uint32_t peer_address() const override { return peer_addr_; }
        uint16_t peer_port() const override { return peer_port_; }
        uint16_t local_port() const override { return local_port_; }

        int ttl() const override;
        bool set_ttl(int ttl) override;
        std::size_t header_overhead() const override;
        bool send_ping(const std::vector<uint8_t> &payload) override;
        bool is_open() const override;

    private:
        WsStream &ws_;
        int fd_ = -1;
        uint32_t peer_addr_ = 0;
        uint16_t peer_port_ = 0;
        uint16_t local_port_ = 0;
    };
} // namespace zt
