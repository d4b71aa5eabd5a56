#include "ws_connection.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>

namespace zt
{
    namespace beast = boost::beast;
    namespace websocket = beast::websocket;
    using tcp = boost::asio::ip::tcp;

    namespace
    {
        constexpr std::size_t kTimestampOptionLen = 12; // NOP NOP TS(10)
        constexpr std::size_t kPingHeaderLen = 2;       // server frames are unmasked, payload <= 125
    }

    WsConnection::WsConnection(WsStream &ws) : ws_(ws)
    {
        beast::error_code ec;
        tcp::endpoint peer = ws_.next_layer().remote_endpoint(ec);
        if (ec || !peer.address().is_v4())
            throw std::invalid_argument("WsConnection needs a connected IPv4 socket");
        tcp::endpoint me = ws_.next_layer().local_endpoint(ec);
        if (ec)
            throw std::invalid_argument("local_endpoint failed: " + ec.message());

        fd_ = ws_.next_layer().native_handle();
        peer_addr_ = htonl(peer.address().to_v4().to_uint());
        peer_port_ = peer.port();
        local_port_ = me.port();

        // probes must leave as their own segments, not coalesced behind unacked data
        ws_.next_layer().set_option(tcp::no_delay(true), ec);
        if (ec)
            throw std::invalid_argument("TCP_NODELAY failed: " + ec.message());
    }

    int WsConnection::ttl() const
    {
        int v = 0;
        socklen_t len = sizeof(v);
        if (::getsockopt(fd_, IPPROTO_IP, IP_TTL, &v, &len) < 0)
            return -1;
        return v;
    }

    bool WsConnection::set_ttl(int ttl)
    {
        return ::setsockopt(fd_, IPPROTO_IP, IP_TTL, &ttl, sizeof(ttl)) == 0;
    }

    std::size_t WsConnection::header_overhead() const
    {
        std::size_t overhead = sizeof(iphdr) + sizeof(tcphdr) + kPingHeaderLen;
        tcp_info info{};
        socklen_t len = sizeof(info);
        if (::getsockopt(fd_, IPPROTO_TCP, TCP_INFO, &info, &len) == 0 &&
            (info.tcpi_options & TCPI_OPT_TIMESTAMPS))
            overhead += kTimestampOptionLen;
        return overhead;
    }

    bool WsConnection::send_ping(const std::vector<uint8_t> &payload)
    {
        if (payload.size() > websocket::ping_data::max_size_n)
            throw std::invalid_argument("ping payload exceeds 125 bytes");
        websocket::ping_data data;
        data.assign(reinterpret_cast<const char *>(payload.data()), payload.size());

        beast::error_code ec;
        ws_.ping(data, ec);
        return !ec;
    }

    bool WsConnection::is_open() const
    {
        if (!ws_.is_open() || fd_ < 0)
            return false;
        pollfd p{};
        p.fd = fd_;
        p.events = POLLRDHUP;
        if (::poll(&p, 1, 0) < 0)
            return false;
        return (p.revents & (POLLRDHUP | POLLHUP | POLLERR | POLLNVAL)) == 0;
    }
} // namespace zt
