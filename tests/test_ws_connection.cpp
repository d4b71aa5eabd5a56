#include <gtest/gtest.h>

#include "utils_net.hpp"
#include "ws_connection.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <future>
#include <thread>

using namespace zt;
using namespace std::chrono_literals;

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

namespace {

// Upgraded loopback pair: a Beast client and the accepted server stream.
class WsConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        tcp::acceptor acceptor(ioc_, {asio::ip::make_address("127.0.0.1"), 0});
        const uint16_t port = acceptor.local_endpoint().port();

        auto handshake = std::async(std::launch::async, [this, port] {
            client_.next_layer().connect({asio::ip::make_address("127.0.0.1"), port});
            client_.handshake("localhost", "/trace");
        });

        tcp::socket sock(ioc_);
        acceptor.accept(sock);
        server_ = std::make_unique<WsStream>(std::move(sock));
        server_->accept();
        handshake.get();
    }

    asio::io_context ioc_;
    websocket::stream<tcp::socket> client_{ioc_};
    std::unique_ptr<WsStream> server_;
};

} // namespace

TEST_F(WsConnectionTest, ReportsBothEnds) {
    WsConnection conn(*server_);
    EXPECT_EQ(net::ip_to_string(conn.peer_address()), "127.0.0.1");
    EXPECT_EQ(conn.peer_port(), client_.next_layer().local_endpoint().port());
    EXPECT_EQ(conn.local_port(), client_.next_layer().remote_endpoint().port());
    EXPECT_TRUE(conn.is_open());
}

TEST_F(WsConnectionTest, TtlIsSetOnTheSocket) {
    WsConnection conn(*server_);
    const int saved = conn.ttl();
    ASSERT_GT(saved, 0);
    ASSERT_TRUE(conn.set_ttl(7));
    EXPECT_EQ(conn.ttl(), 7);
    ASSERT_TRUE(conn.set_ttl(saved));
    EXPECT_EQ(conn.ttl(), saved);
}

TEST_F(WsConnectionTest, OverheadCoversHeadersAndPingHeader) {
    WsConnection conn(*server_);
    const std::size_t overhead = conn.header_overhead();
    EXPECT_TRUE(overhead == 20 + 20 + 2 || overhead == 20 + 20 + 12 + 2) << overhead;
}

TEST_F(WsConnectionTest, PingReachesTheClient) {
    WsConnection conn(*server_);
    std::vector<std::size_t> pings;
    client_.control_callback([&pings](websocket::frame_type kind, beast::string_view payload) {
        if (kind == websocket::frame_type::ping)
            pings.push_back(payload.size());
    });

    ASSERT_TRUE(conn.send_ping(std::vector<uint8_t>(37, 0x5a)));
    ASSERT_TRUE(conn.send_ping({}));
    server_->text(true);
    server_->write(asio::buffer(std::string("done")));

    beast::flat_buffer buffer;
    client_.read(buffer);
    EXPECT_EQ(beast::buffers_to_string(buffer.data()), "done");
    EXPECT_EQ(pings, (std::vector<std::size_t>{37, 0}));

    EXPECT_THROW(conn.send_ping(std::vector<uint8_t>(126, 0)), std::invalid_argument);
}

TEST_F(WsConnectionTest, ClientHangupClosesTheConnection) {
    WsConnection conn(*server_);
    ASSERT_TRUE(conn.is_open());
    client_.next_layer().close();

    for (int i = 0; i < 200 && conn.is_open(); ++i)
        std::this_thread::sleep_for(5ms);
    EXPECT_FALSE(conn.is_open());
}
