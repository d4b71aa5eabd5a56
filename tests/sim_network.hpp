#pragma once
#include "capture_source.hpp"
#include "connection.hpp"
#include "trace_types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace zt::test {

// ICMP error from `responder` quoting a TCP segment.
struct Quoted {
    std::string src = "198.51.100.1";
    std::string dst = "203.0.113.5";
    uint16_t length = 60;
    uint16_t sport = 443;
    uint16_t dport = 50000;
    uint32_t seq = 1;
    uint8_t ttl = 1;      // left in the quoted header
    uint8_t protocol = 6; // TCP
};

std::vector<uint8_t> make_icmp_error(const std::string& responder, uint8_t type, uint8_t code,
                                     const Quoted& q);

// Capture source fed by the simulated network; packets become readable at
// their delivery time.
class FakeCapture : public CaptureSource {
public:
    void deliver(std::vector<uint8_t> packet, clk::time_point at);
    void fail();

    std::size_t receive(uint8_t* buf, std::size_t cap, std::chrono::milliseconds timeout) override;

private:
    std::mutex mu_;
    std::condition_variable cv_;
    std::multimap<clk::time_point, std::vector<uint8_t>> queue_;
    bool failed_ = false;
};

// One router (or the destination) on the simulated path. An empty ip stays silent.
struct SimHop {
    std::optional<std::string> ip;
    std::chrono::milliseconds delay{1};
    uint8_t icmp_type = 11; // Time Exceeded
};

// Connection whose probes turn into ICMP replies from the scripted path.
class FakeConnection : public Connection {
public:
    static constexpr int kDefaultTtl = 64;
    static constexpr std::size_t kOverhead = 54; // IP + TCP + timestamps + ping header

    FakeConnection(FakeCapture& capture, std::string peer_ip, uint16_t local_port,
                   std::vector<SimHop> path, uint16_t peer_port = 50000);

    uint32_t peer_address() const override { return peer_addr_; }
    uint16_t peer_port() const override { return peer_port_; }
    uint16_t local_port() const override { return local_port_; }

    int ttl() const override { return ttl_; }
    bool set_ttl(int ttl) override;
    std::size_t header_overhead() const override { return kOverhead; }
    bool send_ping(const std::vector<uint8_t>& payload) override;
    bool is_open() const override { return open_.load(); }

    void close() { open_ = false; }
    void close_after_sends(int n) { close_after_ = n; }

    std::vector<int> sent_ttls() const;
    std::vector<std::size_t> sent_sizes() const;

private:
    FakeCapture& capture_;
    uint32_t peer_addr_;
    uint16_t peer_port_;
    uint16_t local_port_;
    std::vector<SimHop> path_;

    int ttl_ = kDefaultTtl;
    uint32_t seq_ = 1000;
    int close_after_ = -1;
    std::atomic<bool> open_{true};

    mutable std::mutex mu_;
    std::vector<int> sent_ttls_;
    std::vector<std::size_t> sent_sizes_;
};

// Path of `n` distinct routers 10.0.<i>.1, each replying after `delay`.
std::vector<SimHop> routers(int n, std::chrono::milliseconds delay = std::chrono::milliseconds(1));

} // namespace zt::test
