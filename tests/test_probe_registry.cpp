#include <gtest/gtest.h>

#include "probe_registry.hpp"
#include "trace_errors.hpp"

#include <thread>
#include <vector>

using namespace zt;
using namespace std::chrono_literals;

namespace {

Probe make_probe(int ttl, uint16_t length, clk::time_point sent_at = clk::now()) {
    Probe p{};
    p.ttl = ttl;
    p.token.target_addr = 0x050071cb; // 203.0.113.5
    p.token.local_port = 443;
    p.token.peer_port = 50000;
    p.token.ip_length = length;
    p.sent_at = sent_at;
    return p;
}

} // namespace

TEST(ProbeRegistry, ResolveCompletesWaiterWithRtt) {
    ProbeRegistry reg;
    auto sent = clk::now();
    Probe p = make_probe(4, 100, sent);
    auto fut = reg.insert(p, sent + 5s);
    EXPECT_TRUE(reg.contains(p.token));

    EXPECT_TRUE(reg.resolve(p.token, "10.0.4.1", HopStatus::Answered, sent + 25ms));
    ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
    HopResult hop = fut.get();
    EXPECT_EQ(hop.ttl, 4);
    EXPECT_EQ(hop.responder, "10.0.4.1");
    ASSERT_TRUE(hop.rtt_ms.has_value());
    EXPECT_DOUBLE_EQ(*hop.rtt_ms, 25.0);
    EXPECT_EQ(reg.pending(), 0u);
}

TEST(ProbeRegistry, ResolveUnknownTokenIsIgnored) {
    ProbeRegistry reg;
    Probe p = make_probe(1, 60);
    EXPECT_FALSE(reg.resolve(p.token, "10.0.0.1", HopStatus::Answered, clk::now()));
}

TEST(ProbeRegistry, SecondResolveFindsNothing) {
    ProbeRegistry reg;
    Probe p = make_probe(1, 60);
    auto fut = reg.insert(p, clk::now() + 5s);
    EXPECT_TRUE(reg.resolve(p.token, "10.0.0.1", HopStatus::Answered, clk::now()));
    EXPECT_FALSE(reg.resolve(p.token, "10.0.0.2", HopStatus::Answered, clk::now()));
    EXPECT_EQ(fut.get().responder, "10.0.0.1");
}

TEST(ProbeRegistry, DuplicateTokenThrows) {
    ProbeRegistry reg;
    Probe p = make_probe(2, 80);
    auto fut = reg.insert(p, clk::now() + 5s);
    EXPECT_THROW(reg.insert(make_probe(7, 80), clk::now() + 5s), TokenCollisionError);
    EXPECT_EQ(reg.pending(), 1u);
}

TEST(ProbeRegistry, CancelBreaksThePromise) {
    ProbeRegistry reg;
    Probe p = make_probe(3, 90);
    auto fut = reg.insert(p, clk::now() + 5s);
    EXPECT_TRUE(reg.cancel(p.token));
    EXPECT_FALSE(reg.cancel(p.token));
    EXPECT_THROW(fut.get(), std::future_error);
}

TEST(ProbeRegistry, ReapEvictsOnlyExpired) {
    ProbeRegistry reg;
    auto now = clk::now();
    auto old_fut = reg.insert(make_probe(1, 61), now - 1ms);
    auto live_fut = reg.insert(make_probe(2, 62), now + 10s);

    EXPECT_EQ(reg.reap(now), 1u);
    EXPECT_EQ(reg.pending(), 1u);
    EXPECT_THROW(old_fut.get(), std::future_error);
    EXPECT_EQ(live_fut.wait_for(0s), std::future_status::timeout);
}

TEST(ProbeRegistry, FailAllDeliversTheError) {
    ProbeRegistry reg;
    auto a = reg.insert(make_probe(1, 61), clk::now() + 5s);
    auto b = reg.insert(make_probe(2, 62), clk::now() + 5s);
    reg.fail_all(std::make_exception_ptr(CaptureError("socket gone")));
    EXPECT_EQ(reg.pending(), 0u);
    EXPECT_THROW(a.get(), CaptureError);
    EXPECT_THROW(b.get(), CaptureError);
}

TEST(ProbeRegistry, InsertAfterFailAllThrowsTheFailure) {
    ProbeRegistry reg;
    EXPECT_FALSE(reg.failed());
    reg.fail_all(std::make_exception_ptr(CaptureError("socket gone")));
    EXPECT_TRUE(reg.failed());

    EXPECT_THROW(reg.insert(make_probe(3, 63), clk::now() + 5s), CaptureError);
    EXPECT_EQ(reg.pending(), 0u);
}

TEST(ProbeRegistry, ConcurrentInsertsKeepEveryToken) {
    ProbeRegistry reg;
    std::vector<std::thread> threads;
    std::vector<std::vector<std::future<HopResult>>> futures(4);
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 50; ++i)
                futures[t].push_back(reg.insert(make_probe(1, static_cast<uint16_t>(t * 100 + i)),
                                                clk::now() + 5s));
        });
    }
    for (auto& th : threads)
        th.join();
    EXPECT_EQ(reg.pending(), 200u);
}
