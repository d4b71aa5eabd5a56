#include "probe_registry.hpp"
#include "trace_errors.hpp"

#include <utility>
#include <vector>

namespace zt {

std::future<HopResult> ProbeRegistry::insert(const Probe& probe, clk::time_point expires_at) {
    std::lock_guard<std::mutex> lk(mu_);
    if (failed_)
        std::rethrow_exception(failed_);
    if (entries_.count(probe.token))
        throw TokenCollisionError(probe.token);

    Entry e{probe, expires_at, std::promise<HopResult>{}};
    auto fut = e.reply.get_future();
    entries_.emplace(probe.token, std::move(e));
    return fut;
}

bool ProbeRegistry::resolve(const ProbeToken& token, const std::string& responder,
                            HopStatus status, clk::time_point received_at) {
    std::promise<HopResult> reply;
    Probe probe;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(token);
        if (it == entries_.end())
            return false;
        reply = std::move(it->second.reply);
        probe = it->second.probe;
        entries_.erase(it);
    }

    HopResult hop{};
    hop.ttl = probe.ttl;
    hop.responder = responder;
    hop.status = status;
    auto rtt = received_at - probe.sent_at;
    hop.rtt_ms = rtt.count() < 0 ? 0.0 : std::chrono::duration<double, std::milli>(rtt).count();
    reply.set_value(std::move(hop));
    return true;
}

bool ProbeRegistry::cancel(const ProbeToken& token) {
    std::promise<HopResult> dropped;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(token);
        if (it == entries_.end())
            return false;
        dropped = std::move(it->second.reply);
        entries_.erase(it);
    }
    return true; // `dropped` breaks outside the lock
}

std::size_t ProbeRegistry::reap(clk::time_point now) {
    std::vector<std::promise<HopResult>> expired;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.expires_at <= now) {
                expired.push_back(std::move(it->second.reply));
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }
    return expired.size();
}

void ProbeRegistry::fail_all(std::exception_ptr error) {
    std::unordered_map<ProbeToken, Entry, ProbeTokenHash> failed;
    {
        std::lock_guard<std::mutex> lk(mu_);
        failed_ = error;
        failed.swap(entries_);
    }
    for (auto& kv : failed)
        kv.second.reply.set_exception(error);
}

bool ProbeRegistry::failed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return failed_ != nullptr;
}

bool ProbeRegistry::contains(const ProbeToken& token) const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.count(token) != 0;
}

std::size_t ProbeRegistry::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

} // namespace zt
