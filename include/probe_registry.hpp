#pragma once
#include "trace_types.hpp"

#include <cstddef>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace zt {

// Outstanding probes shared by every session. Senders insert, the response
// listener resolves, sessions cancel on timeout and the reaper evicts what
// nobody claimed. At most one entry per token at any time.
class ProbeRegistry {
public:
    // Throws TokenCollisionError if the token is already pending, or the
    // error passed to fail_all() once the registry has failed.
    std::future<HopResult> insert(const Probe& probe, clk::time_point expires_at);

    // Completes the pending probe with a hop built from the reply.
    // Returns false if nothing was waiting on the token.
    bool resolve(const ProbeToken& token, const std::string& responder,
                 HopStatus status, clk::time_point received_at);

    // Drops the entry; its waiter observes a broken promise.
    bool cancel(const ProbeToken& token);

    // Evicts entries past their expiry. Returns the number evicted.
    std::size_t reap(clk::time_point now);

    // Fails every waiter with the given error and empties the table. The
    // registry stays failed: later inserts throw the same error.
    void fail_all(std::exception_ptr error);
    bool failed() const;

    bool contains(const ProbeToken& token) const;
    std::size_t pending() const;

private:
    struct Entry {
        Probe probe;
        clk::time_point expires_at;
        std::promise<HopResult> reply;
    };

    mutable std::mutex mu_;
    std::unordered_map<ProbeToken, Entry, ProbeTokenHash> entries_;
    std::exception_ptr failed_;
};

} // namespace zt
