#include "response_listener.hpp"
#include "diag_logger.hpp"
#include "icmp_packet.hpp"
#include "trace_errors.hpp"
#include "utils_net.hpp"

#include <array>
#include <chrono>
#include <exception>

namespace zt {

namespace {
constexpr auto kPollInterval = std::chrono::milliseconds(200);
}

ResponseListener::ResponseListener(CaptureSource& source, ProbeRegistry& registry, DiagLogger* diag)
    : source_(source), registry_(registry), diag_(diag) {}

ResponseListener::~ResponseListener() {
    stop();
}

void ResponseListener::start() {
    if (running_.exchange(true))
        return;
    thread_ = std::thread(&ResponseListener::run, this);
}

void ResponseListener::stop() {
    running_ = false;
    if (thread_.joinable())
        thread_.join();
}

std::string ResponseListener::failure() const {
    std::lock_guard<std::mutex> lk(failure_mu_);
    return failure_;
}

bool ResponseListener::handle_packet(const uint8_t* data, std::size_t len, clk::time_point received_at) {
    auto quote = parse_icmp_error(data, len);
    if (!quote) {
        malformed_++;
        return false;
    }

    std::string from = net::ip_to_string(quote->responder);
    ProbeToken token = quote->token();
    if (!registry_.resolve(token, from, quote->status(), received_at)) {
        unmatched_++;
        if (diag_)
            diag_->log("ICMP_UNMATCHED type=" + std::to_string(quote->type) + " from=" + from +
                       " " + to_string(token));
        return false;
    }

    matched_++;
    if (diag_)
        diag_->log("ICMP_MATCHED type=" + std::to_string(quote->type) + " code=" +
                   std::to_string(quote->code) + " from=" + from + " quoted_ttl=" +
                   std::to_string(quote->quoted_ttl) + " " + to_string(token));
    return true;
}

void ResponseListener::run() {
    std::array<uint8_t, 2048> buf{};
    while (running_.load()) {
        std::size_t n = 0;
        try {
            n = source_.receive(buf.data(), buf.size(), kPollInterval);
        } catch (const CaptureError& e) {
            {
                std::lock_guard<std::mutex> lk(failure_mu_);
                failure_ = e.what();
            }
            failed_ = true;
            running_ = false;
            if (diag_)
                diag_->error(std::string("CAPTURE_FAILED ") + e.what());
            registry_.fail_all(std::make_exception_ptr(e));
            return;
        }
        if (n == 0)
            continue;
        handle_packet(buf.data(), n, clk::now());
    }
}

} // namespace zt
