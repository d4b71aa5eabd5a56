//// ===================== File: include/raw_capture_socket.hpp =====================
#pragma once
#include "capture_source.hpp"

#include <string>

namespace zt
{
    // Raw ICMP socket bound to one interface. Opened once per process and
    // read only by the response listener.
    class RawCaptureSocket : public CaptureSource
    {
    public:
        // Throws ConfigurationError for an unknown interface or missing CAP_NET_RAW.
        explicit RawCaptureSocket(const std::string &interface_name);
        ~RawCaptureSocket() override;

        RawCaptureSocket(const RawCaptureSocket &) = delete;
        RawCaptureSocket &operator=(const RawCaptureSocket &) = delete;

        std::size_t receive(uint8_t *buf, std::size_t cap,
                            std::chrono::milliseconds timeout) override;

        int fd() const { return fd_; }
        const std::string &interface_name() const { return iface_; }

    private:
        std::string iface_;
        int fd_ = -1;
    };
} // namespace zt
