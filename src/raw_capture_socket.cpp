//// ===================== File: src/raw_capture_socket.cpp =====================
#include "raw_capture_socket.hpp"
#include "trace_errors.hpp"

#include <cerrno>
#include <cstring>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace zt
{
    RawCaptureSocket::RawCaptureSocket(const std::string &interface_name)
        : iface_(interface_name)
    {
        if (iface_.empty() || iface_.size() >= IFNAMSIZ || ::if_nametoindex(iface_.c_str()) == 0)
            throw ConfigurationError("unknown network interface: '" + iface_ + "'");

        fd_ = ::socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
        if (fd_ < 0)
            throw ConfigurationError(std::string("Need CAP_NET_RAW/root for ICMP capture: ") + std::strerror(errno));

        if (::setsockopt(fd_, SOL_SOCKET, SO_BINDTODEVICE, iface_.c_str(),
                         static_cast<socklen_t>(iface_.size())) < 0)
        {
            int err = errno;
            ::close(fd_);
            fd_ = -1;
            throw ConfigurationError("SO_BINDTODEVICE(" + iface_ + ") failed: " + std::strerror(err));
        }
    }

    RawCaptureSocket::~RawCaptureSocket()
    {
        if (fd_ != -1)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    std::size_t RawCaptureSocket::receive(uint8_t *buf, std::size_t cap,
                                          std::chrono::milliseconds timeout)
    {
        fd_set rfds;
        FD_ZERO(&rfds);
        FD_SET(fd_, &rfds);
        timeval tv{static_cast<long>(timeout.count() / 1000),
                   static_cast<suseconds_t>((timeout.count() % 1000) * 1000)};

        int rc = ::select(fd_ + 1, &rfds, nullptr, nullptr, &tv);
        if (rc < 0)
        {
            if (errno == EINTR)
                return 0;
            throw CaptureError(std::string("select on capture socket failed: ") + std::strerror(errno));
        }
        if (rc == 0)
            return 0;

        sockaddr_in from{};
        socklen_t flen = sizeof(from);
        ssize_t n = ::recvfrom(fd_, buf, cap, 0, reinterpret_cast<sockaddr *>(&from), &flen);
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                return 0;
            throw CaptureError(std::string("recvfrom on capture socket failed: ") + std::strerror(errno));
        }
        return static_cast<std::size_t>(n);
    }
} // namespace zt
