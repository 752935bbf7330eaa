#include "UdpInputSocket.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <poll.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace platform {
namespace linux_os {

    namespace {
        constexpr int kPollTimeoutMs = 200;
        constexpr size_t kMaxDatagram = 256;
    }

    UdpInputSocket::~UdpInputSocket() {
        close_socket();
    }

    void UdpInputSocket::close_socket() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    common::EmptyResult UdpInputSocket::bind(const std::string& host, uint16_t port) {
        close_socket();

        sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
            return common::EmptyResult::err(common::ErrorCode::ConfigError, "Invalid bind address: " + host);
        }

        fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
        if (fd_ < 0) {
            return common::EmptyResult::err(common::ErrorCode::Unknown,
                "socket failed: " + std::string(std::strerror(errno)));
        }

        int reuse = 1;
        setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            int saved = errno;
            close_socket();
            return common::EmptyResult::err(common::ErrorCode::Unknown,
                "bind " + host + ":" + std::to_string(port) + " failed: " + std::strerror(saved));
        }
        return common::EmptyResult::success();
    }

    common::Result<std::vector<uint8_t>> UdpInputSocket::receive(const common::CancellationToken& token) {
        using DatagramResult = common::Result<std::vector<uint8_t>>;
        if (fd_ < 0) return DatagramResult::err(common::ErrorCode::Unknown, "Socket not bound");

        while (!token.is_cancellation_requested()) {
            pollfd pfd{fd_, POLLIN, 0};
            int ready = ::poll(&pfd, 1, kPollTimeoutMs);
            if (ready < 0) {
                if (errno == EINTR) continue;
                return DatagramResult::err(common::ErrorCode::Unknown,
                    "poll failed: " + std::string(std::strerror(errno)));
            }
            if (ready == 0) continue;

            std::vector<uint8_t> buffer(kMaxDatagram);
            ssize_t received = ::recvfrom(fd_, buffer.data(), buffer.size(), 0, nullptr, nullptr);
            if (received < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                return DatagramResult::err(common::ErrorCode::Unknown,
                    "recvfrom failed: " + std::string(std::strerror(errno)));
            }
            buffer.resize(static_cast<size_t>(received));
            return buffer;
        }
        return DatagramResult::err(common::ErrorCode::Cancelled, "Interrupted");
    }

} // namespace linux_os
} // namespace platform
