#pragma once

#include "common/Result.hpp"
#include "common/Cancellation.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace platform {
namespace linux_os {

    // Bound UDP socket for the input relay
    class UdpInputSocket {
    public:
        UdpInputSocket() = default;
        ~UdpInputSocket();

        UdpInputSocket(const UdpInputSocket&) = delete;
        UdpInputSocket& operator=(const UdpInputSocket&) = delete;

        common::EmptyResult bind(const std::string& host, uint16_t port);

        // Next datagram. Wakes up periodically to check the token; Cancelled
        // once it is set.
        common::Result<std::vector<uint8_t>> receive(const common::CancellationToken& token);

        void close_socket();
        bool is_valid() const { return fd_ >= 0; }

    private:
        int fd_ = -1;
    };

} // namespace linux_os
} // namespace platform
