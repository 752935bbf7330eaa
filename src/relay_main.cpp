#include "common/Cancellation.hpp"
#include "core/Config.hpp"
#include "core/InputEventProtocol.hpp"
#include "core/Logger.hpp"
#include "core/TouchRelay.hpp"

#ifdef PLATFORM_LINUX
    #include "platform/linux/LinuxUInputTouchDevice.hpp"
    #include "platform/linux/UdpInputSocket.hpp"
#endif

#include <csignal>
#include <cstring>
#include <iostream>

namespace {

    common::CancellationSource g_cancel;

    void on_signal(int signal_number) {
        g_cancel.cancel(signal_number);
    }

    void print_usage(const char* program) {
        std::cout << "Usage: " << program << " [--host ADDR] [--port PORT] [-v]\n"
                  << "Receives input events over UDP and injects them through a virtual touchscreen.\n"
                  << "  --host ADDR   bind address (default 0.0.0.0)\n"
                  << "  --port PORT   listen port (default 9001)\n";
    }

} // namespace

int main(int argc, char** argv) {
    std::string host = "0.0.0.0";
    uint16_t port = 9001;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            auto parsed = core::parse_number(argv[++i], 1, 65535);
            if (!parsed) {
                std::cerr << "[input_relay] Invalid port: " << argv[i] << std::endl;
                return 1;
            }
            port = static_cast<uint16_t>(*parsed);
        } else {
            std::cerr << "[input_relay] Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    core::ConsoleLogger logger("input_relay", verbose);
    logger.info("=== Input Relay ===");

    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = on_signal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    common::CancellationToken token = g_cancel.get_token();

#ifdef PLATFORM_LINUX
    platform::linux_os::LinuxUInputTouchDevice device(core::kStreamWidth, core::kStreamHeight);
    if (!device.is_initialized()) {
        logger.error(device.error_message());
        return 1;
    }
    logger.info("Created virtual touchscreen");

    platform::linux_os::UdpInputSocket socket;
    auto bound = socket.bind(host, port);
    if (bound.is_err()) {
        logger.error(bound.error().message);
        return 1;
    }
    logger.info("Listening on " + host + ":" + std::to_string(port));

    core::TouchRelay relay(device, logger);
    while (true) {
        auto datagram = socket.receive(token);
        if (datagram.is_err()) {
            if (datagram.error().code != common::ErrorCode::Cancelled) {
                logger.error(datagram.error().message);
                return 1;
            }
            break;
        }
        const auto& data = datagram.unwrap();
        if (data.size() < core::kInputEventSize) continue;
        relay.handle_datagram(data.data(), data.size());
    }

    logger.info("Shutting down.");
    return 0;
#else
    logger.error("No platform support compiled in");
    return 1;
#endif
}
