#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/Result.hpp"
#include "common/Cancellation.hpp"

namespace interfaces {

    struct PortalStream {
        uint32_t node_id = 0;
        std::map<std::string, std::string> metadata; // printed a{sv} values
    };

    // Fields of a Request.Response results dictionary that we consume
    struct PortalResults {
        std::optional<std::string> session_handle;
        std::vector<PortalStream> streams;
    };

    using ResponseCallback = std::function<void(uint32_t response_code, const PortalResults& results)>;

    // ============================================================================
    // IPortalBus - org.freedesktop.portal.ScreenCast over a message bus
    // ============================================================================
    // Calls return as soon as the broker has accepted the request; the actual
    // answer arrives later as a Response signal on the request object path,
    // delivered to the callback subscribed for that path while run_loop() is
    // running. All callbacks run on the thread that called run_loop().
    // ============================================================================
    class IPortalBus {
    public:
        virtual ~IPortalBus() = default;

        virtual common::EmptyResult connect() = 0;

        // Our unique name on the bus (e.g. ":1.42")
        virtual std::string unique_name() const = 0;

        virtual common::Result<uint32_t> subscribe_response(const std::string& request_path,
                                                           ResponseCallback callback) = 0;
        virtual void unsubscribe(uint32_t subscription_id) = 0;

        virtual common::EmptyResult create_session(const std::string& handle_token,
                                                   const std::string& session_handle_token) = 0;
        virtual common::EmptyResult select_sources(const std::string& session_handle,
                                                   const std::string& handle_token,
                                                   uint32_t source_types,
                                                   bool multiple) = 0;
        virtual common::EmptyResult start(const std::string& session_handle,
                                          const std::string& handle_token) = 0;

        // Transport descriptor (PipeWire remote fd) bound to the session
        virtual common::Result<int> open_pipewire_remote(const std::string& session_handle) = 0;

        virtual common::EmptyResult close_session(const std::string& session_handle) = 0;

        // Dispatches responses until quit_loop() or until the token is cancelled
        virtual void run_loop(const common::CancellationToken& token) = 0;
        virtual void quit_loop() = 0;
    };

} // namespace interfaces
