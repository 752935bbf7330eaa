#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include "common/CaptureTypes.hpp"
#include "common/Result.hpp"
#include "common/Cancellation.hpp"
#include "interfaces/IPortalBus.hpp"
#include "core/PortalStateMachine.hpp"
#include "core/Logger.hpp"

namespace core {

    // ============================================================================
    // PortalNegotiator - drives the ScreenCast handshake over an IPortalBus
    // ============================================================================
    // Dispatcher around portal_transition(): each outgoing call gets a fresh
    // RequestToken whose path is registered as the single pending request
    // before the call is issued. A Response is matched to its pending entry,
    // the entry is dropped (one-shot), and the resulting transition's effect
    // is executed. Exactly one request is outstanding at any time.
    //
    // A negotiator is single-use: negotiate() may be called once.
    // ============================================================================
    class PortalNegotiator {
    public:
        static constexpr uint32_t kSourceMonitor = 1;
        static constexpr uint32_t kSourceWindow = 2;

        PortalNegotiator(interfaces::IPortalBus& bus, ILogger& logger,
                         std::string session_handle_token = "droidcast");
        ~PortalNegotiator();

        PortalNegotiator(const PortalNegotiator&) = delete;
        PortalNegotiator& operator=(const PortalNegotiator&) = delete;

        // On success the session is Started and carries the first stream's
        // node id and an inheritable transport descriptor.
        common::Result<common::CaptureSession> negotiate(const common::CancellationToken& token);

        common::CaptureState state() const { return session_.state; }
        size_t pending_requests() const { return pending_.size(); }

    private:
        common::RequestToken next_token();
        bool await_response(const common::RequestToken& token);
        void on_response(const std::string& path, uint32_t code, const interfaces::PortalResults& results);
        void apply(const PortalEvent& event);
        void execute(PortalEffect effect, const PortalEvent& event);
        void issue(const common::EmptyResult& call_result);
        void fail(common::ErrorCode code, const std::string& message);
        void release_pending();
        void close_partial_session();
        bool finished() const;

        interfaces::IPortalBus& bus_;
        ILogger& logger_;
        std::string session_handle_token_;
        std::string sender_;
        uint32_t serial_ = 0;

        struct Pending {
            uint32_t subscription_id;
            std::string step;
        };
        std::map<std::string, Pending> pending_; // request path -> pending step

        common::CaptureSession session_;
        std::optional<common::AppError> failure_;
    };

} // namespace core
