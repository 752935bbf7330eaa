#include "core/CaptureBackends.hpp"
#include "core/NodeDiscovery.hpp"
#include "core/PortalNegotiator.hpp"

namespace core {

    // ============================================================================
    // TestBackend
    // ============================================================================

    common::Result<common::CaptureSession> TestBackend::acquire(const common::CancellationToken& token) {
        if (token.is_cancellation_requested()) {
            return common::Result<common::CaptureSession>::err(common::ErrorCode::Cancelled, "Interrupted");
        }
        common::CaptureSession session;
        session.backend = common::BackendKind::Test;
        session.state = common::CaptureState::Started;
        return session;
    }

    // ============================================================================
    // PortalBackend
    // ============================================================================

    PortalBackend::PortalBackend(std::unique_ptr<interfaces::IPortalBus> bus, ILogger& logger)
        : bus_(std::move(bus)), logger_(logger) {}

    common::Result<common::CaptureSession> PortalBackend::acquire(const common::CancellationToken& token) {
        logger_.info("Using xdg-desktop-portal ScreenCast capture");
        logger_.info("A dialog will appear on the desktop: select the Waydroid window.");

        PortalNegotiator negotiator(*bus_, logger_);
        return negotiator.negotiate(token);
    }

    // ============================================================================
    // HeadlessBackend
    // ============================================================================

    HeadlessBackend::HeadlessBackend(AndroidSession& android,
                                     std::unique_ptr<CompositorSupervisor> compositor,
                                     interfaces::IStreamRegistry& registry,
                                     ILogger& logger,
                                     Sleeper sleeper,
                                     PollPolicy node_poll)
        : android_(android), compositor_(std::move(compositor)), registry_(registry),
          logger_(logger), sleeper_(std::move(sleeper)), node_poll_(node_poll) {}

    common::EmptyResult HeadlessBackend::prepare(const common::CancellationToken& token) {
        android_.stop_stale_session();
        compositor_->clean_stale_artifacts();

        auto started = compositor_->start(token);
        if (started.is_err()) return started.error();
        return common::EmptyResult::success();
    }

    common::Result<common::CaptureSession> HeadlessBackend::acquire(const common::CancellationToken& token) {
        auto node = discover_video_node(registry_, "weston", node_poll_, sleeper_, token, logger_);
        if (node.is_err()) return node.error();

        common::CaptureSession session;
        session.backend = common::BackendKind::Headless;
        session.source_handle = std::to_string(node.unwrap());
        session.state = common::CaptureState::Started;
        session.capture_width = compositor_->options().width;
        session.capture_height = compositor_->options().height;
        return session;
    }

} // namespace core
