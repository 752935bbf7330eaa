#pragma once
#include <memory>
#include "common/CaptureTypes.hpp"
#include "common/Result.hpp"
#include "common/Cancellation.hpp"
#include "interfaces/ICaptureBackend.hpp"
#include "interfaces/IPortalBus.hpp"
#include "interfaces/IStreamRegistry.hpp"
#include "core/AndroidSession.hpp"
#include "core/CompositorSupervisor.hpp"
#include "core/ReadinessPoller.hpp"
#include "core/Logger.hpp"

namespace core {

    // Synthetic source: nothing to negotiate, no Android session.
    class TestBackend : public interfaces::ICaptureBackend {
    public:
        common::BackendKind kind() const noexcept override { return common::BackendKind::Test; }
        bool needs_android_session() const noexcept override { return false; }
        common::Result<common::CaptureSession> acquire(const common::CancellationToken& token) override;
    };

    // xdg-desktop-portal ScreenCast; the user picks the window in the
    // compositor's own dialog.
    class PortalBackend : public interfaces::ICaptureBackend {
    public:
        PortalBackend(std::unique_ptr<interfaces::IPortalBus> bus, ILogger& logger);

        common::BackendKind kind() const noexcept override { return common::BackendKind::Portal; }
        bool needs_android_session() const noexcept override { return true; }
        common::Result<common::CaptureSession> acquire(const common::CancellationToken& token) override;

    private:
        std::unique_ptr<interfaces::IPortalBus> bus_;
        ILogger& logger_;
    };

    // Private weston compositor with a PipeWire output. prepare() must run
    // before the Android session comes up so that it renders into it.
    class HeadlessBackend : public interfaces::ICaptureBackend {
    public:
        HeadlessBackend(AndroidSession& android,
                        std::unique_ptr<CompositorSupervisor> compositor,
                        interfaces::IStreamRegistry& registry,
                        ILogger& logger,
                        Sleeper sleeper,
                        PollPolicy node_poll = {20, std::chrono::milliseconds(500)});

        common::BackendKind kind() const noexcept override { return common::BackendKind::Headless; }
        bool needs_android_session() const noexcept override { return true; }
        common::EmptyResult prepare(const common::CancellationToken& token) override;
        common::Result<common::CaptureSession> acquire(const common::CancellationToken& token) override;

    private:
        AndroidSession& android_;
        std::unique_ptr<CompositorSupervisor> compositor_;
        interfaces::IStreamRegistry& registry_;
        ILogger& logger_;
        Sleeper sleeper_;
        PollPolicy node_poll_;
    };

} // namespace core
