#pragma once

#include "interfaces/ICaptureBackend.hpp"
#include "core/Logger.hpp"
#include <string>

namespace platform {
namespace linux_os {

    // ffmpeg x11grab on an X display (X11 sessions or Xwayland). The display
    // is probed once so that the capture size can be passed explicitly.
    class LinuxX11Backend : public interfaces::ICaptureBackend {
    public:
        LinuxX11Backend(std::string display_name, core::ILogger& logger);

        common::BackendKind kind() const noexcept override { return common::BackendKind::X11; }
        bool needs_android_session() const noexcept override { return true; }
        common::Result<common::CaptureSession> acquire(const common::CancellationToken& token) override;

    private:
        std::string display_name_;
        core::ILogger& logger_;
    };

} // namespace linux_os
} // namespace platform
