#include "LinuxX11Backend.hpp"

// X11 Headers - only included in the .cpp file
#include <X11/Xlib.h>

namespace platform {
namespace linux_os {

    LinuxX11Backend::LinuxX11Backend(std::string display_name, core::ILogger& logger)
        : display_name_(std::move(display_name)), logger_(logger) {}

    common::Result<common::CaptureSession> LinuxX11Backend::acquire(const common::CancellationToken& token) {
        using SessionResult = common::Result<common::CaptureSession>;
        if (token.is_cancellation_requested()) {
            return SessionResult::err(common::ErrorCode::Cancelled, "Interrupted");
        }

        logger_.info("Using x11grab capture on display " + display_name_);

        // Open connection to X display
        Display* display = XOpenDisplay(display_name_.c_str());
        if (!display) {
            return SessionResult::err(common::ErrorCode::DeviceNotFound,
                "Failed to open X display " + display_name_ + ". Are you running in an X11 session?");
        }

        // Get screen dimensions
        int screen = DefaultScreen(display);
        common::CaptureSession session;
        session.backend = common::BackendKind::X11;
        session.source_handle = display_name_;
        session.capture_width = DisplayWidth(display, screen);
        session.capture_height = DisplayHeight(display, screen);
        session.state = common::CaptureState::Started;
        XCloseDisplay(display);

        logger_.info("X display " + display_name_ + ": "
                     + std::to_string(session.capture_width) + "x" + std::to_string(session.capture_height));
        return session;
    }

} // namespace linux_os
} // namespace platform
