#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>

namespace common {

    enum class BackendKind {
        Portal,   // xdg-desktop-portal ScreenCast (interactive)
        Headless, // weston PipeWire backend, no monitor needed
        X11,      // ffmpeg x11grab
        Test      // videotestsrc, no Android session
    };

    inline const char* backend_name(BackendKind kind) {
        switch (kind) {
            case BackendKind::Portal:   return "portal";
            case BackendKind::Headless: return "headless";
            case BackendKind::X11:      return "x11";
            case BackendKind::Test:     return "test";
        }
        return "unknown";
    }

    enum class CaptureState {
        Idle,
        SessionCreated,
        SourcesSelected,
        Started,
        Failed
    };

    inline const char* capture_state_name(CaptureState state) {
        switch (state) {
            case CaptureState::Idle:            return "Idle";
            case CaptureState::SessionCreated:  return "SessionCreated";
            case CaptureState::SourcesSelected: return "SourcesSelected";
            case CaptureState::Started:         return "Started";
            case CaptureState::Failed:          return "Failed";
        }
        return "?";
    }

    // One per run. Direct backends (x11, test, headless) go straight to
    // Started; only the portal walks the intermediate states.
    struct CaptureSession {
        BackendKind backend = BackendKind::Test;
        std::optional<std::string> session_handle;
        std::string source_handle;          // PipeWire node id, X display, or empty for test
        std::optional<int> transport_fd;    // OpenPipeWireRemote descriptor (portal only)
        CaptureState state = CaptureState::Idle;
        int capture_width = 0;              // x11 probe result, 0 if unknown
        int capture_height = 0;
    };

    // One outgoing portal call. serial is never reused within a run.
    struct RequestToken {
        uint32_t serial = 0;
        std::string handle_token; // "u<serial>"
        std::string path;         // /org/freedesktop/portal/desktop/request/<sender>/<token>
    };

    struct SupervisedProcess {
        pid_t pid = -1;
        std::string name;
        std::chrono::steady_clock::time_point started_at;
    };

    struct PipelineSpec {
        BackendKind backend = BackendKind::Test;
        std::string source_handle;
        std::optional<int> transport_fd;
        std::string receiver_host;
        uint16_t receiver_port = 0;
        int framerate = 30;
        int bitrate_kbps = 4000;
        // x11 only: capture size reported by the display probe, 0 if unknown
        int capture_width = 0;
        int capture_height = 0;
    };

} // namespace common
