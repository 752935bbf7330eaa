#pragma once
#include "common/Result.hpp"
#include "common/Cancellation.hpp"
#include "common/CaptureTypes.hpp"

namespace interfaces {

    class ICaptureBackend {
    public:
        virtual ~ICaptureBackend() = default;

        virtual common::BackendKind kind() const noexcept = 0;

        // Whether the Android session must be brought up (and the target app
        // launched) between prepare() and acquire().
        virtual bool needs_android_session() const noexcept = 0;

        // Work that must precede the Android session (e.g. a fresh compositor)
        virtual common::EmptyResult prepare(const common::CancellationToken&) {
            return common::EmptyResult::success();
        }

        // Produce the source handle (and transport descriptor, if any).
        // The returned session is in state Started.
        virtual common::Result<common::CaptureSession> acquire(const common::CancellationToken& token) = 0;
    };

} // namespace interfaces
