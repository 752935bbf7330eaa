#pragma once
#include <cstdint>
#include <string>
#include "common/CaptureTypes.hpp"
#include "interfaces/IPortalBus.hpp"

namespace core {

    // ============================================================================
    // ScreenCast handshake as a pure state machine
    // ============================================================================
    //
    //   Idle --Response(0, session_handle)--> SessionCreated   [SelectSources]
    //   SessionCreated --Response(0)--------> SourcesSelected  [Start]
    //   SourcesSelected --Response(0, >=1)--> Started          [OpenRemote]
    //   SourcesSelected --Response(0, 0)----> Failed           [AbortNoSource]
    //   any pending --Response(!=0) / CallFailed--> Failed     [Abort]
    //
    // Idle + Begin issues CreateSession. Started and Failed are terminal:
    // every further event is ignored, so no step is ever re-entered.
    // ============================================================================

    enum class PortalEventKind {
        Begin,      // negotiation requested
        Response,   // Request.Response for the pending step
        CallFailed  // the method call itself was rejected (bus error)
    };

    struct PortalEvent {
        PortalEventKind kind = PortalEventKind::Begin;
        uint32_t response_code = 0;
        interfaces::PortalResults results;
    };

    enum class PortalEffect {
        None,
        CreateSession,
        SelectSources,
        Start,
        OpenRemote,
        Abort,
        AbortNoSource
    };

    struct PortalTransition {
        common::CaptureState next;
        PortalEffect effect;
    };

    PortalTransition portal_transition(common::CaptureState state, const PortalEvent& event);

    const char* portal_effect_name(PortalEffect effect);

    // Name of the step whose response is awaited in the given state
    const char* portal_pending_step(common::CaptureState state);

    // ":1.42" -> "1_42", as used in request object paths
    std::string portal_sender_name(const std::string& unique_name);

    std::string portal_request_path(const std::string& sender, const std::string& handle_token);

} // namespace core
