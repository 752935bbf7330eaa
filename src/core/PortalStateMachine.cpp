#include "core/PortalStateMachine.hpp"
#include <algorithm>

namespace core {

    using common::CaptureState;

    PortalTransition portal_transition(CaptureState state, const PortalEvent& event) {
        if (state == CaptureState::Started || state == CaptureState::Failed) {
            return {state, PortalEffect::None};
        }

        switch (event.kind) {
            case PortalEventKind::Begin:
                if (state == CaptureState::Idle) return {CaptureState::Idle, PortalEffect::CreateSession};
                return {state, PortalEffect::None};

            case PortalEventKind::CallFailed:
                return {CaptureState::Failed, PortalEffect::Abort};

            case PortalEventKind::Response:
                break;
        }

        if (event.response_code != 0) {
            return {CaptureState::Failed, PortalEffect::Abort};
        }

        switch (state) {
            case CaptureState::Idle:
                if (!event.results.session_handle || event.results.session_handle->empty()) {
                    return {CaptureState::Failed, PortalEffect::Abort};
                }
                return {CaptureState::SessionCreated, PortalEffect::SelectSources};

            case CaptureState::SessionCreated:
                return {CaptureState::SourcesSelected, PortalEffect::Start};

            case CaptureState::SourcesSelected:
                if (event.results.streams.empty()) {
                    return {CaptureState::Failed, PortalEffect::AbortNoSource};
                }
                return {CaptureState::Started, PortalEffect::OpenRemote};

            default:
                return {state, PortalEffect::None};
        }
    }

    const char* portal_effect_name(PortalEffect effect) {
        switch (effect) {
            case PortalEffect::None:          return "None";
            case PortalEffect::CreateSession: return "CreateSession";
            case PortalEffect::SelectSources: return "SelectSources";
            case PortalEffect::Start:         return "Start";
            case PortalEffect::OpenRemote:    return "OpenPipeWireRemote";
            case PortalEffect::Abort:         return "Abort";
            case PortalEffect::AbortNoSource: return "AbortNoSource";
        }
        return "?";
    }

    const char* portal_pending_step(CaptureState state) {
        switch (state) {
            case CaptureState::Idle:            return "CreateSession";
            case CaptureState::SessionCreated:  return "SelectSources";
            case CaptureState::SourcesSelected: return "Start";
            default:                            return "none";
        }
    }

    std::string portal_sender_name(const std::string& unique_name) {
        std::string sender = unique_name;
        if (!sender.empty() && sender.front() == ':') sender.erase(0, 1);
        std::replace(sender.begin(), sender.end(), '.', '_');
        return sender;
    }

    std::string portal_request_path(const std::string& sender, const std::string& handle_token) {
        return "/org/freedesktop/portal/desktop/request/" + sender + "/" + handle_token;
    }

} // namespace core
