#include "core/PortalNegotiator.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace core {

    using common::CaptureState;
    using common::ErrorCode;

    namespace {

        std::string describe_response(uint32_t code) {
            switch (code) {
                case 0:  return "0, success";
                case 1:  return "1, cancelled by user";
                default: return std::to_string(code) + ", failed";
            }
        }

        // The descriptor must survive exec into the pipeline process
        common::EmptyResult mark_inheritable(int fd) {
            int flags = fcntl(fd, F_GETFD);
            if (flags == -1 || fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) == -1) {
                return common::EmptyResult::err(ErrorCode::NegotiationError,
                    "Cannot make PipeWire fd inheritable: " + std::string(std::strerror(errno)));
            }
            return common::EmptyResult::success();
        }

    } // namespace

    PortalNegotiator::PortalNegotiator(interfaces::IPortalBus& bus, ILogger& logger,
                                       std::string session_handle_token)
        : bus_(bus), logger_(logger), session_handle_token_(std::move(session_handle_token)) {
        session_.backend = common::BackendKind::Portal;
    }

    PortalNegotiator::~PortalNegotiator() {
        release_pending();
    }

    // ============================================================================
    // Entry point
    // ============================================================================

    common::Result<common::CaptureSession> PortalNegotiator::negotiate(const common::CancellationToken& token) {
        using SessionResult = common::Result<common::CaptureSession>;

        if (session_.state != CaptureState::Idle || failure_) {
            return SessionResult::err(ErrorCode::NegotiationError, "Portal negotiator already used");
        }

        auto connected = bus_.connect();
        if (connected.is_err()) {
            session_.state = CaptureState::Failed;
            return SessionResult::err(ErrorCode::NegotiationError,
                "Cannot reach the desktop portal: " + connected.error().message);
        }
        sender_ = portal_sender_name(bus_.unique_name());

        logger_.info("Starting PipeWire portal capture...");
        logger_.info("A screen-share dialog will appear, select the Waydroid window.");

        apply(PortalEvent{PortalEventKind::Begin, 0, {}});

        if (!finished()) {
            bus_.run_loop(token);
        }

        if (!finished()) {
            const std::string step = portal_pending_step(session_.state);
            session_.state = CaptureState::Failed;
            if (token.is_cancellation_requested()) {
                fail(ErrorCode::Cancelled, "Interrupted while waiting for " + step + " response");
            } else {
                fail(ErrorCode::NegotiationError, "Portal loop ended while waiting for " + step + " response");
            }
        }

        release_pending();

        if (failure_) {
            close_partial_session();
            return *failure_;
        }
        return SessionResult::ok(session_);
    }

    // ============================================================================
    // Dispatch
    // ============================================================================

    common::RequestToken PortalNegotiator::next_token() {
        common::RequestToken token;
        token.serial = ++serial_;
        token.handle_token = "u" + std::to_string(token.serial);
        token.path = portal_request_path(sender_, token.handle_token);
        return token;
    }

    bool PortalNegotiator::await_response(const common::RequestToken& token) {
        const std::string path = token.path;
        auto subscription = bus_.subscribe_response(path,
            [this, path](uint32_t code, const interfaces::PortalResults& results) {
                on_response(path, code, results);
            });

        if (subscription.is_err()) {
            fail(ErrorCode::NegotiationError,
                 "Cannot listen for " + path + ": " + subscription.error().message);
            apply(PortalEvent{PortalEventKind::CallFailed, 0, {}});
            return false;
        }

        pending_[path] = Pending{subscription.unwrap(), portal_pending_step(session_.state)};
        logger_.debug("Awaiting " + pending_[path].step + " response on " + path);
        return true;
    }

    void PortalNegotiator::on_response(const std::string& path, uint32_t code,
                                       const interfaces::PortalResults& results) {
        auto it = pending_.find(path);
        if (it == pending_.end()) {
            logger_.debug("Ignoring response for unknown request " + path);
            return;
        }

        const std::string step = it->second.step;
        bus_.unsubscribe(it->second.subscription_id);
        pending_.erase(it);

        if (code != 0) {
            logger_.error("[portal] " + step + " failed (" + describe_response(code) + ")");
            fail(ErrorCode::NegotiationError, step + " failed (" + describe_response(code) + ")");
        }

        apply(PortalEvent{PortalEventKind::Response, code, results});
    }

    void PortalNegotiator::apply(const PortalEvent& event) {
        const CaptureState previous = session_.state;
        const PortalTransition transition = portal_transition(previous, event);

        if (transition.next != previous) {
            logger_.debug(std::string("Portal state ") + common::capture_state_name(previous)
                          + " -> " + common::capture_state_name(transition.next));
        }
        session_.state = transition.next;

        execute(transition.effect, event);

        if (finished()) {
            bus_.quit_loop();
        }
    }

    void PortalNegotiator::issue(const common::EmptyResult& call_result) {
        if (call_result.is_ok()) return;

        const std::string step = portal_pending_step(session_.state);
        release_pending();
        fail(ErrorCode::NegotiationError, step + " call failed: " + call_result.error().message);
        apply(PortalEvent{PortalEventKind::CallFailed, 0, {}});
    }

    // ============================================================================
    // Effects
    // ============================================================================

    void PortalNegotiator::execute(PortalEffect effect, const PortalEvent& event) {
        switch (effect) {
            case PortalEffect::None:
                return;

            case PortalEffect::CreateSession: {
                auto token = next_token();
                if (!await_response(token)) return;
                issue(bus_.create_session(token.handle_token, session_handle_token_));
                return;
            }

            case PortalEffect::SelectSources: {
                session_.session_handle = *event.results.session_handle;
                logger_.info("[portal] Session: " + *session_.session_handle);

                auto token = next_token();
                if (!await_response(token)) return;
                issue(bus_.select_sources(*session_.session_handle, token.handle_token,
                                          kSourceMonitor | kSourceWindow, false));
                return;
            }

            case PortalEffect::Start: {
                logger_.info("[portal] Sources selected, starting capture...");

                auto token = next_token();
                if (!await_response(token)) return;
                issue(bus_.start(*session_.session_handle, token.handle_token));
                return;
            }

            case PortalEffect::OpenRemote: {
                const auto& streams = event.results.streams;
                if (streams.size() > 1) {
                    logger_.info("[portal] " + std::to_string(streams.size())
                                 + " streams returned, using the first");
                }
                session_.source_handle = std::to_string(streams.front().node_id);
                logger_.info("[portal] PipeWire node: " + session_.source_handle);

                auto fd = bus_.open_pipewire_remote(*session_.session_handle);
                if (fd.is_err()) {
                    session_.state = CaptureState::Failed;
                    fail(ErrorCode::NegotiationError, "OpenPipeWireRemote failed: " + fd.error().message);
                    return;
                }

                auto inheritable = mark_inheritable(fd.unwrap());
                if (inheritable.is_err()) {
                    ::close(fd.unwrap());
                    session_.state = CaptureState::Failed;
                    fail(inheritable.error().code, inheritable.error().message);
                    return;
                }

                session_.transport_fd = fd.unwrap();
                logger_.info("[portal] PipeWire fd: " + std::to_string(fd.unwrap()));
                return;
            }

            case PortalEffect::Abort:
                if (event.kind == PortalEventKind::Response && event.response_code == 0) {
                    fail(ErrorCode::NegotiationError, "CreateSession response carried no session_handle");
                } else {
                    fail(ErrorCode::NegotiationError, "Portal negotiation aborted");
                }
                return;

            case PortalEffect::AbortNoSource:
                logger_.error("[portal] No streams returned!");
                fail(ErrorCode::NoSource, "Portal Start returned no streams");
                return;
        }
    }

    // ============================================================================
    // Failure and teardown
    // ============================================================================

    // First failure wins; later ones are consequences of it
    void PortalNegotiator::fail(ErrorCode code, const std::string& message) {
        if (failure_) return;
        failure_ = common::AppError{code, message, "PortalNegotiator"};
    }

    void PortalNegotiator::release_pending() {
        for (const auto& entry : pending_) {
            bus_.unsubscribe(entry.second.subscription_id);
        }
        pending_.clear();
    }

    void PortalNegotiator::close_partial_session() {
        if (!session_.session_handle) return;

        logger_.info("[portal] Closing session " + *session_.session_handle);
        auto closed = bus_.close_session(*session_.session_handle);
        if (closed.is_err()) {
            logger_.warn("[portal] Session close failed: " + closed.error().message);
        }
        session_.session_handle.reset();
    }

    bool PortalNegotiator::finished() const {
        return session_.state == CaptureState::Started || session_.state == CaptureState::Failed;
    }

} // namespace core
