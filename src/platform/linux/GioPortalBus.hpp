#pragma once

#include "interfaces/IPortalBus.hpp"
#include <set>
#include <gio/gio.h>

namespace platform {
namespace linux_os {

    // ============================================================================
    // GioPortalBus - IPortalBus on the session bus through GDBus
    // ============================================================================
    // Method calls are synchronous (the portal answers with a request handle
    // immediately); Response signals are dispatched by the default
    // GMainContext while run_loop() is running.
    // ============================================================================
    class GioPortalBus : public interfaces::IPortalBus {
    public:
        GioPortalBus() = default;
        ~GioPortalBus() override;

        GioPortalBus(const GioPortalBus&) = delete;
        GioPortalBus& operator=(const GioPortalBus&) = delete;

        common::EmptyResult connect() override;
        std::string unique_name() const override;

        common::Result<uint32_t> subscribe_response(const std::string& request_path,
                                                   interfaces::ResponseCallback callback) override;
        void unsubscribe(uint32_t subscription_id) override;

        common::EmptyResult create_session(const std::string& handle_token,
                                           const std::string& session_handle_token) override;
        common::EmptyResult select_sources(const std::string& session_handle,
                                           const std::string& handle_token,
                                           uint32_t source_types,
                                           bool multiple) override;
        common::EmptyResult start(const std::string& session_handle,
                                  const std::string& handle_token) override;
        common::Result<int> open_pipewire_remote(const std::string& session_handle) override;
        common::EmptyResult close_session(const std::string& session_handle) override;

        void run_loop(const common::CancellationToken& token) override;
        void quit_loop() override;

        // Response results dictionary (a{sv}) -> consumed fields
        static interfaces::PortalResults parse_results(GVariant* results);

    private:
        common::EmptyResult call_screencast(const char* method, GVariant* parameters);

        GDBusConnection* connection_ = nullptr;
        GMainLoop* loop_ = nullptr;
        std::set<guint> subscriptions_;
    };

} // namespace linux_os
} // namespace platform
