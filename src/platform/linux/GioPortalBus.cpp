#include "GioPortalBus.hpp"
#include <gio/gunixfdlist.h>

namespace platform {
namespace linux_os {

    namespace {
        constexpr const char* kPortalService = "org.freedesktop.portal.Desktop";
        constexpr const char* kPortalPath = "/org/freedesktop/portal/desktop";
        constexpr const char* kScreenCastInterface = "org.freedesktop.portal.ScreenCast";
        constexpr const char* kRequestInterface = "org.freedesktop.portal.Request";
        constexpr const char* kSessionInterface = "org.freedesktop.portal.Session";

        // Owned by GDBus through the subscription's destroy notify
        struct Subscription {
            interfaces::ResponseCallback callback;
        };

        void on_response_signal(GDBusConnection*, const gchar*, const gchar*, const gchar*,
                                const gchar*, GVariant* parameters, gpointer user_data) {
            auto* subscription = static_cast<Subscription*>(user_data);

            guint32 response = 2;
            GVariant* results = nullptr;
            g_variant_get(parameters, "(u@a{sv})", &response, &results);

            interfaces::PortalResults parsed = GioPortalBus::parse_results(results);
            if (results) g_variant_unref(results);

            // The callback may unsubscribe itself, which frees subscription
            interfaces::ResponseCallback callback = subscription->callback;
            if (callback) callback(response, parsed);
        }

        std::string take_error(GError* error) {
            std::string message = error && error->message ? error->message : "unknown D-Bus error";
            if (error) g_error_free(error);
            return message;
        }
    }

    GioPortalBus::~GioPortalBus() {
        if (connection_) {
            for (guint id : subscriptions_) {
                g_dbus_connection_signal_unsubscribe(connection_, id);
            }
            g_object_unref(connection_);
        }
        if (loop_) g_main_loop_unref(loop_);
    }

    common::EmptyResult GioPortalBus::connect() {
        if (connection_) return common::EmptyResult::success();

        GError* error = nullptr;
        connection_ = g_bus_get_sync(G_BUS_TYPE_SESSION, nullptr, &error);
        if (!connection_) {
            return common::EmptyResult::err(common::ErrorCode::NegotiationError,
                "Cannot connect to the session bus: " + take_error(error));
        }
        return common::EmptyResult::success();
    }

    std::string GioPortalBus::unique_name() const {
        if (!connection_) return {};
        const gchar* name = g_dbus_connection_get_unique_name(connection_);
        return name ? name : "";
    }

    common::Result<uint32_t> GioPortalBus::subscribe_response(const std::string& request_path,
                                                             interfaces::ResponseCallback callback) {
        if (!connection_) {
            return common::Result<uint32_t>::err(common::ErrorCode::NegotiationError, "Not connected");
        }

        auto* subscription = new Subscription{std::move(callback)};
        guint id = g_dbus_connection_signal_subscribe(
            connection_,
            kPortalService,
            kRequestInterface,
            "Response",
            request_path.c_str(),
            nullptr,
            G_DBUS_SIGNAL_FLAGS_NONE,
            on_response_signal,
            subscription,
            [](gpointer data) { delete static_cast<Subscription*>(data); });

        subscriptions_.insert(id);
        return common::Result<uint32_t>::ok(id);
    }

    void GioPortalBus::unsubscribe(uint32_t subscription_id) {
        if (!connection_ || subscriptions_.erase(subscription_id) == 0) return;
        g_dbus_connection_signal_unsubscribe(connection_, subscription_id);
    }

    common::EmptyResult GioPortalBus::call_screencast(const char* method, GVariant* parameters) {
        if (!connection_) {
            if (parameters) g_variant_unref(g_variant_ref_sink(parameters));
            return common::EmptyResult::err(common::ErrorCode::NegotiationError, "Not connected");
        }

        GError* error = nullptr;
        GVariant* reply = g_dbus_connection_call_sync(
            connection_,
            kPortalService,
            kPortalPath,
            kScreenCastInterface,
            method,
            parameters,
            G_VARIANT_TYPE("(o)"),
            G_DBUS_CALL_FLAGS_NONE,
            -1,
            nullptr,
            &error);

        if (!reply) {
            return common::EmptyResult::err(common::ErrorCode::NegotiationError,
                std::string(method) + " failed: " + take_error(error));
        }
        g_variant_unref(reply);
        return common::EmptyResult::success();
    }

    common::EmptyResult GioPortalBus::create_session(const std::string& handle_token,
                                                     const std::string& session_handle_token) {
        GVariantBuilder options;
        g_variant_builder_init(&options, G_VARIANT_TYPE_VARDICT);
        g_variant_builder_add(&options, "{sv}", "handle_token",
                              g_variant_new_string(handle_token.c_str()));
        g_variant_builder_add(&options, "{sv}", "session_handle_token",
                              g_variant_new_string(session_handle_token.c_str()));

        return call_screencast("CreateSession", g_variant_new("(a{sv})", &options));
    }

    common::EmptyResult GioPortalBus::select_sources(const std::string& session_handle,
                                                     const std::string& handle_token,
                                                     uint32_t source_types,
                                                     bool multiple) {
        GVariantBuilder options;
        g_variant_builder_init(&options, G_VARIANT_TYPE_VARDICT);
        g_variant_builder_add(&options, "{sv}", "handle_token",
                              g_variant_new_string(handle_token.c_str()));
        g_variant_builder_add(&options, "{sv}", "types",
                              g_variant_new_uint32(source_types));
        g_variant_builder_add(&options, "{sv}", "multiple",
                              g_variant_new_boolean(multiple ? TRUE : FALSE));

        return call_screencast("SelectSources",
                               g_variant_new("(oa{sv})", session_handle.c_str(), &options));
    }

    common::EmptyResult GioPortalBus::start(const std::string& session_handle,
                                            const std::string& handle_token) {
        GVariantBuilder options;
        g_variant_builder_init(&options, G_VARIANT_TYPE_VARDICT);
        g_variant_builder_add(&options, "{sv}", "handle_token",
                              g_variant_new_string(handle_token.c_str()));

        // Empty parent window: no transient-for relationship
        return call_screencast("Start",
                               g_variant_new("(osa{sv})", session_handle.c_str(), "", &options));
    }

    common::Result<int> GioPortalBus::open_pipewire_remote(const std::string& session_handle) {
        if (!connection_) return common::Result<int>::err(common::ErrorCode::NegotiationError, "Not connected");

        GVariantBuilder options;
        g_variant_builder_init(&options, G_VARIANT_TYPE_VARDICT);

        GError* error = nullptr;
        GUnixFDList* fd_list = nullptr;
        GVariant* reply = g_dbus_connection_call_with_unix_fd_list_sync(
            connection_,
            kPortalService,
            kPortalPath,
            kScreenCastInterface,
            "OpenPipeWireRemote",
            g_variant_new("(oa{sv})", session_handle.c_str(), &options),
            G_VARIANT_TYPE("(h)"),
            G_DBUS_CALL_FLAGS_NONE,
            -1,
            nullptr,
            &fd_list,
            nullptr,
            &error);

        if (!reply) {
            return common::Result<int>::err(common::ErrorCode::NegotiationError,
                "OpenPipeWireRemote failed: " + take_error(error));
        }

        gint32 handle = 0;
        g_variant_get(reply, "(h)", &handle);
        g_variant_unref(reply);

        if (!fd_list) {
            return common::Result<int>::err(common::ErrorCode::NegotiationError,
                                            "OpenPipeWireRemote returned no descriptor");
        }

        // Duplicated descriptor; ours to close or pass on
        int fd = g_unix_fd_list_get(fd_list, handle, &error);
        g_object_unref(fd_list);
        if (fd < 0) {
            return common::Result<int>::err(common::ErrorCode::NegotiationError,
                "Cannot take PipeWire descriptor: " + take_error(error));
        }
        return common::Result<int>::ok(fd);
    }

    common::EmptyResult GioPortalBus::close_session(const std::string& session_handle) {
        if (!connection_) return common::EmptyResult::err(common::ErrorCode::NegotiationError, "Not connected");

        GError* error = nullptr;
        GVariant* reply = g_dbus_connection_call_sync(
            connection_,
            kPortalService,
            session_handle.c_str(),
            kSessionInterface,
            "Close",
            nullptr,
            nullptr,
            G_DBUS_CALL_FLAGS_NONE,
            -1,
            nullptr,
            &error);

        if (!reply) {
            return common::EmptyResult::err(common::ErrorCode::NegotiationError,
                "Session.Close failed: " + take_error(error));
        }
        g_variant_unref(reply);
        return common::EmptyResult::success();
    }

    void GioPortalBus::run_loop(const common::CancellationToken& token) {
        if (!loop_) loop_ = g_main_loop_new(nullptr, FALSE);

        // Signal handlers only flip the token; notice it from inside the loop
        struct CancelWatch {
            GMainLoop* loop;
            common::CancellationToken token;
        } watch{loop_, token};

        guint timer = g_timeout_add(100, [](gpointer data) -> gboolean {
            auto* w = static_cast<CancelWatch*>(data);
            if (w->token.is_cancellation_requested()) {
                g_main_loop_quit(w->loop);
                return G_SOURCE_REMOVE;
            }
            return G_SOURCE_CONTINUE;
        }, &watch);

        if (!token.is_cancellation_requested()) {
            g_main_loop_run(loop_);
        }

        // Still attached unless the watch removed itself
        GSource* source = g_main_context_find_source_by_id(nullptr, timer);
        if (source) g_source_destroy(source);
    }

    void GioPortalBus::quit_loop() {
        if (loop_) g_main_loop_quit(loop_);
    }

    interfaces::PortalResults GioPortalBus::parse_results(GVariant* results) {
        interfaces::PortalResults parsed;
        if (!results) return parsed;

        GVariant* handle = g_variant_lookup_value(results, "session_handle", nullptr);
        if (handle) {
            if (g_variant_is_of_type(handle, G_VARIANT_TYPE_STRING) ||
                g_variant_is_of_type(handle, G_VARIANT_TYPE_OBJECT_PATH)) {
                parsed.session_handle = std::string(g_variant_get_string(handle, nullptr));
            }
            g_variant_unref(handle);
        }

        GVariant* streams = g_variant_lookup_value(results, "streams", G_VARIANT_TYPE("a(ua{sv})"));
        if (streams) {
            GVariantIter iter;
            g_variant_iter_init(&iter, streams);

            guint32 node_id = 0;
            GVariant* properties = nullptr;
            while (g_variant_iter_next(&iter, "(u@a{sv})", &node_id, &properties)) {
                interfaces::PortalStream stream;
                stream.node_id = node_id;

                GVariantIter prop_iter;
                g_variant_iter_init(&prop_iter, properties);
                const gchar* key = nullptr;
                GVariant* value = nullptr;
                while (g_variant_iter_next(&prop_iter, "{&sv}", &key, &value)) {
                    gchar* printed = g_variant_print(value, TRUE);
                    stream.metadata[key] = printed;
                    g_free(printed);
                    g_variant_unref(value);
                }

                g_variant_unref(properties);
                parsed.streams.push_back(std::move(stream));
            }
            g_variant_unref(streams);
        }

        return parsed;
    }

} // namespace linux_os
} // namespace platform
