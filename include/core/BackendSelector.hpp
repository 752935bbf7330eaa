#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "common/CaptureTypes.hpp"
#include "common/Result.hpp"
#include "interfaces/ICaptureBackend.hpp"

namespace core {

    // "portal" | "headless" | "x11" (alias "x11grab") | "test"
    // Anything else -> ConfigError
    common::Result<common::BackendKind> parse_method(const std::string& method);

    // ============================================================================
    // BackendSelector - registry of capture backend factories
    // ============================================================================
    // Factories are registered once at startup (main.cpp) and invoked lazily,
    // so a backend's collaborators (bus connection, compositor) are only
    // built when that backend is actually chosen.
    //
    // Usage:
    //   selector.register_backend(BackendKind::Test, [] { return std::make_shared<TestBackend>(); });
    //   auto backend = selector.select("test");
    // ============================================================================
    class BackendSelector {
    public:
        using Factory = std::function<std::shared_ptr<interfaces::ICaptureBackend>()>;

        void register_backend(common::BackendKind kind, Factory factory);

        // parse_method() + factory lookup. ConfigError for unknown names and
        // for known kinds that were not registered on this platform.
        common::Result<std::shared_ptr<interfaces::ICaptureBackend>> select(const std::string& method) const;
        common::Result<std::shared_ptr<interfaces::ICaptureBackend>> select(common::BackendKind kind) const;

        // Registered method names, for usage text and diagnostics
        std::vector<std::string> list_methods() const;

    private:
        std::map<common::BackendKind, Factory> factories_;
    };

} // namespace core
