#include "core/BackendSelector.hpp"

namespace core {

    common::Result<common::BackendKind> parse_method(const std::string& method) {
        if (method == "portal")                     return common::BackendKind::Portal;
        if (method == "headless")                   return common::BackendKind::Headless;
        if (method == "x11" || method == "x11grab") return common::BackendKind::X11;
        if (method == "test")                       return common::BackendKind::Test;

        return common::Result<common::BackendKind>::err(common::ErrorCode::ConfigError,
            "Unknown capture method: '" + method + "' (available: headless, portal, x11, test)");
    }

    void BackendSelector::register_backend(common::BackendKind kind, Factory factory) {
        factories_[kind] = std::move(factory);
    }

    common::Result<std::shared_ptr<interfaces::ICaptureBackend>>
    BackendSelector::select(const std::string& method) const {
        auto kind = parse_method(method);
        if (kind.is_err()) return kind.error();
        return select(kind.unwrap());
    }

    common::Result<std::shared_ptr<interfaces::ICaptureBackend>>
    BackendSelector::select(common::BackendKind kind) const {
        using BackendResult = common::Result<std::shared_ptr<interfaces::ICaptureBackend>>;

        auto it = factories_.find(kind);
        if (it == factories_.end() || !it->second) {
            return BackendResult::err(common::ErrorCode::ConfigError,
                std::string("Capture method not available on this platform: ") + common::backend_name(kind));
        }

        auto backend = it->second();
        if (!backend) {
            return BackendResult::err(common::ErrorCode::ConfigError,
                std::string("Capture method could not be created: ") + common::backend_name(kind));
        }
        return BackendResult::ok(std::move(backend));
    }

    std::vector<std::string> BackendSelector::list_methods() const {
        std::vector<std::string> names;
        for (const auto& entry : factories_) {
            names.emplace_back(common::backend_name(entry.first));
        }
        return names;
    }

} // namespace core
