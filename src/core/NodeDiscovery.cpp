#include "core/NodeDiscovery.hpp"
#include <nlohmann/json.hpp>

namespace core {

    using json = nlohmann::json;

    std::optional<uint32_t> find_video_node(const std::string& registry_dump,
                                            const std::string& name_fragment) {
        json objects = json::parse(registry_dump, nullptr, /*allow_exceptions=*/false);
        if (!objects.is_array()) return std::nullopt;

        for (const auto& object : objects) {
            if (!object.is_object() || !object.contains("id") || !object["id"].is_number_unsigned()) continue;

            auto info = object.find("info");
            if (info == object.end() || !info->is_object()) continue;
            auto props = info->find("props");
            if (props == info->end() || !props->is_object()) continue;

            auto media_class_it = props->find("media.class");
            auto node_name_it = props->find("node.name");
            if (media_class_it == props->end() || !media_class_it->is_string()) continue;
            if (node_name_it == props->end() || !node_name_it->is_string()) continue;

            const std::string media_class = media_class_it->get<std::string>();
            const std::string node_name = node_name_it->get<std::string>();

            if (media_class.find("Video") != std::string::npos &&
                node_name.find(name_fragment) != std::string::npos) {
                return object["id"].get<uint32_t>();
            }
        }
        return std::nullopt;
    }

    common::Result<uint32_t> discover_video_node(interfaces::IStreamRegistry& registry,
                                                 const std::string& name_fragment,
                                                 const PollPolicy& policy,
                                                 const Sleeper& sleeper,
                                                 const common::CancellationToken& token,
                                                 ILogger& logger) {
        logger.info("Looking for " + name_fragment + " PipeWire video node...");

        auto node = poll_until(
            [&]() -> std::optional<uint32_t> {
                auto dump = registry.dump();
                if (dump.is_err()) {
                    logger.debug("Registry query failed: " + dump.error().message);
                    return std::nullopt;
                }
                return find_video_node(dump.unwrap(), name_fragment);
            },
            policy, sleeper, token, "PipeWire video node");

        if (node.is_err()) {
            auto error = retag_timeout(node.error(), common::ErrorCode::NodeNotFound,
                                       "No PipeWire video node found from " + name_fragment);
            logger.error(error.message);
            return error;
        }

        logger.info("Found PipeWire video node: " + std::to_string(node.unwrap()));
        return node;
    }

} // namespace core
