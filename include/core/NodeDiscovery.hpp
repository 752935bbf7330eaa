#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "common/Result.hpp"
#include "common/Cancellation.hpp"
#include "interfaces/IStreamRegistry.hpp"
#include "core/ReadinessPoller.hpp"
#include "core/Logger.hpp"

namespace core {

    // Pure query over a pw-dump style JSON array: id of the first object
    // whose info.props["media.class"] contains "Video" and whose
    // info.props["node.name"] contains name_fragment. Malformed input
    // matches nothing.
    std::optional<uint32_t> find_video_node(const std::string& registry_dump,
                                            const std::string& name_fragment);

    // Polls the registry until find_video_node() matches.
    // Exhaustion -> ErrorCode::NodeNotFound.
    common::Result<uint32_t> discover_video_node(interfaces::IStreamRegistry& registry,
                                                 const std::string& name_fragment,
                                                 const PollPolicy& policy,
                                                 const Sleeper& sleeper,
                                                 const common::CancellationToken& token,
                                                 ILogger& logger);

} // namespace core
