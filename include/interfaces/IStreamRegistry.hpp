#pragma once
#include <string>
#include "common/Result.hpp"

namespace interfaces {

    // Structured dump of the multimedia graph (pw-dump JSON on Linux)
    class IStreamRegistry {
    public:
        virtual ~IStreamRegistry() = default;
        virtual common::Result<std::string> dump() = 0;
    };

} // namespace interfaces
