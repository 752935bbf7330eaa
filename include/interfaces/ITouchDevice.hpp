#pragma once
#include <cstdint>
#include "common/Result.hpp"

namespace interfaces {

    // Kernel-level virtual input device (uinput on Linux)
    class ITouchDevice {
    public:
        virtual ~ITouchDevice() = default;

        // One evdev event (EV_ABS/EV_KEY codes from linux/input-event-codes.h)
        virtual common::EmptyResult emit(uint16_t type, uint16_t code, int32_t value) = 0;

        // EV_SYN / SYN_REPORT
        virtual common::EmptyResult sync() = 0;
    };

} // namespace interfaces
