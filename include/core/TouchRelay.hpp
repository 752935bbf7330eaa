#pragma once
#include <bitset>
#include <cstdint>
#include "common/Result.hpp"
#include "interfaces/ITouchDevice.hpp"
#include "core/InputEventProtocol.hpp"
#include "core/Logger.hpp"

namespace core {

    // ============================================================================
    // TouchRelay - wire events -> multitouch (type B) evdev sequences
    // ============================================================================
    // Keeps the set of active slots so that BTN_TOUCH goes down with the
    // first finger and up with the last one. Slot 0 also drives ABS_X/ABS_Y
    // for single-touch consumers.
    // ============================================================================
    class TouchRelay {
    public:
        TouchRelay(interfaces::ITouchDevice& device, ILogger& logger);

        common::EmptyResult handle(const InputEvent& event);

        // Decodes and injects every record; injection errors are logged and
        // the remaining records still processed.
        void handle_datagram(const uint8_t* data, size_t size);

        size_t active_touches() const { return active_slots_.count(); }
        bool slot_active(int slot) const;
        uint64_t injected_events() const { return injected_; }

        static int clamp_slot(int16_t raw);

    private:
        common::EmptyResult touch_move(int slot, int16_t x, int16_t y);
        common::EmptyResult touch_down(int slot, int16_t x, int16_t y);
        common::EmptyResult touch_up(int slot);
        common::EmptyResult key(int16_t code, int32_t value);

        interfaces::ITouchDevice& device_;
        ILogger& logger_;
        std::bitset<kMaxTouchSlots> active_slots_;
        uint64_t injected_ = 0;
    };

} // namespace core
