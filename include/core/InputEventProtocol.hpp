#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace core {

    // Wire format, 13 bytes little-endian, no padding:
    // | type u8 | timestamp u32 | arg1 i16 | arg2 i16 | arg3 i16 | arg4 i16 |
    constexpr size_t kInputEventSize = 13;

    constexpr int kStreamWidth = 1280;
    constexpr int kStreamHeight = 720;
    constexpr int kMaxTouchSlots = 10;

    enum class InputEventType : uint8_t {
        Move = 0,    // arg1/arg2 absolute x/y, arg3 slot
        Down = 1,
        Up = 2,
        KeyDown = 3, // arg1 evdev key code
        KeyUp = 4
    };

    struct InputEvent {
        uint8_t type = 0; // raw; unknown values are skipped by the relay
        uint32_t timestamp = 0;
        int16_t arg1 = 0;
        int16_t arg2 = 0;
        int16_t arg3 = 0;
        int16_t arg4 = 0;
    };

    // Every complete record in the datagram; a trailing partial record is dropped.
    std::vector<InputEvent> decode_input_datagram(const uint8_t* data, size_t size);

} // namespace core
