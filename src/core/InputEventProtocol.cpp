#include "core/InputEventProtocol.hpp"

namespace core {

    namespace {
        uint32_t read_u32_le(const uint8_t* p) {
            return static_cast<uint32_t>(p[0])
                 | (static_cast<uint32_t>(p[1]) << 8)
                 | (static_cast<uint32_t>(p[2]) << 16)
                 | (static_cast<uint32_t>(p[3]) << 24);
        }

        int16_t read_i16_le(const uint8_t* p) {
            return static_cast<int16_t>(static_cast<uint16_t>(p[0] | (p[1] << 8)));
        }
    }

    std::vector<InputEvent> decode_input_datagram(const uint8_t* data, size_t size) {
        std::vector<InputEvent> events;
        if (!data) return events;

        events.reserve(size / kInputEventSize);
        for (size_t offset = 0; offset + kInputEventSize <= size; offset += kInputEventSize) {
            const uint8_t* record = data + offset;
            InputEvent event;
            event.type = record[0];
            event.timestamp = read_u32_le(record + 1);
            event.arg1 = read_i16_le(record + 5);
            event.arg2 = read_i16_le(record + 7);
            event.arg3 = read_i16_le(record + 9);
            event.arg4 = read_i16_le(record + 11);
            events.push_back(event);
        }
        return events;
    }

} // namespace core
