#include "core/TouchRelay.hpp"
#include <algorithm>
#include <linux/input-event-codes.h>

namespace core {

    // Stops at the first failing write and returns its error
    #define RELAY_TRY(expr) do { auto _r = (expr); if (_r.is_err()) return _r; } while (0)

    TouchRelay::TouchRelay(interfaces::ITouchDevice& device, ILogger& logger)
        : device_(device), logger_(logger) {}

    int TouchRelay::clamp_slot(int16_t raw) {
        return std::max(0, std::min(kMaxTouchSlots - 1, static_cast<int>(raw)));
    }

    bool TouchRelay::slot_active(int slot) const {
        if (slot < 0 || slot >= kMaxTouchSlots) return false;
        return active_slots_.test(static_cast<size_t>(slot));
    }

    common::EmptyResult TouchRelay::handle(const InputEvent& event) {
        const int slot = clamp_slot(event.arg3);
        common::EmptyResult result = common::EmptyResult::success();

        switch (static_cast<InputEventType>(event.type)) {
            case InputEventType::Move:    result = touch_move(slot, event.arg1, event.arg2); break;
            case InputEventType::Down:    result = touch_down(slot, event.arg1, event.arg2); break;
            case InputEventType::Up:      result = touch_up(slot); break;
            case InputEventType::KeyDown: result = key(event.arg1, 1); break;
            case InputEventType::KeyUp:   result = key(event.arg1, 0); break;
            default:
                logger_.debug("Ignoring unknown event type " + std::to_string(event.type));
                return common::EmptyResult::success();
        }

        if (result.is_ok()) {
            ++injected_;
            if (injected_ % 500 == 0) {
                logger_.info("  " + std::to_string(injected_) + " events injected");
            }
        }
        return result;
    }

    void TouchRelay::handle_datagram(const uint8_t* data, size_t size) {
        for (const auto& event : decode_input_datagram(data, size)) {
            auto handled = handle(event);
            if (handled.is_err()) {
                logger_.warn("Event injection error: " + handled.error().message);
            }
        }
    }

    common::EmptyResult TouchRelay::touch_move(int slot, int16_t x, int16_t y) {
        RELAY_TRY(device_.emit(EV_ABS, ABS_MT_SLOT, slot));
        RELAY_TRY(device_.emit(EV_ABS, ABS_MT_POSITION_X, x));
        RELAY_TRY(device_.emit(EV_ABS, ABS_MT_POSITION_Y, y));
        if (slot == 0) {
            RELAY_TRY(device_.emit(EV_ABS, ABS_X, x));
            RELAY_TRY(device_.emit(EV_ABS, ABS_Y, y));
        }
        return device_.sync();
    }

    common::EmptyResult TouchRelay::touch_down(int slot, int16_t x, int16_t y) {
        active_slots_.set(static_cast<size_t>(slot));
        RELAY_TRY(device_.emit(EV_ABS, ABS_MT_SLOT, slot));
        RELAY_TRY(device_.emit(EV_ABS, ABS_MT_TRACKING_ID, slot));
        RELAY_TRY(device_.emit(EV_ABS, ABS_MT_POSITION_X, x));
        RELAY_TRY(device_.emit(EV_ABS, ABS_MT_POSITION_Y, y));
        if (active_slots_.count() == 1) {
            RELAY_TRY(device_.emit(EV_KEY, BTN_TOUCH, 1));
        }
        if (slot == 0) {
            RELAY_TRY(device_.emit(EV_ABS, ABS_X, x));
            RELAY_TRY(device_.emit(EV_ABS, ABS_Y, y));
        }
        return device_.sync();
    }

    common::EmptyResult TouchRelay::touch_up(int slot) {
        active_slots_.reset(static_cast<size_t>(slot));
        RELAY_TRY(device_.emit(EV_ABS, ABS_MT_SLOT, slot));
        RELAY_TRY(device_.emit(EV_ABS, ABS_MT_TRACKING_ID, -1));
        if (active_slots_.none()) {
            RELAY_TRY(device_.emit(EV_KEY, BTN_TOUCH, 0));
        }
        return device_.sync();
    }

    common::EmptyResult TouchRelay::key(int16_t code, int32_t value) {
        if (code < 0) {
            return common::EmptyResult::err(common::ErrorCode::Unknown,
                                            "Invalid key code " + std::to_string(code));
        }
        RELAY_TRY(device_.emit(EV_KEY, static_cast<uint16_t>(code), value));
        return device_.sync();
    }

    #undef RELAY_TRY

} // namespace core
