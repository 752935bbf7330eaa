#pragma once

#include "interfaces/ITouchDevice.hpp"
#include <string>

namespace platform {
namespace linux_os {

    // Virtual touchscreen on /dev/uinput: INPUT_PROP_DIRECT, multitouch
    // type B with 10 slots, axes sized to the stream, BTN_TOUCH and the
    // common keyboard keys.
    class LinuxUInputTouchDevice : public interfaces::ITouchDevice {
    public:
        LinuxUInputTouchDevice(int width, int height);
        ~LinuxUInputTouchDevice() override;

        LinuxUInputTouchDevice(const LinuxUInputTouchDevice&) = delete;
        LinuxUInputTouchDevice& operator=(const LinuxUInputTouchDevice&) = delete;

        common::EmptyResult emit(uint16_t type, uint16_t code, int32_t value) override;
        common::EmptyResult sync() override;

        bool is_initialized() const { return initialized_; }
        const std::string& error_message() const { return error_message_; }

    private:
        bool setup_device();

        int uinput_fd_;
        bool initialized_;
        int width_;
        int height_;
        std::string error_message_;
    };

} // namespace linux_os
} // namespace platform
