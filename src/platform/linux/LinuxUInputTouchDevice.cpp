#include "LinuxUInputTouchDevice.hpp"
#include "core/InputEventProtocol.hpp"
#include <cerrno>
#include <cstring>

// Linux kernel headers for uinput
#include <linux/uinput.h>
#include <linux/input.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>

namespace platform {
namespace linux_os {

    namespace {
        constexpr const char* kDeviceName = "droidcast-touch";

        const int kKeyboardKeys[] = {
            KEY_ESC, KEY_1, KEY_2, KEY_3, KEY_4, KEY_5, KEY_6, KEY_7, KEY_8, KEY_9, KEY_0,
            KEY_MINUS, KEY_EQUAL, KEY_BACKSPACE, KEY_TAB,
            KEY_Q, KEY_W, KEY_E, KEY_R, KEY_T, KEY_Y, KEY_U, KEY_I, KEY_O, KEY_P,
            KEY_LEFTBRACE, KEY_RIGHTBRACE, KEY_ENTER, KEY_LEFTCTRL,
            KEY_A, KEY_S, KEY_D, KEY_F, KEY_G, KEY_H, KEY_J, KEY_K, KEY_L,
            KEY_SEMICOLON, KEY_APOSTROPHE, KEY_GRAVE, KEY_LEFTSHIFT, KEY_BACKSLASH,
            KEY_Z, KEY_X, KEY_C, KEY_V, KEY_B, KEY_N, KEY_M,
            KEY_COMMA, KEY_DOT, KEY_SLASH, KEY_RIGHTSHIFT,
            KEY_LEFTALT, KEY_SPACE, KEY_RIGHTCTRL, KEY_RIGHTALT,
            KEY_UP, KEY_DOWN, KEY_LEFT, KEY_RIGHT,
            KEY_DELETE, KEY_HOME, KEY_END, KEY_PAGEUP, KEY_PAGEDOWN,
            KEY_F1, KEY_F2, KEY_F3, KEY_F4, KEY_F5, KEY_F6,
            KEY_F7, KEY_F8, KEY_F9, KEY_F10, KEY_F11, KEY_F12
        };

        struct AxisRange {
            int code;
            int minimum;
            int maximum;
        };
    }

    LinuxUInputTouchDevice::LinuxUInputTouchDevice(int width, int height)
        : uinput_fd_(-1), initialized_(false), width_(width), height_(height) {
        initialized_ = setup_device();
    }

    LinuxUInputTouchDevice::~LinuxUInputTouchDevice() {
        if (uinput_fd_ >= 0) {
            // Destroy the virtual device
            ioctl(uinput_fd_, UI_DEV_DESTROY);
            close(uinput_fd_);
            uinput_fd_ = -1;
        }
    }

    bool LinuxUInputTouchDevice::setup_device() {
        uinput_fd_ = open("/dev/uinput", O_WRONLY | O_NONBLOCK);
        if (uinput_fd_ < 0) {
            error_message_ = "Cannot open /dev/uinput. Run as root or add user to 'input' group.";
            return false;
        }

        auto fail = [this](const std::string& message) {
            error_message_ = message + ": " + std::strerror(errno);
            close(uinput_fd_);
            uinput_fd_ = -1;
            return false;
        };

        if (ioctl(uinput_fd_, UI_SET_EVBIT, EV_KEY) < 0) return fail("ioctl UI_SET_EVBIT EV_KEY failed");
        if (ioctl(uinput_fd_, UI_SET_EVBIT, EV_ABS) < 0) return fail("ioctl UI_SET_EVBIT EV_ABS failed");
        if (ioctl(uinput_fd_, UI_SET_EVBIT, EV_SYN) < 0) return fail("ioctl UI_SET_EVBIT EV_SYN failed");

        // Direct input device: Weston/libinput treat it as a touchscreen
        if (ioctl(uinput_fd_, UI_SET_PROPBIT, INPUT_PROP_DIRECT) < 0) return fail("ioctl UI_SET_PROPBIT failed");

        ioctl(uinput_fd_, UI_SET_KEYBIT, BTN_TOUCH);
        for (int key : kKeyboardKeys) {
            ioctl(uinput_fd_, UI_SET_KEYBIT, key);
        }

        const AxisRange axes[] = {
            {ABS_X,              0,  width_ - 1},
            {ABS_Y,              0,  height_ - 1},
            {ABS_MT_SLOT,        0,  core::kMaxTouchSlots - 1},
            {ABS_MT_TRACKING_ID, -1, core::kMaxTouchSlots - 1},
            {ABS_MT_POSITION_X,  0,  width_ - 1},
            {ABS_MT_POSITION_Y,  0,  height_ - 1},
        };
        for (const auto& axis : axes) {
            if (ioctl(uinput_fd_, UI_SET_ABSBIT, axis.code) < 0) return fail("ioctl UI_SET_ABSBIT failed");
        }

        // Configure the virtual device
        struct uinput_setup usetup;
        memset(&usetup, 0, sizeof(usetup));
        usetup.id.bustype = BUS_USB;
        usetup.id.vendor = 0x1234;  // Fake vendor ID
        usetup.id.product = 0x5678; // Fake product ID
        strncpy(usetup.name, kDeviceName, UINPUT_MAX_NAME_SIZE - 1);

        if (ioctl(uinput_fd_, UI_DEV_SETUP, &usetup) < 0) {
            // Fallback for older kernels without UI_DEV_SETUP
            struct uinput_user_dev uud;
            memset(&uud, 0, sizeof(uud));
            strncpy(uud.name, kDeviceName, UINPUT_MAX_NAME_SIZE - 1);
            uud.id.bustype = BUS_USB;
            uud.id.vendor = 0x1234;
            uud.id.product = 0x5678;
            uud.id.version = 1;

            for (const auto& axis : axes) {
                uud.absmin[axis.code] = axis.minimum;
                uud.absmax[axis.code] = axis.maximum;
            }

            if (write(uinput_fd_, &uud, sizeof(uud)) < 0) return fail("Failed to write uinput_user_dev");
        } else {
            for (const auto& axis : axes) {
                struct uinput_abs_setup abs_setup;
                memset(&abs_setup, 0, sizeof(abs_setup));
                abs_setup.code = static_cast<__u16>(axis.code);
                abs_setup.absinfo.minimum = axis.minimum;
                abs_setup.absinfo.maximum = axis.maximum;
                if (ioctl(uinput_fd_, UI_ABS_SETUP, &abs_setup) < 0) return fail("ioctl UI_ABS_SETUP failed");
            }
        }

        if (ioctl(uinput_fd_, UI_DEV_CREATE) < 0) return fail("ioctl UI_DEV_CREATE failed");

        // Give the system a moment to register the new device
        usleep(100000); // 100ms

        return true;
    }

    common::EmptyResult LinuxUInputTouchDevice::emit(uint16_t type, uint16_t code, int32_t value) {
        if (!initialized_) {
            return common::EmptyResult::err(common::ErrorCode::DeviceNotFound, "Touch device not initialized");
        }

        struct input_event ev;
        memset(&ev, 0, sizeof(ev));
        ev.type = type;
        ev.code = code;
        ev.value = value;

        ssize_t written;
        do {
            written = write(uinput_fd_, &ev, sizeof(ev));
        } while (written < 0 && errno == EINTR);

        if (written != static_cast<ssize_t>(sizeof(ev))) {
            return common::EmptyResult::err(common::ErrorCode::DeviceNotFound,
                "uinput write failed: " + std::string(std::strerror(errno)));
        }
        return common::EmptyResult::success();
    }

    common::EmptyResult LinuxUInputTouchDevice::sync() {
        return emit(EV_SYN, SYN_REPORT, 0);
    }

} // namespace linux_os
} // namespace platform
