/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * InputABI.hpp, kernel input_event and uinput layouts.                              *
 *                                                                                   *
 * Copyright (C) 2026 The evclick authors                                            *
 * All rights reserved.                                                              *
 *                                                                                   *
 * Redistribution and use in source and binary forms, with or without                *
 * modification, are permitted provided that the following conditions are met:       *
 *                                                                                   *
 * 1. Redistributions of source code must retain the above copyright notice, this    *
 *    list of conditions and the following disclaimer.                               *
 * 2. Redistributions in binary form must reproduce the above copyright notice,      *
 *    this list of conditions and the following disclaimer in the documentation      *
 *    and/or other materials provided with the distribution.                         *
 *                                                                                   *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND   *
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED     *
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE            *
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE      *
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL        *
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR        *
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER        *
 * CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,     *
 * OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE     *
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.              *
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */

/** @file InputABI.hpp
 *
 * @brief Byte layouts and constants of the evdev and uinput kernel ABI.
 *
 * Nothing in here relies on the compiler laying out a struct the way the
 * kernel does, frames are (de)serialized at fixed byte offsets. Only the
 * 64-bit timeval layout (16 byte timestamp prefix) is supported.
 *
 * The constants are prefixed so that they can coexist with the macros from
 * <linux/input.h> and <linux/uinput.h>.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

/** Linux key/button code, see linux/input-event-codes.h */
using KeyCode = uint16_t;

enum IoctlRequest : unsigned long {
    IOCTL_EVIOCGRAB      = 0x40044590,
    IOCTL_UI_SET_EVBIT   = 0x40045564,
    IOCTL_UI_SET_KEYBIT  = 0x40045565,
    IOCTL_UI_DEV_CREATE  = 0x5501,
    IOCTL_UI_DEV_DESTROY = 0x5502,
};

constexpr uint16_t EVTYPE_SYN = 0x00;
constexpr uint16_t EVTYPE_KEY = 0x01;
constexpr uint16_t SYNC_REPORT = 0x00;

constexpr KeyCode BUTTON_LEFT = 272;
constexpr KeyCode BUTTON_RIGHT = 273;
constexpr KeyCode BUTTON_MIDDLE = 274;

/**
 * The meaning of the `value` field in the input_event struct.
 */
enum KeyValue : int32_t {
    KEY_VAL_UP = 0,
    KEY_VAL_DOWN = 1,
    KEY_VAL_REPEAT = 2,
};

constexpr int OPEN_RDONLY = 0;
constexpr int OPEN_WRONLY = 1;
constexpr int OPEN_NONBLOCK = 2048;

constexpr uint16_t BUS_TYPE_USB = 0x03;

constexpr size_t INPUT_EVENT_SIZE = 24;
constexpr size_t TIMEVAL_OFFSET = 16;
constexpr size_t UINPUT_NAME_SIZE = 80;
constexpr size_t UINPUT_USER_DEV_SIZE = 1116;

/** Raised when a frame does not have the size of an input_event. */
class MalformedEventError : public std::runtime_error {
public:
    explicit MalformedEventError(const std::string& msg) : std::runtime_error(msg) {}
};

/** One kernel input frame. */
struct InputEvent {
    int64_t time_sec = 0;
    int64_t time_usec = 0;
    uint16_t type = 0;
    uint16_t code = 0;
    int32_t value = 0;

    inline bool operator==(const InputEvent& other) const noexcept {
        return time_sec == other.time_sec && time_usec == other.time_usec &&
               type == other.type && code == other.code && value == other.value;
    }
};

/**
 * Decode a frame read from an event device.
 *
 * @throws MalformedEventError if len != INPUT_EVENT_SIZE.
 */
InputEvent parseInputEvent(const uint8_t *buf, size_t len);

std::array<uint8_t, INPUT_EVENT_SIZE> encodeInputEvent(const InputEvent& ev);

/** Event with a zero timestamp, the kernel fills it in on uinput writes. */
inline InputEvent makeInputEvent(uint16_t type, uint16_t code, int32_t value) {
    InputEvent ev;
    ev.type = type;
    ev.code = code;
    ev.value = value;
    return ev;
}

/**
 * The legacy uinput_user_dev structure, written to /dev/uinput before
 * UI_DEV_CREATE.
 */
struct VirtualDeviceDescriptor {
    std::array<char, UINPUT_NAME_SIZE> name {};
    uint16_t bus_type = BUS_TYPE_USB;
    uint16_t vendor = 0x1234;
    uint16_t product = 0x5678;
    uint16_t version = 1;
    uint32_t ff_effects_max = 0;

    /**
     * Create a descriptor, names longer than UINPUT_NAME_SIZE-1 bytes are
     * truncated so that the name is always NUL-terminated.
     */
    static VirtualDeviceDescriptor create(const std::string& name);

    /** Serialize to UINPUT_USER_DEV_SIZE bytes, the abs arrays are zero. */
    std::vector<uint8_t> encode() const;

    std::string getName() const;
};

enum class MouseButton : KeyCode {
    Unknown = 0,
    Left = BUTTON_LEFT,
    Right = BUTTON_RIGHT,
    Middle = BUTTON_MIDDLE,
};

/** Map a raw code to a mouse button, MouseButton::Unknown if it is not one. */
MouseButton buttonFromCode(KeyCode code) noexcept;

const char *mouseButtonName(MouseButton button) noexcept;
