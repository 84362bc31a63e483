/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * InputABI.cpp, kernel input_event and uinput layouts.                              *
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

#include <cstring>
#include <type_traits>

extern "C" {
    #include <fcntl.h>
    #include <linux/input.h>
    #include <linux/uinput.h>
}

#include "InputABI.hpp"

using namespace std;

static_assert(IOCTL_EVIOCGRAB == EVIOCGRAB, "EVIOCGRAB mismatch");
static_assert(IOCTL_UI_SET_EVBIT == UI_SET_EVBIT, "UI_SET_EVBIT mismatch");
static_assert(IOCTL_UI_SET_KEYBIT == UI_SET_KEYBIT, "UI_SET_KEYBIT mismatch");
static_assert(IOCTL_UI_DEV_CREATE == UI_DEV_CREATE, "UI_DEV_CREATE mismatch");
static_assert(IOCTL_UI_DEV_DESTROY == UI_DEV_DESTROY, "UI_DEV_DESTROY mismatch");
static_assert(EVTYPE_SYN == EV_SYN && EVTYPE_KEY == EV_KEY, "event type mismatch");
static_assert(SYNC_REPORT == SYN_REPORT, "SYN_REPORT mismatch");
static_assert(BUTTON_LEFT == BTN_LEFT && BUTTON_RIGHT == BTN_RIGHT &&
              BUTTON_MIDDLE == BTN_MIDDLE, "button code mismatch");
static_assert(BUS_TYPE_USB == BUS_USB, "BUS_USB mismatch");
static_assert(UINPUT_NAME_SIZE == UINPUT_MAX_NAME_SIZE, "uinput name size mismatch");
static_assert(OPEN_RDONLY == O_RDONLY && OPEN_WRONLY == O_WRONLY, "open flag mismatch");

#if defined(__x86_64__) || defined(__aarch64__)
static_assert(OPEN_NONBLOCK == O_NONBLOCK, "O_NONBLOCK mismatch");
static_assert(sizeof(struct input_event) == INPUT_EVENT_SIZE,
              "input_event is not 24 bytes on this ABI");
static_assert(offsetof(struct input_event, type) == TIMEVAL_OFFSET,
              "unexpected timeval size");
static_assert(sizeof(struct uinput_user_dev) == UINPUT_USER_DEV_SIZE,
              "uinput_user_dev is not 1116 bytes on this ABI");
#endif

namespace {
    // Offsets into uinput_user_dev
    constexpr size_t BUS_OFFSET = UINPUT_NAME_SIZE;
    constexpr size_t VENDOR_OFFSET = BUS_OFFSET + 2;
    constexpr size_t PRODUCT_OFFSET = BUS_OFFSET + 4;
    constexpr size_t VERSION_OFFSET = BUS_OFFSET + 6;
    constexpr size_t FF_EFFECTS_OFFSET = BUS_OFFSET + 8;

    template <class T>
    inline T readLE(const uint8_t *p) {
        using U = typename std::make_unsigned<T>::type;
        U v = 0;
        for (size_t i = 0; i < sizeof(T); i++)
            v |= static_cast<U>(static_cast<U>(p[i]) << (8 * i));
        return static_cast<T>(v);
    }

    template <class T>
    inline void writeLE(uint8_t *p, T val) {
        using U = typename std::make_unsigned<T>::type;
        U v = static_cast<U>(val);
        for (size_t i = 0; i < sizeof(T); i++)
            p[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xff);
    }
}

InputEvent parseInputEvent(const uint8_t *buf, size_t len) {
    if (buf == nullptr || len != INPUT_EVENT_SIZE)
        throw MalformedEventError("Malformed input event, expected " +
                                  to_string(INPUT_EVENT_SIZE) + " bytes, got " +
                                  to_string(len));
    InputEvent ev;
    ev.time_sec = readLE<int64_t>(buf);
    ev.time_usec = readLE<int64_t>(buf + 8);
    ev.type = readLE<uint16_t>(buf + TIMEVAL_OFFSET);
    ev.code = readLE<uint16_t>(buf + TIMEVAL_OFFSET + 2);
    ev.value = readLE<int32_t>(buf + TIMEVAL_OFFSET + 4);
    return ev;
}

array<uint8_t, INPUT_EVENT_SIZE> encodeInputEvent(const InputEvent& ev) {
    array<uint8_t, INPUT_EVENT_SIZE> buf {};
    writeLE<int64_t>(buf.data(), ev.time_sec);
    writeLE<int64_t>(buf.data() + 8, ev.time_usec);
    writeLE<uint16_t>(buf.data() + TIMEVAL_OFFSET, ev.type);
    writeLE<uint16_t>(buf.data() + TIMEVAL_OFFSET + 2, ev.code);
    writeLE<int32_t>(buf.data() + TIMEVAL_OFFSET + 4, ev.value);
    return buf;
}

VirtualDeviceDescriptor VirtualDeviceDescriptor::create(const string& name) {
    VirtualDeviceDescriptor desc;
    size_t len = min(name.size(), UINPUT_NAME_SIZE - 1);
    memcpy(desc.name.data(), name.data(), len);
    desc.name[len] = '\0';
    return desc;
}

vector<uint8_t> VirtualDeviceDescriptor::encode() const {
    vector<uint8_t> buf(UINPUT_USER_DEV_SIZE, 0);
    memcpy(buf.data(), name.data(), UINPUT_NAME_SIZE);
    // Never let a hand-filled name run into the id fields.
    buf[UINPUT_NAME_SIZE - 1] = 0;
    writeLE<uint16_t>(&buf[BUS_OFFSET], bus_type);
    writeLE<uint16_t>(&buf[VENDOR_OFFSET], vendor);
    writeLE<uint16_t>(&buf[PRODUCT_OFFSET], product);
    writeLE<uint16_t>(&buf[VERSION_OFFSET], version);
    writeLE<uint32_t>(&buf[FF_EFFECTS_OFFSET], ff_effects_max);
    return buf;
}

string VirtualDeviceDescriptor::getName() const {
    size_t len = 0;
    while (len < UINPUT_NAME_SIZE && name[len] != '\0')
        len++;
    return string(name.data(), len);
}

MouseButton buttonFromCode(KeyCode code) noexcept {
    switch (code) {
        case BUTTON_LEFT: return MouseButton::Left;
        case BUTTON_RIGHT: return MouseButton::Right;
        case BUTTON_MIDDLE: return MouseButton::Middle;
        default: return MouseButton::Unknown;
    }
}

const char *mouseButtonName(MouseButton button) noexcept {
    switch (button) {
        case MouseButton::Left: return "left";
        case MouseButton::Right: return "right";
        case MouseButton::Middle: return "middle";
        default: return "unknown";
    }
}
