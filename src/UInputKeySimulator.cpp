/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * UInputKeySimulator.cpp, key synthesis through /dev/uinput.                        *
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

#include <algorithm>
#include <thread>

#include "UInputKeySimulator.hpp"
#include "SystemError.hpp"
#include "Logging.hpp"

using namespace std;

namespace {
    /**
     * Destroys the virtual device and closes the uinput descriptor when a
     * synthesis sequence ends, also when it ends with an exception.
     */
    class DeviceGuard {
        ISysCalls& sys;
        int fd;

    public:
        bool created = false;

        DeviceGuard(ISysCalls& sys, int fd) : sys(sys), fd(fd) {}

        ~DeviceGuard() {
            if (created && sys.ioctl(fd, IOCTL_UI_DEV_DESTROY, 0) < 0)
                Log::warn("Unable to destroy virtual keyboard: {}",
                          SystemError::getErrorString(sys.lastError()));
            if (sys.close(fd) < 0)
                Log::warn("Unable to close uinput: {}",
                          SystemError::getErrorString(sys.lastError()));
        }

        DeviceGuard(const DeviceGuard&) = delete;
        DeviceGuard& operator=(const DeviceGuard&) = delete;
    };
}

UInputKeySimulator::UInputKeySimulator(ISysCalls& sys,
                                       KeySimulatorTimings timings,
                                       string uinput_path,
                                       string device_name)
    : sys(sys),
      timings(timings),
      uinput_path(std::move(uinput_path)),
      device_name(std::move(device_name))
{}

void UInputKeySimulator::emit(int fd, uint16_t type, uint16_t code, int32_t value) {
    auto buf = encodeInputEvent(makeInputEvent(type, code, value));
    ssize_t n = sys.write(fd, buf.data(), buf.size());
    if (n < 0)
        throw SystemError("Error in write() to " + uinput_path + ": ", sys.lastError());
    if (static_cast<size_t>(n) != buf.size())
        throw SystemError("Short write() to " + uinput_path + ": wrote " +
                          to_string(n) + " of " + to_string(buf.size()) + " bytes");
}

void UInputKeySimulator::sync(int fd) {
    emit(fd, EVTYPE_SYN, SYNC_REPORT, 0);
}

void UInputKeySimulator::sleep(chrono::milliseconds delay) {
    if (delay.count() > 0)
        this_thread::sleep_for(delay);
}

void UInputKeySimulator::setupDevice(int fd, const vector<KeyCode>& keys) {
    if (sys.ioctl(fd, IOCTL_UI_SET_EVBIT, EVTYPE_KEY) < 0)
        Log::warn("Unable to set EV_KEY bit on virtual keyboard: {}",
                  SystemError::getErrorString(sys.lastError()));

    vector<KeyCode> enabled;
    for (KeyCode key : keys) {
        if (find(enabled.begin(), enabled.end(), key) != enabled.end())
            continue;
        enabled.push_back(key);
        if (sys.ioctl(fd, IOCTL_UI_SET_KEYBIT, key) < 0)
            Log::warn("Unable to set key bit {} on virtual keyboard: {}", key,
                      SystemError::getErrorString(sys.lastError()));
    }

    auto desc = VirtualDeviceDescriptor::create(device_name).encode();
    ssize_t n = sys.write(fd, desc.data(), desc.size());
    if (n < 0)
        throw SystemError("Unable to write device descriptor to " + uinput_path + ": ",
                          sys.lastError());
    if (static_cast<size_t>(n) != desc.size())
        throw SystemError("Short write of device descriptor: wrote " + to_string(n) +
                          " of " + to_string(desc.size()) + " bytes");
}

void UInputKeySimulator::simulateKeyPress(KeyCode key) {
    simulateKeys({}, key);
}

void UInputKeySimulator::simulateKeyCombo(KeyCode modifier, KeyCode key) {
    simulateKeys({modifier}, key);
}

void UInputKeySimulator::simulateKeyCombo(KeyCode modifier1, KeyCode modifier2, KeyCode key) {
    simulateKeys({modifier1, modifier2}, key);
}

void UInputKeySimulator::simulateKeys(const vector<KeyCode>& modifiers, KeyCode key) {
    lock_guard<mutex> lock(mtx);

    int fd = sys.open(uinput_path, OPEN_WRONLY | OPEN_NONBLOCK);
    if (fd < 0)
        throw SystemError("Unable to open " + uinput_path + ": ", sys.lastError());

    DeviceGuard guard(sys, fd);

    vector<KeyCode> keys(modifiers);
    keys.push_back(key);
    setupDevice(fd, keys);

    if (sys.ioctl(fd, IOCTL_UI_DEV_CREATE, 0) < 0)
        Log::warn("Unable to create virtual keyboard: {}",
                  SystemError::getErrorString(sys.lastError()));
    else
        guard.created = true;

    sleep(timings.device_setup);

    for (KeyCode mod : modifiers) {
        emit(fd, EVTYPE_KEY, mod, KEY_VAL_DOWN);
        sync(fd);
        sleep(timings.modifier);
    }

    emit(fd, EVTYPE_KEY, key, KEY_VAL_DOWN);
    sync(fd);
    sleep(timings.key_press);
    emit(fd, EVTYPE_KEY, key, KEY_VAL_UP);
    sync(fd);

    if (!modifiers.empty()) {
        sleep(timings.modifier);
        for (auto it = modifiers.rbegin(); it != modifiers.rend(); it++) {
            emit(fd, EVTYPE_KEY, *it, KEY_VAL_UP);
            sync(fd);
            sleep(timings.modifier);
        }
    }

    Log::debug("Synthesized key {} with {} modifier(s)", key, modifiers.size());

    sleep(timings.device_cleanup);
}
