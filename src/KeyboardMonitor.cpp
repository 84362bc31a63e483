/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * KeyboardMonitor.cpp, keyboard LED state and key notifications.                    *
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

#include <array>

extern "C" {
    #include <linux/input.h>
}

#include "KeyboardMonitor.hpp"
#include "SystemError.hpp"
#include "Logging.hpp"

using namespace std;

EvdevKeyboardMonitor::EvdevKeyboardMonitor(ISysCalls& sys, string device_path)
    : sys(sys),
      device_path(std::move(device_path))
{}

bool EvdevKeyboardMonitor::isCapsLockOn() {
    if (device_path.empty())
        return false;

    int fd = sys.open(device_path, OPEN_RDONLY | OPEN_NONBLOCK);
    if (fd < 0) {
        Log::warn("Unable to open keyboard {}: {}", device_path,
                  SystemError::getErrorString(sys.lastError()));
        return false;
    }

    array<uint8_t, LED_MAX / 8 + 1> leds {};
    bool on = false;
    if (sys.ioctl(fd, EVIOCGLED(leds.size()), static_cast<void *>(leds.data())) < 0)
        Log::warn("Unable to get LED state of {}: {}", device_path,
                  SystemError::getErrorString(sys.lastError()));
    else
        on = (leds[LED_CAPSL / 8] >> (LED_CAPSL % 8)) & 1;

    if (sys.close(fd) < 0)
        Log::warn("Unable to close {}: {}", device_path,
                  SystemError::getErrorString(sys.lastError()));
    return on;
}

void EvdevKeyboardMonitor::raiseKeyReleasedEvent(KeyCode key) {
    Log::debug("Key released: {}", key);
    key_released.emit(key);
}

Subscription EvdevKeyboardMonitor::onKeyReleased(function<void(KeyCode)> fn) {
    return key_released.connect(std::move(fn));
}
