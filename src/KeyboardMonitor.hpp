/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * KeyboardMonitor.hpp, keyboard LED state and key notifications.                    *
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

/** @file KeyboardMonitor.hpp
 *
 * @brief Keyboard state and key release notifications.
 */

#pragma once

#include <functional>
#include <string>

#include "InputABI.hpp"
#include "Signal.hpp"
#include "SysCalls.hpp"

class IKeyboardMonitor {
public:
    virtual ~IKeyboardMonitor() {}

    /** Whether the CapsLock LED is lit. */
    virtual bool isCapsLockOn() = 0;

    /**
     * Tell listeners that a key was released, used after synthesizing a
     * key so that it is treated like one typed on a real keyboard.
     */
    virtual void raiseKeyReleasedEvent(KeyCode key) = 0;
};

/**
 * Reads the LED state from an evdev keyboard and publishes released keys.
 */
class EvdevKeyboardMonitor : public IKeyboardMonitor {
private:
    ISysCalls& sys;
    std::string device_path;
    Signal<KeyCode> key_released;

public:
    /**
     * @param device_path Event device of a keyboard, the CapsLock state is
     *                    always reported as off when empty.
     */
    explicit EvdevKeyboardMonitor(ISysCalls& sys, std::string device_path = "");

    virtual bool isCapsLockOn() override;

    virtual void raiseKeyReleasedEvent(KeyCode key) override;

    Subscription onKeyReleased(std::function<void(KeyCode)> fn);

    inline const std::string& getDevicePath() const noexcept {
        return device_path;
    }
};
