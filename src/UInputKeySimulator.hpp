/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * UInputKeySimulator.hpp, key synthesis through /dev/uinput.                        *
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

/** @file UInputKeySimulator.hpp
 *
 * @brief Synthesize key presses through a transient uinput keyboard.
 */

#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include "KeySimulator.hpp"
#include "SysCalls.hpp"

/** Delays used around a synthesis sequence. */
struct KeySimulatorTimings {
    /** Time for the kernel to expose the new device before events are sent. */
    std::chrono::milliseconds device_setup {100};
    /** How long the main key is held down. */
    std::chrono::milliseconds key_press {50};
    /** Gap after each modifier transition. */
    std::chrono::milliseconds modifier {20};
    /** Time for consumers to drain events before the device is destroyed. */
    std::chrono::milliseconds device_cleanup {100};

    /** All delays zero, for tests. */
    static KeySimulatorTimings none() {
        return {std::chrono::milliseconds(0), std::chrono::milliseconds(0),
                std::chrono::milliseconds(0), std::chrono::milliseconds(0)};
    }
};

/**
 * Creates a virtual keyboard for each call, emits the sequence and destroys
 * the device again.
 *
 * Calls are serialized, two concurrent sequences would otherwise race on
 * creating and destroying devices with the same name.
 */
class UInputKeySimulator : public IKeySimulator {
private:
    ISysCalls& sys;
    KeySimulatorTimings timings;
    std::string uinput_path;
    std::string device_name;
    std::mutex mtx;

    void emit(int fd, uint16_t type, uint16_t code, int32_t value);
    void sync(int fd);
    void sleep(std::chrono::milliseconds delay);
    void setupDevice(int fd, const std::vector<KeyCode>& keys);

public:
    static constexpr const char *UINPUT_PATH = "/dev/uinput";
    static constexpr const char *DEVICE_NAME = "evclick-kbd";

    explicit UInputKeySimulator(ISysCalls& sys,
                                KeySimulatorTimings timings = KeySimulatorTimings(),
                                std::string uinput_path = UINPUT_PATH,
                                std::string device_name = DEVICE_NAME);

    virtual void simulateKeyPress(KeyCode key) override;

    virtual void simulateKeyCombo(KeyCode modifier, KeyCode key) override;

    virtual void simulateKeyCombo(KeyCode modifier1, KeyCode modifier2, KeyCode key) override;

    virtual void simulateKeys(const std::vector<KeyCode>& modifiers, KeyCode key) override;

    inline const KeySimulatorTimings& getTimings() const noexcept {
        return timings;
    }
};
