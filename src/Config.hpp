/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Config.hpp, Lua configuration of evclickd.                                        *
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

/** @file Config.hpp
 *
 * @brief Daemon configuration, read from a Lua file.
 */

#pragma once

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "ButtonAction.hpp"
#include "ClickDetector.hpp"
#include "InputABI.hpp"

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct ButtonConfig {
    int max_clicks = MAX_SUPPORTED_CLICKS;
    ButtonAction single = ButtonAction::none();
    ButtonAction double_click = ButtonAction::none();
    ButtonAction triple = ButtonAction::none();
};

struct DeviceConfig {
    /** Label used in logs and notifications. */
    std::string name;
    /** Substring of the device name, see ProcInputDiscovery */
    std::string pattern;
    /** Devices whose name contains one of these are never grabbed. */
    std::vector<std::string> exclude;
    std::map<MouseButton, ButtonConfig> buttons;
};

struct Config {
    std::chrono::milliseconds click_threshold = DEFAULT_CLICK_THRESHOLD;
    std::chrono::milliseconds click_debounce = DEFAULT_CLICK_DEBOUNCE;
    std::chrono::milliseconds key_simulation_delay = KEY_SIMULATION_DELAY;
    std::chrono::milliseconds reconnect_interval {2000};
    int log_interval_attempts = 30;
    /** Desktop notifications when a device (dis)connects. */
    bool notify = false;
    /** Keyboard event device used for the CapsLock LED state, may be empty. */
    std::string keyboard_device;
    /** Run after a key released notification, "%k" is replaced by the key name. */
    std::string key_released_command;
    std::vector<DeviceConfig> devices;

    /** Built-in profile, used when there is no config file. */
    static Config defaults();

    /**
     * Load a config file.
     *
     * Options that are not set keep their default value, and the built-in
     * device profile is used when `devices` is not set.
     *
     * @throws ConfigError if the file can't be loaded or is invalid.
     */
    static Config fromFile(const std::string& path);

    /** Same as fromFile(), with the Lua source given directly. */
    static Config fromString(const std::string& src);

    /** $XDG_CONFIG_HOME/evclick/config.lua, falling back to ~/.config */
    static std::string defaultPath();
};
