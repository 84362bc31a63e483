/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * DeviceDiscovery.hpp, find event devices by name.                                  *
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

/** @file DeviceDiscovery.hpp
 *
 * @brief Resolve device name patterns to /dev/input/eventN paths.
 */

#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

/** One entry of /proc/bus/input/devices. */
struct InputDeviceInfo {
    /** Human-readable name of the device. */
    std::string name;
    /** Physical location of device. */
    std::string phys;
    /** Handlers, e.g {"sysrq", "kbd", "event3"} */
    std::vector<std::string> handlers;
    /** /dev/input/eventN, empty if the device has no event handler. */
    std::string event_path;

    /** Whether the device also has a mouseN handler. */
    bool isPointer() const;
};

class IDeviceDiscovery {
public:
    virtual ~IDeviceDiscovery() {}

    /**
     * Find the event device of the first device whose name contains
     * `pattern`.
     *
     * Not finding a device is not an error, it just means that the device
     * is not connected yet.
     */
    virtual std::optional<std::string> find(const std::string& pattern) = 0;
};

/**
 * Discovery through the kernel's textual device registry.
 */
class ProcInputDiscovery : public IDeviceDiscovery {
private:
    std::vector<std::string> excluded;
    std::string registry_path;

public:
    static constexpr const char *DEFAULT_REGISTRY = "/proc/bus/input/devices";

    /**
     * @param excluded Devices whose name contains any of these substrings
     *                 are never matched.
     * @param registry_path Path of the device registry.
     */
    explicit ProcInputDiscovery(std::vector<std::string> excluded = {},
                                std::string registry_path = DEFAULT_REGISTRY);

    /**
     * When several devices match, the one with a mouseN handler is
     * preferred, Bluetooth mice often expose a second keyboard-like
     * device under the same name.
     */
    virtual std::optional<std::string> find(const std::string& pattern) override;

    /** All devices in the registry, empty if it can't be read. */
    std::vector<InputDeviceInfo> list() const;

    static std::vector<InputDeviceInfo> parse(std::istream& in);
};
