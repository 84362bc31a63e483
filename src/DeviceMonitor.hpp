/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * DeviceMonitor.hpp, grab and read a mouse event device.                            *
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

/** @file DeviceMonitor.hpp
 *
 * @brief Exclusive monitoring of one pointing device, with reconnect.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "ButtonClickHandler.hpp"
#include "DeviceDiscovery.hpp"
#include "InputABI.hpp"
#include "Signal.hpp"
#include "SysCalls.hpp"

/** A press or release of a known mouse button. */
struct ButtonEvent {
    MouseButton button;
    KeyCode raw_code;
    bool pressed;
    std::chrono::system_clock::time_point timestamp;
};

enum class MonitorState {
    Disconnected,
    Connecting,
    Grabbing,
    Monitoring,
};

const char *monitorStateName(MonitorState state) noexcept;

struct MonitorOptions {
    /** Label used in log messages, e.g "Bluetooth mouse" */
    std::string name;
    /** Substring of the device name. */
    std::string pattern;
    std::chrono::milliseconds reconnect_interval {2000};
    /** "not found" is logged on the first attempt and every Nth after. */
    int log_interval_attempts = 30;
    /** Upper bound on how long a stop request may go unnoticed. */
    std::chrono::milliseconds poll_timeout {100};
};

/**
 * Owns one event device.
 *
 * The monitor thread is the only one touching the file descriptor and the
 * grab state. While the device is missing, discovery is retried every
 * reconnect interval. Once found, the device is opened and grabbed so that
 * its events do not reach the desktop. Button presses are routed to the bound
 * ButtonClickHandler.
 */
class DeviceMonitor {
private:
    MonitorOptions opts;
    ISysCalls& sys;
    IDeviceDiscovery& discovery;
    std::map<MouseButton, std::unique_ptr<ButtonClickHandler>> handlers;

    std::thread thread;
    std::mutex mtx;
    std::condition_variable cv;
    bool stop_requested = false;
    bool started = false;
    /** Held while joining, guards `finished`. */
    std::mutex stop_mtx;
    bool finished = false;

    std::atomic<MonitorState> state {MonitorState::Disconnected};
    std::atomic<bool> grabbed {false};
    std::atomic<bool> monitoring {false};
    int fd = -1;
    std::string device_path;

    Signal<const ButtonEvent&> button_pressed;
    Signal<const ButtonEvent&> button_released;
    Signal<const std::string&> connected;
    Signal<const std::string&> disconnected;

    void run();
    bool stopRequested();
    /** Sleep for the reconnect interval, returns early on stop(). */
    void waitInterval();
    bool connect(const std::string& path);
    void monitorEvents();
    void closeDevice();
    void setState(MonitorState new_state);

public:
    DeviceMonitor(MonitorOptions opts, ISysCalls& sys, IDeviceDiscovery& discovery);

    ~DeviceMonitor();

    DeviceMonitor(const DeviceMonitor&) = delete;
    DeviceMonitor& operator=(const DeviceMonitor&) = delete;

    /**
     * Route presses of `button` to `handler`, must be called before start().
     */
    void bind(MouseButton button, std::unique_ptr<ButtonClickHandler> handler);

    /**
     * Start the monitor thread, a warning is logged if it is already running.
     *
     * @throws DisposedError if the monitor has been stopped.
     */
    void start();

    /**
     * Stop the monitor thread, ungrab and close the device, and dispose the
     * button handlers.
     *
     * When called from an observer running on the monitor thread, only the
     * stop is requested: the thread ungrabs and closes the device as it exits,
     * and joining and disposal happen on the next stop() from another thread
     * (at the latest in the destructor).
     */
    void stop();

    /** Decode and route one frame, called by the monitor thread. */
    void handleEvent(const InputEvent& ev);

    Subscription onButtonPressed(std::function<void(const ButtonEvent&)> fn);
    Subscription onButtonReleased(std::function<void(const ButtonEvent&)> fn);
    Subscription onConnected(std::function<void(const std::string&)> fn);
    Subscription onDisconnected(std::function<void(const std::string&)> fn);

    ButtonClickHandler *getHandler(MouseButton button);

    inline bool isMonitoring() const noexcept {
        return monitoring;
    }

    inline bool isGrabbed() const noexcept {
        return grabbed;
    }

    inline MonitorState getState() const noexcept {
        return state;
    }

    inline const MonitorOptions& getOptions() const noexcept {
        return opts;
    }
};
